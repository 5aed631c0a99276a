#include "network/transport.hpp"

#include "Logging.hpp"

#include <format>
#include <optional>
#include <utility>

namespace relay::network {

Transport::Transport(std::uint16_t port) : m_stream(port), m_message(static_cast<std::uint16_t>(port + 1)) {
	TcpServer::Callbacks streamCallbacks;
	streamCallbacks.onConnect = [this](ConnectionId id, const std::string& address) { onConnect(id, TransportKind::Stream, address); };
	streamCallbacks.onMessage = [this](ConnectionId id, const Message& msg) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(id, msg);
		}
	};
	streamCallbacks.onDisconnect = [this](ConnectionId id) { onDisconnect(id); };
	m_stream.connect(std::move(streamCallbacks));

	WsServer::Callbacks messageCallbacks;
	messageCallbacks.onConnect = [this](ConnectionId id, const std::string& address) { onConnect(id, TransportKind::Message, address); };
	messageCallbacks.onMessage = [this](ConnectionId id, const Message& msg) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(id, msg);
		}
	};
	messageCallbacks.onDisconnect = [this](ConnectionId id) { onDisconnect(id); };
	m_message.connect(std::move(messageCallbacks));
}

Transport::~Transport() {
	stop();
}

void Transport::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

bool Transport::start() {
	const bool streamUp  = m_stream.start();
	const bool messageUp = m_message.start();
	return streamUp && messageUp;
}

void Transport::stop() {
	m_message.stop();
	m_stream.stop();
}

bool Transport::send(ConnectionId connectionId, const Message& msg) {
	std::optional<TransportKind> kind;
	{
		std::lock_guard<std::mutex> lock(m_kindsMutex);
		if (const auto it = m_kinds.find(connectionId); it != m_kinds.end()) {
			kind = it->second;
		}
	}

	if (!kind) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Transport] Dropping send to unknown connection '{}'.", connectionId));
		return false;
	}
	return *kind == TransportKind::Stream ? m_stream.send(connectionId, msg) : m_message.send(connectionId, msg);
}

void Transport::close(ConnectionId connectionId) {
	std::optional<TransportKind> kind;
	{
		std::lock_guard<std::mutex> lock(m_kindsMutex);
		if (const auto it = m_kinds.find(connectionId); it != m_kinds.end()) {
			kind = it->second;
		}
	}

	if (!kind) {
		return;
	}
	if (*kind == TransportKind::Stream) {
		m_stream.close(connectionId);
	} else {
		m_message.close(connectionId);
	}
}

std::size_t Transport::connectionCount() const {
	std::lock_guard<std::mutex> lock(m_kindsMutex);
	return m_kinds.size();
}

void Transport::onConnect(ConnectionId connectionId, TransportKind kind, const std::string& remoteAddress) {
	{
		std::lock_guard<std::mutex> lock(m_kindsMutex);
		m_kinds[connectionId] = kind;
	}
	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connectionId, kind, remoteAddress);
	}
}

void Transport::onDisconnect(ConnectionId connectionId) {
	{
		std::lock_guard<std::mutex> lock(m_kindsMutex);
		m_kinds.erase(connectionId);
	}
	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(connectionId);
	}
}

} // namespace relay::network
