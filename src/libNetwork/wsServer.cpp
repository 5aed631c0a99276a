#include "network/wsServer.hpp"

#include "Logging.hpp"

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace relay::network {

using WsEndpoint = websocketpp::server<websocketpp::config::asio>;
using WsHandle   = websocketpp::connection_hdl;

class WsServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	void connect(Callbacks callbacks);
	bool start();
	void stop();

	bool send(ConnectionId connectionId, const Message& msg);
	void close(ConnectionId connectionId);

private:
	void onOpen(WsHandle hdl);
	void onMessage(WsHandle hdl, WsEndpoint::message_ptr msg);
	void onClosed(WsHandle hdl); //!< Close and fail both end up here.

	std::optional<WsHandle> handleOf(ConnectionId connectionId);

private:
	std::uint16_t m_port;
	WsEndpoint m_endpoint;
	std::thread m_ioThread;
	std::atomic<bool> m_running{false};

	Callbacks m_callbacks;

	std::map<WsHandle, ConnectionId, std::owner_less<WsHandle>> m_handleToId;
	std::unordered_map<ConnectionId, WsHandle> m_idToHandle;
	std::mutex m_connectionsMutex;
};


WsServer::Implementation::Implementation(std::uint16_t port) : m_port(port) {
	m_endpoint.clear_access_channels(websocketpp::log::alevel::all);
	m_endpoint.clear_error_channels(websocketpp::log::elevel::all);

	m_endpoint.set_open_handler([this](WsHandle hdl) { onOpen(hdl); });
	m_endpoint.set_message_handler([this](WsHandle hdl, WsEndpoint::message_ptr msg) { onMessage(hdl, msg); });
	m_endpoint.set_close_handler([this](WsHandle hdl) { onClosed(hdl); });
	m_endpoint.set_fail_handler([this](WsHandle hdl) { onClosed(hdl); });
}

void WsServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

bool WsServer::Implementation::start() {
	if (m_running.exchange(true)) {
		return true;
	}

	websocketpp::lib::error_code ec;
	m_endpoint.init_asio(ec);
	if (!ec) {
		m_endpoint.set_reuse_addr(true);
		m_endpoint.listen(asio::ip::tcp::v4(), m_port, ec);
	}
	if (!ec) {
		m_endpoint.start_accept(ec);
	}
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[WsServer] Could not listen on port {}: {}", m_port, ec.message()));
		m_running = false;
		return false;
	}

	m_ioThread = std::thread([this] {
		try {
			m_endpoint.run();
		} catch (const websocketpp::exception& e) {
			Logger().Log(Logging::LogLevel::Error, std::format("[WsServer] IO loop stopped: {}", e.what()));
		}
	});

	Logger().Log(Logging::LogLevel::Info, std::format("[WsServer] Listening on port {}.", m_port));
	return true;
}

void WsServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	websocketpp::lib::error_code ec;
	m_endpoint.stop_listening(ec);

	std::vector<WsHandle> handles;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		for (const auto& [hdl, id]: m_handleToId) {
			handles.push_back(hdl);
		}
	}
	for (const auto& hdl: handles) {
		m_endpoint.close(hdl, websocketpp::close::status::going_away, "", ec);
	}

	m_endpoint.stop();
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

bool WsServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	const auto hdl = handleOf(connectionId);
	if (!hdl) {
		return false;
	}

	websocketpp::lib::error_code ec;
	m_endpoint.send(*hdl, msg.data(), msg.size(), websocketpp::frame::opcode::binary, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[WsServer] Sending error on '{}': {}", connectionId, ec.message()));
		return false;
	}
	return true;
}

void WsServer::Implementation::close(ConnectionId connectionId) {
	const auto hdl = handleOf(connectionId);
	if (!hdl) {
		return;
	}

	websocketpp::lib::error_code ec;
	m_endpoint.close(*hdl, websocketpp::close::status::normal, "", ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[WsServer] Close failed on '{}': {}", connectionId, ec.message()));
	}
}

void WsServer::Implementation::onOpen(WsHandle hdl) {
	const auto connectionId = nextConnectionId();
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		m_handleToId.emplace(hdl, connectionId);
		m_idToHandle.emplace(connectionId, hdl);
	}

	std::string remoteAddress;
	websocketpp::lib::error_code ec;
	if (auto connection = m_endpoint.get_con_from_hdl(hdl, ec); !ec && connection) {
		remoteAddress = connection->get_remote_endpoint();
	}

	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(connectionId, remoteAddress);
	}
}

void WsServer::Implementation::onMessage(WsHandle hdl, WsEndpoint::message_ptr msg) {
	ConnectionId connectionId = INVALID_CONNECTION;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_handleToId.find(hdl);
		if (it == m_handleToId.end()) {
			return;
		}
		connectionId = it->second;
	}

	if (m_callbacks.onMessage) {
		m_callbacks.onMessage(connectionId, msg->get_payload());
	}
}

void WsServer::Implementation::onClosed(WsHandle hdl) {
	ConnectionId connectionId = INVALID_CONNECTION;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_handleToId.find(hdl);
		if (it == m_handleToId.end()) {
			return; // Handshake failed before open; never announced.
		}
		connectionId = it->second;
		m_idToHandle.erase(connectionId);
		m_handleToId.erase(it);
	}

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(connectionId);
	}
}

std::optional<WsHandle> WsServer::Implementation::handleOf(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	const auto it = m_idToHandle.find(connectionId);
	if (it == m_idToHandle.end()) {
		return std::nullopt;
	}
	return it->second;
}


WsServer::WsServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

WsServer::~WsServer() {
	stop();
}

void WsServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

bool WsServer::start() {
	return m_pimpl->start();
}

void WsServer::stop() {
	m_pimpl->stop();
}

bool WsServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

void WsServer::close(ConnectionId connectionId) {
	m_pimpl->close(connectionId);
}

} // namespace relay::network
