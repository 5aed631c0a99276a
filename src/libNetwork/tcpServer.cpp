#include "network/tcpServer.hpp"

#include "Logging.hpp"
#include "connection.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace relay::network {

class TcpServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	bool start();
	void connect(Callbacks callbacks);
	void stop();

	bool send(ConnectionId connectionId, const Message& msg);
	void close(ConnectionId connectionId);

	std::uint16_t port() const;

private:
	void doAccept();                                                                //!< Start async accept loop.
	bool createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create and add new connection to map.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	bool m_acceptorReady{false};

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	std::mutex m_connectionsMutex;                                               //!< Handle concurrency.
};


TcpServer::Implementation::Implementation(std::uint16_t port) : m_acceptor(m_ioContext) {
	// Manual open/bind/listen so we stay in error_code land and avoid throws.
	asio::error_code ec;
	m_acceptor.open(asio::ip::tcp::v4(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port), ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}

	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not listen on port {}: {}", port, ec.message()));
		return;
	}
	m_acceptorReady = true;
}

bool TcpServer::Implementation::start() {
	if (!m_acceptorReady) {
		return false;
	}
	if (m_running.exchange(true)) {
		return true;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", port()));
	return true;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	it->second->send(msg);
	return true;
}

void TcpServer::Implementation::close(ConnectionId connectionId) {
	std::shared_ptr<Connection> connection;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		const auto it = m_connections.find(connectionId);
		if (it == m_connections.end()) {
			return;
		}
		connection = it->second;
	}
	// Removal from the map happens in the onDisconnect callback.
	connection->stop();
}

std::uint16_t TcpServer::Implementation::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}

		if (!ec) {
			const auto connectionId = nextConnectionId();
			std::shared_ptr<Connection> connection;
			{
				std::lock_guard<std::mutex> lock(m_connectionsMutex);
				if (createConnection(std::move(socket), connectionId)) {
					connection = m_connections.at(connectionId);
				}
			}
			if (connection) {
				connection->start();
			}
		} else if (ec != asio::error::operation_aborted) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

bool TcpServer::Implementation::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	if (m_connections.contains(connectionId)) {
		return false;
	}

	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
		if (m_callbacks.onConnect) {
			m_callbacks.onConnect(connection.connectionId(), connection.remoteAddress());
		}
	};
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto id = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(id);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(id);
		}
	};

	auto connection           = std::make_shared<Connection>(std::move(socket), connectionId, std::move(callbacks));
	const auto [it, inserted] = m_connections.try_emplace(connectionId, std::move(connection));
	return inserted;
}


TcpServer::TcpServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

TcpServer::~TcpServer() {
	stop();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::stop() {
	m_pimpl->stop();
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

void TcpServer::close(ConnectionId connectionId) {
	m_pimpl->close(connectionId);
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

} // namespace relay::network
