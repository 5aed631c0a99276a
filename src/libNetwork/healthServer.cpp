#include "network/healthServer.hpp"

#include "Logging.hpp"

#include <asio.hpp>
#include <asio/write.hpp>

#include <array>
#include <atomic>
#include <format>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

namespace relay::network {

namespace {
constexpr std::string_view HEALTH_RESPONSE = "HTTP/1.1 200 OK\r\n"
                                             "Content-Type: text/plain\r\n"
                                             "Content-Length: 2\r\n"
                                             "Connection: close\r\n"
                                             "\r\n"
                                             "Ok";
} // namespace

class HealthServer::Implementation {
public:
	explicit Implementation(std::uint16_t port);

	bool start();
	void stop();
	std::uint16_t port() const;

private:
	void doAccept();
	void respond(std::shared_ptr<asio::ip::tcp::socket> socket);

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	bool m_acceptorReady{false};

	std::thread m_ioThread;
	std::atomic<bool> m_running{false};
};

HealthServer::Implementation::Implementation(std::uint16_t port) : m_acceptor(m_ioContext) {
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
		Logger().Log(Logging::LogLevel::Warning, std::format("[HealthServer] Port {} in use: {}", port, ec.message()));
		return;
	}
	m_acceptorReady = true;
}

bool HealthServer::Implementation::start() {
	if (!m_acceptorReady) {
		return false;
	}
	if (m_running.exchange(true)) {
		return true;
	}

	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this] { m_ioContext.run(); });
	return true;
}

void HealthServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();

	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}
}

std::uint16_t HealthServer::Implementation::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

void HealthServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			respond(std::make_shared<asio::ip::tcp::socket>(std::move(socket)));
		}
		doAccept();
	});
}

void HealthServer::Implementation::respond(std::shared_ptr<asio::ip::tcp::socket> socket) {
	// Any request gets the same answer.
	auto request = std::make_shared<std::array<char, 1024>>();
	socket->async_read_some(asio::buffer(*request), [socket, request](asio::error_code ec, std::size_t) {
		if (ec) {
			return;
		}
		asio::async_write(*socket, asio::buffer(HEALTH_RESPONSE), [socket](asio::error_code, std::size_t) {
			asio::error_code closeEc;
			socket->shutdown(asio::socket_base::shutdown_both, closeEc);
			socket->close(closeEc);
		});
	});
}


HealthServer::HealthServer(std::uint16_t port) : m_pimpl(std::make_unique<Implementation>(port)) {
}

HealthServer::~HealthServer() {
	stop();
}

bool HealthServer::start() {
	return m_pimpl->start();
}

void HealthServer::stop() {
	m_pimpl->stop();
}

std::uint16_t HealthServer::port() const {
	return m_pimpl->port();
}

} // namespace relay::network
