#include "network/tcpClient.hpp"

#include "Logging.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/write.hpp>

#include <array>
#include <atomic>
#include <format>
#include <mutex>

namespace relay::network {

class TcpClient::Implementation {
public:
	Implementation();

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> read();

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;
	std::mutex m_writeMutex; //!< send() may be called from several threads.

	std::atomic<bool> m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

bool TcpClient::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (!ec) {
		asio::connect(m_socket, endpoints, ec);
	}
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TcpClient] Could not connect to {}:{}: {}", host, port, ec.message()));
		return false;
	}

	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected || message.size() > MAX_WRITE_BYTES) {
		return false;
	}

	std::lock_guard<std::mutex> lock(m_writeMutex);
	asio::error_code ec;
	asio::write(m_socket, asio::buffer(message), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[TcpClient] Sending error: {}", ec.message()));
		m_isConnected = false;
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::Implementation::read() {
	if (!m_isConnected) {
		return std::nullopt;
	}

	std::array<char, READ_CHUNK_BYTES> buffer{};
	asio::error_code ec;
	const auto bytes = m_socket.read_some(asio::buffer(buffer), ec);
	if (ec) {
		m_isConnected = false;
		return std::nullopt;
	}
	return Message(buffer.data(), bytes);
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

std::optional<Message> TcpClient::read() {
	return m_pimpl->read();
}

} // namespace relay::network
