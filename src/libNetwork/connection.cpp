#include "connection.hpp"

#include "Logging.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <format>
#include <utility>

namespace relay::network {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_connectionId(connectionId),
      m_callbacks(std::move(callbacks)) {
	asio::error_code ec;
	const auto endpoint = m_socket.remote_endpoint(ec);
	if (!ec) {
		m_remoteAddress = endpoint.address().to_string();
	}
}

Connection::~Connection() {
	asio::error_code ec;
	m_socket.close(ec);
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}

	if (m_callbacks.onConnect) {
		m_callbacks.onConnect(*this);
	}

	asio::post(m_strand, [self = shared_from_this()] { self->startRead(); });
}

void Connection::stop() {
	asio::post(m_strand, [self = shared_from_this()] { self->doDisconnect(); });
}

void Connection::send(const Message& msg) {
	if (!m_running.load() || msg.size() > MAX_WRITE_BYTES) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this(), msg] {
		self->m_writeQueue.push_back(msg);
		if (!self->m_writeInProgress) {
			self->startWrite();
		}
	});
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

const std::string& Connection::remoteAddress() const {
	return m_remoteAddress;
}

void Connection::startRead() {
	m_socket.async_read_some(asio::buffer(m_readBuffer),
	                         asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t bytes) {
		                         if (ec || !self->m_running) {
			                         if (ec && ec != asio::error::eof && ec != asio::error::operation_aborted) {
				                         Logger().Log(Logging::LogLevel::Warning,
				                                      std::format("[Connection] Read error on '{}': {}", self->m_connectionId, ec.message()));
			                         }
			                         self->doDisconnect();
			                         return;
		                         }

		                         if (bytes > 0 && self->m_callbacks.onMessage) {
			                         self->m_callbacks.onMessage(*self, Message(self->m_readBuffer.data(), bytes));
		                         }
		                         self->startRead();
	                         }));
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		m_writeInProgress = false;
		return;
	}

	m_writeInProgress = true;
	asio::async_write(m_socket, asio::buffer(m_writeQueue.front()),
	                  asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec) {
			                  Logger().Log(Logging::LogLevel::Warning,
			                               std::format("[Connection] Sending error on '{}': {}", self->m_connectionId, ec.message()));
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  self->startWrite();
	                  }));
}

void Connection::doDisconnect() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_writeQueue.clear();
	m_writeInProgress = false;

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(*this);
	}
}

} // namespace relay::network
