#pragma once

#include "network/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relay {
namespace network {

//! Minimal synchronous TCP client. Raw bytes in both directions, no framing.
//! \note    Blocking I/O; one thread reads while others may send.
//!          On any network failure, send/read return false/empty and the client is considered disconnected.
//! \example Usage: connect() once, then read() from a dedicated thread and send() from anywhere.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Write all bytes. Returns false on failure.
	std::optional<Message> read();     //!< Block until some bytes arrive. Empty if disconnected or on error.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace relay
