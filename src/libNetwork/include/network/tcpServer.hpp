#pragma once

#include "network/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {

//! Stream-socket listener that runs an async accept loop on a dedicated IO thread.
//! \note    This is a thin wrapper: all heavy lifting is in Connection (async read/write).
//!          Reads are delivered as they arrive; no framing is applied on this layer.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId, const std::string& remoteAddress)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the port could not be bound.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	bool send(ConnectionId connectionId, const Message& msg); //!< Queue bytes for the given connection. Returns false if not found.
	void close(ConnectionId connectionId);                    //!< Close the connection. onDisconnect fires once it is down.

	std::uint16_t port() const; //!< Bound port. Useful when constructed with port 0.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace network
} // namespace relay
