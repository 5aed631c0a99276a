#pragma once

#include "network/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relay {
namespace network {

//! Message-socket (WebSocket) listener. One binary WebSocket message is delivered as one read.
//! Shares the ConnectionId space with TcpServer.
class WsServer {
public:
	struct Callbacks {
		std::function<void(ConnectionId, const std::string& remoteAddress)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit WsServer(std::uint16_t port = DEFAULT_PORT + 1);
	~WsServer();

	WsServer(const WsServer&)            = delete;
	WsServer& operator=(const WsServer&) = delete;
	WsServer(WsServer&&)                 = delete;
	WsServer& operator=(WsServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions. Call before start.
	bool start();                      //!< Start listening. Returns false if the port could not be bound.
	void stop();                       //!< Close all clients and stop the IO thread.

	bool send(ConnectionId connectionId, const Message& msg); //!< Send one binary message. Returns false if unknown or on error.
	void close(ConnectionId connectionId);                    //!< Start the closing handshake.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide websocketpp in public interfaces.
};

} // namespace network
} // namespace relay
