#pragma once

#include "network/tcpServer.hpp"
#include "network/types.hpp"
#include "network/wsServer.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace relay {
namespace network {

//! Uniform send/close over both transport kinds.
//! \note A failed send is logged and reported through the return value only; it never throws.
class ITransport {
public:
	virtual ~ITransport()                                           = default;
	virtual bool send(ConnectionId connectionId, const Message& msg) = 0;
	virtual void close(ConnectionId connectionId)                    = 0;
};

//! Owns the stream listener (port) and the message-socket listener (port + 1).
//! Dispatches send/close by the transport kind each connection arrived on.
class Transport : public ITransport {
public:
	struct Callbacks {
		std::function<void(ConnectionId, TransportKind, const std::string& remoteAddress)> onConnect;
		std::function<void(ConnectionId, const Message&)> onMessage;
		std::function<void(ConnectionId)> onDisconnect;
	};

	explicit Transport(std::uint16_t port = DEFAULT_PORT);
	~Transport() override;

	Transport(const Transport&)            = delete;
	Transport& operator=(const Transport&) = delete;

	void connect(Callbacks callbacks); //!< Call before start.
	bool start();                      //!< Start both listeners. False if either failed to bind.
	void stop();

	bool send(ConnectionId connectionId, const Message& msg) override;
	void close(ConnectionId connectionId) override;

	std::size_t connectionCount() const;

private:
	void onConnect(ConnectionId connectionId, TransportKind kind, const std::string& remoteAddress);
	void onDisconnect(ConnectionId connectionId);

private:
	TcpServer m_stream;
	WsServer m_message;
	Callbacks m_callbacks;

	std::unordered_map<ConnectionId, TransportKind> m_kinds; //!< Transport of every live connection.
	mutable std::mutex m_kindsMutex;
};

} // namespace network
} // namespace relay
