#pragma once

#include "network/types.hpp"

#include <asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace relay::network {

//! Transportation primitive. Handles read/write from a single TCP client.
//! \note Internals are async and run on the server IO thread.
//!       We use shared_from_this() so any in-flight async op keeps the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Callbacks callbacks);
	~Connection();

	void start();                  //!< Start connection: triggers onConnect and begins async read loop.
	void stop();                   //!< Stop connection: closes the socket. Fires onDisconnect once.
	void send(const Message& msg); //!< Queue raw bytes for writing. Safe to call from any thread.

	ConnectionId connectionId() const;
	const std::string& remoteAddress() const;

private:
	void startRead();    //!< Prime async read and dispatch whatever arrived.
	void startWrite();   //!< Prime async write for queued messages.
	void doDisconnect(); //!< Internal cleanup. Runs at most once.

private:
	std::atomic<bool> m_running{false};           //!< Connection is live.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serialises reads, writes and close.

	ConnectionId m_connectionId;
	std::string m_remoteAddress;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	std::array<char, READ_CHUNK_BYTES> m_readBuffer{};
	std::deque<Message> m_writeQueue;
	bool m_writeInProgress{false};
};

} // namespace relay::network
