#pragma once

#include "core/SafeQueue.hpp"
#include "network/transport.hpp"
#include "node/clusterLink.hpp"
#include "node/clusterRelay.hpp"
#include "node/sideChannel.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace relay::gtest {

//! Records every send/close instead of touching a socket.
class MockTransport : public network::ITransport {
public:
	bool send(network::ConnectionId connectionId, const network::Message& msg) override;
	void close(network::ConnectionId connectionId) override;

	std::vector<network::Message> sentTo(network::ConnectionId connectionId) const;
	std::vector<network::Message> sentTo(network::ConnectionId connectionId, std::uint8_t type) const; //!< Only packets of this type.
	std::size_t sendCount() const;
	void clear();

	std::vector<network::ConnectionId> closed;

private:
	std::vector<std::pair<network::ConnectionId, network::Message>> m_sent;
};

class MockClusterLink : public node::IClusterLink {
public:
	bool hasParent() const override {
		return parent;
	}
	bool isUnified() const override {
		return unified;
	}
	void sendToParent(const network::Message& message) override;

	bool parent{false};
	bool unified{false};
	std::vector<network::Message> sent;
};

class MockMail : public node::ISideMail {
public:
	void send(const std::string& subject, const std::string& body) override {
		mails.emplace_back(subject, body);
	}
	std::vector<std::pair<std::string, std::string>> mails;
};

class MockPersistence : public node::ISidePersistence {
public:
	void incrementLikeCounter(const std::string& photoId) override {
		likes.push_back(photoId);
	}
	std::vector<std::string> likes;
};

//! Upstream link fed by the test. read() blocks until feed() or disconnect().
class MockUpstreamLink : public node::IUpstreamLink {
public:
	bool connect(const std::string& host, std::uint16_t port) override;
	bool send(const network::Message& message) override;
	std::optional<network::Message> read() override;
	void disconnect() override;

	void feed(network::Message data);
	std::vector<network::Message> sentMessages() const;

	bool acceptConnect{true};
	bool acceptSend{true};

private:
	SafeQueue<network::Message> m_reads;
	std::vector<network::Message> m_sent;
	mutable std::mutex m_mutex;
};

// Helpers to read outbound packets.
std::uint8_t packetType(const network::Message& packet);
std::uint16_t packetSession(const network::Message& packet);
std::string packetString(const network::Message& packet, std::size_t offset); //!< Zero terminated string at offset.

} // namespace relay::gtest
