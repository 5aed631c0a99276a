#include "mocks.hpp"

#include <algorithm>

namespace relay::gtest {

bool MockTransport::send(network::ConnectionId connectionId, const network::Message& msg) {
	m_sent.emplace_back(connectionId, msg);
	return true;
}

void MockTransport::close(network::ConnectionId connectionId) {
	closed.push_back(connectionId);
}

std::vector<network::Message> MockTransport::sentTo(network::ConnectionId connectionId) const {
	std::vector<network::Message> result;
	for (const auto& [id, msg]: m_sent) {
		if (id == connectionId) {
			result.push_back(msg);
		}
	}
	return result;
}

std::vector<network::Message> MockTransport::sentTo(network::ConnectionId connectionId, std::uint8_t type) const {
	auto result = sentTo(connectionId);
	std::erase_if(result, [type](const network::Message& msg) { return packetType(msg) != type; });
	return result;
}

std::size_t MockTransport::sendCount() const {
	return m_sent.size();
}

void MockTransport::clear() {
	m_sent.clear();
	closed.clear();
}


void MockClusterLink::sendToParent(const network::Message& message) {
	if (parent) {
		sent.push_back(message);
	}
}


bool MockUpstreamLink::connect(const std::string&, std::uint16_t) {
	return acceptConnect;
}

bool MockUpstreamLink::send(const network::Message& message) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_sent.push_back(message);
	return acceptSend;
}

std::optional<network::Message> MockUpstreamLink::read() {
	try {
		return m_reads.Pop();
	} catch (const QueueReleased&) {
		return std::nullopt;
	}
}

void MockUpstreamLink::disconnect() {
	m_reads.Release();
}

void MockUpstreamLink::feed(network::Message data) {
	m_reads.Push(std::move(data));
}

std::vector<network::Message> MockUpstreamLink::sentMessages() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sent;
}


std::uint8_t packetType(const network::Message& packet) {
	return packet.empty() ? 0u : static_cast<std::uint8_t>(packet[0]);
}

std::uint16_t packetSession(const network::Message& packet) {
	if (packet.size() < 3) {
		return 0u;
	}
	return static_cast<std::uint16_t>(static_cast<std::uint8_t>(packet[1]) | (static_cast<std::uint8_t>(packet[2]) << 8));
}

std::string packetString(const network::Message& packet, std::size_t offset) {
	if (offset >= packet.size()) {
		return {};
	}
	const auto end = packet.find('\0', offset);
	return packet.substr(offset, end == std::string::npos ? std::string::npos : end - offset);
}

} // namespace relay::gtest
