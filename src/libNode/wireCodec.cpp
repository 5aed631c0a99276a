#include "node/wireCodec.hpp"

#include "node/packetTypes.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace relay::node {

static std::uint16_t readU16(std::string_view data, std::size_t offset) {
	return static_cast<std::uint16_t>(static_cast<std::uint8_t>(data[offset]) | (static_cast<std::uint8_t>(data[offset + 1]) << 8));
}

FrameSplit splitFrames(std::string_view data) {
	FrameSplit split;

	std::size_t offset = 0;
	while (offset < data.size()) {
		if (data.size() - offset < FRAME_HEADER_BYTES) {
			split.malformed = true;
			break;
		}

		const auto frameLength = static_cast<std::int16_t>(readU16(data, offset));
		if (frameLength < static_cast<std::int16_t>(FRAME_HEADER_BYTES)) {
			split.malformed = true;
			break;
		}

		const auto end = offset + static_cast<std::size_t>(frameLength);
		if (end > data.size()) {
			split.malformed = true;
			break;
		}

		split.packets.push_back(SubPacket{
		        .type    = static_cast<std::uint8_t>(data[offset + 2]),
		        .payload = data.substr(offset + FRAME_HEADER_BYTES, end - offset - FRAME_HEADER_BYTES),
		        .raw     = data.substr(offset, end - offset),
		});
		offset = end;
	}

	return split;
}

std::string encodeFrame(std::uint8_t type, std::string_view payload) {
	const auto total = std::min(payload.size() + FRAME_HEADER_BYTES, static_cast<std::size_t>(std::numeric_limits<std::int16_t>::max()));

	std::string frame;
	frame.reserve(total);
	frame.push_back(static_cast<char>(total & 0xFF));
	frame.push_back(static_cast<char>((total >> 8) & 0xFF));
	frame.push_back(static_cast<char>(type));
	frame.append(payload.substr(0, total - FRAME_HEADER_BYTES));
	return frame;
}

std::string sanitize(std::string_view raw) {
	std::string text;
	text.reserve(raw.size());
	std::copy_if(raw.begin(), raw.end(), std::back_inserter(text), [](char c) { return c != '\0'; });

	if (const auto marker = text.find('\x05'); marker != std::string::npos) {
		text.erase(marker, 1);
	}
	return text;
}

std::optional<Position> decodePosition(std::string_view payload) {
	if (payload.size() < 5) {
		return std::nullopt;
	}
	return Position{
	        .x      = static_cast<std::int16_t>(readU16(payload, 0)),
	        .y      = static_cast<std::int16_t>(readU16(payload, 2)),
	        .facing = static_cast<std::uint8_t>(payload[4]),
	};
}


OutboundPacket::OutboundPacket(std::size_t capacity) : m_buffer(capacity, '\0') {
}

OutboundPacket& OutboundPacket::writeU8(std::size_t offset, std::uint8_t value) {
	if (offset < m_buffer.size()) {
		m_buffer[offset] = static_cast<char>(value);
	}
	return *this;
}

OutboundPacket& OutboundPacket::writeU16(std::size_t offset, std::uint16_t value) {
	writeU8(offset, static_cast<std::uint8_t>(value & 0xFF));
	writeU8(offset + 1, static_cast<std::uint8_t>((value >> 8) & 0xFF));
	return *this;
}

OutboundPacket& OutboundPacket::writeI16(std::size_t offset, std::int16_t value) {
	return writeU16(offset, static_cast<std::uint16_t>(value));
}

OutboundPacket& OutboundPacket::writeString(std::size_t offset, std::string_view value) {
	if (offset >= m_buffer.size()) {
		return *this;
	}
	const auto count = std::min(value.size(), m_buffer.size() - offset);
	std::copy_n(value.begin(), count, m_buffer.begin() + static_cast<std::ptrdiff_t>(offset));
	return *this;
}

network::Message OutboundPacket::release() {
	return std::move(m_buffer);
}


network::Message makeAssign(SessionId sessionId, std::string_view uid) {
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, toByte(ServerPacket::Assign)).writeU16(1, sessionId).writeString(3, uid).release();
}

network::Message makeChat(std::string_view text) {
	return OutboundPacket(LARGE_PACKET_BYTES).writeU8(0, toByte(ServerPacket::Message)).writeString(1, text).release();
}

network::Message makeFieldUpdate(std::uint8_t type, SessionId sessionId, std::string_view value) {
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, type).writeU16(1, sessionId).writeString(3, value).release();
}

network::Message makePositionUpdate(std::uint8_t type, SessionId sessionId, const Position& position) {
	return OutboundPacket(SMALL_PACKET_BYTES)
	        .writeU8(0, type)
	        .writeU16(1, sessionId)
	        .writeI16(3, position.x)
	        .writeI16(5, position.y)
	        .writeU8(7, position.facing)
	        .release();
}

network::Message makeLeave(SessionId sessionId) {
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, toByte(ServerPacket::Leave)).writeU16(1, sessionId).release();
}

network::Message makePlayerObject(SessionId sessionId, std::string_view json) {
	// Only the low byte of the id fits here; clients read it as uint8.
	return OutboundPacket(LARGE_PACKET_BYTES)
	        .writeU8(0, toByte(ServerPacket::PlayerObj))
	        .writeU8(1, static_cast<std::uint8_t>(sessionId & 0xFF))
	        .writeString(2, json)
	        .release();
}

network::Message makeHeartbeat() {
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, toByte(ServerPacket::Heartbeat)).release();
}

network::Message makeClusterCount(std::size_t liveSessions) {
	const auto count = static_cast<std::uint8_t>(std::min<std::size_t>(liveSessions, std::numeric_limits<std::uint8_t>::max()));
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, toByte(ClusterPacket::Count)).writeU8(1, count).release();
}

network::Message makeClusterAnnounce(std::uint16_t listenPort) {
	return OutboundPacket(SMALL_PACKET_BYTES).writeU8(0, toByte(ClusterPacket::Type)).writeU8(1, 1u).writeU16(2, listenPort).release();
}

} // namespace relay::node
