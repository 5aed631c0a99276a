#pragma once

#include "network/types.hpp"
#include "node/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay::node {

// Inbound (client -> node): sub-packets packed back to back in one read,
//   [frameLength:int16-LE][type:uint8][payload: frameLength - 3 bytes]
// Outbound (node -> client): one zero-filled fixed-size buffer per packet, fields at fixed offsets.
// The two directions are framed differently on purpose; clients depend on both.

inline constexpr std::size_t FRAME_HEADER_BYTES = 3;
inline constexpr std::size_t SMALL_PACKET_BYTES = 512;  //!< Header, id and short field packets.
inline constexpr std::size_t LARGE_PACKET_BYTES = 4096; //!< JSON-bearing packets.

//! One decoded sub-packet. Views point into the buffer passed to splitFrames.
struct SubPacket {
	std::uint8_t type{0};
	std::string_view payload; //!< Bytes after the type byte.
	std::string_view raw;     //!< The whole sub-packet including its length field.
};

struct FrameSplit {
	std::vector<SubPacket> packets;
	bool malformed{false}; //!< A bad length field stopped the split before the end of the buffer.
};

//! Split one transport read into its sub-packets.
//! Stops at the first length field that is shorter than a header or runs past the buffer.
FrameSplit splitFrames(std::string_view data);

//! Encode a single inbound-format sub-packet.
std::string encodeFrame(std::uint8_t type, std::string_view payload);

//! Strip NUL padding and the 0x05 packet marker some engines prepend to strings.
std::string sanitize(std::string_view raw);

//! Decode (x:int16-LE, y:int16-LE, facing:uint8). Empty if the payload is too short.
std::optional<Position> decodePosition(std::string_view payload);

//! Fixed-capacity, zero-filled outbound buffer. Each packet owns its own buffer.
class OutboundPacket {
public:
	explicit OutboundPacket(std::size_t capacity);

	OutboundPacket& writeU8(std::size_t offset, std::uint8_t value);
	OutboundPacket& writeU16(std::size_t offset, std::uint16_t value); //!< Little endian.
	OutboundPacket& writeI16(std::size_t offset, std::int16_t value);  //!< Little endian.
	OutboundPacket& writeString(std::size_t offset, std::string_view value); //!< Truncated at capacity.

	network::Message release();

private:
	network::Message m_buffer;
};

// Outbound builders.
network::Message makeAssign(SessionId sessionId, std::string_view uid);
network::Message makeChat(std::string_view text);
network::Message makeFieldUpdate(std::uint8_t type, SessionId sessionId, std::string_view value);
network::Message makePositionUpdate(std::uint8_t type, SessionId sessionId, const Position& position);
network::Message makeLeave(SessionId sessionId);
network::Message makePlayerObject(SessionId sessionId, std::string_view json);
network::Message makeHeartbeat();

// Cluster builders (node -> parent).
network::Message makeClusterCount(std::size_t liveSessions);
network::Message makeClusterAnnounce(std::uint16_t listenPort);

} // namespace relay::node
