#pragma once

#include <cstddef>
#include <cstdint>

namespace relay::node {

//! Session id on the wire: nodeIndex * 256 + rolling counter.
using SessionId = std::uint16_t;

//! Sessions a single node can hold before rolling ids collide.
inline constexpr std::size_t SESSIONS_PER_NODE = 256;

//! Session id written into packets that originate from the parent link rather than a player.
inline constexpr SessionId UPSTREAM_SESSION_ID = 0xFFFF;

//! Highest usable node index. Node 255 would hand out UPSTREAM_SESSION_ID to a player.
inline constexpr std::uint8_t MAX_NODE_INDEX = 254;

struct Position {
	std::int16_t x{0};
	std::int16_t y{0};
	std::uint8_t facing{0};

	bool operator==(const Position&) const = default;
};

} // namespace relay::node
