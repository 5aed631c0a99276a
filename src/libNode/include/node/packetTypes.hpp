#pragma once

#include <cstdint>

namespace relay::node {

// Numeric values are an interop contract with existing game clients. Do not renumber.

//! Packets sent from the node to clients.
enum class ServerPacket : std::uint8_t {
	Assign    = 1,
	Message   = 2,
	MiscData  = 3,
	Pos       = 4,
	MyRoom    = 5,
	Outfit    = 6,
	Name      = 7,
	Leave     = 8,
	PlayerObj = 9,
	Heartbeat = 10,
};

//! Packets sent from clients to the node.
enum class ClientPacket : std::uint8_t {
	Id        = 20,
	Pos       = 21,
	MyRoom    = 22,
	Outfit    = 23,
	Name      = 24,
	Message   = 25,
	Email     = 26,
	Upload    = 27,
	MiscData  = 28,
	Heartbeat = 29,
};

//! Packets exchanged between nodes of a cluster.
enum class ClusterPacket : std::uint8_t {
	Count      = 40,
	PlayerData = 41,
	MiscData   = 42,
	Type       = 43,
	ServerData = 44,
	Queue      = 45,
	Leave      = 46,
};

constexpr std::uint8_t toByte(ServerPacket type) {
	return static_cast<std::uint8_t>(type);
}
constexpr std::uint8_t toByte(ClientPacket type) {
	return static_cast<std::uint8_t>(type);
}
constexpr std::uint8_t toByte(ClusterPacket type) {
	return static_cast<std::uint8_t>(type);
}

} // namespace relay::node
