#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace relay {
namespace network {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer. Shared by both transports.
using Message      = std::string;   //!< Raw bytes as read from / written to a transport.

//! Which transport a connection came in on.
enum class TransportKind : std::uint8_t {
	Stream,  //!< Raw TCP socket. No message boundaries.
	Message, //!< WebSocket. Transport keeps message boundaries.
};

inline constexpr ConnectionId INVALID_CONNECTION = 0u;

inline constexpr std::uint16_t DEFAULT_PORT        = 63456; //!< TCP port. WebSocket listens on DEFAULT_PORT + 1.
inline constexpr std::uint16_t DEFAULT_HEALTH_PORT = 8081;
inline constexpr std::uint16_t DEFAULT_PARENT_PORT = 63458;

//! Size of a single read from a stream socket.
inline constexpr std::size_t READ_CHUNK_BYTES = 4 * 1024;

//! Largest single outbound write we accept. Outbound packets are at most 4096 bytes.
inline constexpr std::size_t MAX_WRITE_BYTES = 64 * 1024;

//! Next connection id. Both listeners draw from this so ids never collide across transports.
ConnectionId nextConnectionId();

} // namespace network
} // namespace relay
