#pragma once

#include "network/types.hpp"
#include "node/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace relay {
namespace node {

struct NodeConfig {
	std::uint16_t port{network::DEFAULT_PORT};              //!< Stream listener. Message sockets listen on port + 1.
	std::uint16_t healthPort{network::DEFAULT_HEALTH_PORT}; //!< 0 disables the health endpoint.
	std::uint8_t nodeIndex{0};                              //!< High byte of every session id. At most MAX_NODE_INDEX.
	std::string parentHost;                                 //!< Empty: standalone node.
	std::uint16_t parentPort{network::DEFAULT_PARENT_PORT};
};

//! Read a node configuration from a JSON file. Missing keys keep their defaults.
//! \returns Empty if the file cannot be read or a key has the wrong type.
std::optional<NodeConfig> loadConfig(const std::filesystem::path& path);

//! Same as loadConfig for a JSON document in memory.
std::optional<NodeConfig> parseConfig(const std::string& json);

} // namespace node
} // namespace relay
