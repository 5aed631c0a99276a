#include "node/config.hpp"

#include "Logging.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <limits>

namespace relay::node {

namespace {
//! Copy an unsigned member into `out` if present. False if it is present but unusable.
template <typename T>
bool readUnsigned(const nlohmann::json& object, const char* key, T& out) {
	const auto it = object.find(key);
	if (it == object.end()) {
		return true;
	}
	if (!it->is_number_unsigned() || it->get<std::uint64_t>() > std::numeric_limits<T>::max()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] '{}' must be an unsigned number up to {}.", key, std::numeric_limits<T>::max()));
		return false;
	}
	out = static_cast<T>(it->get<std::uint64_t>());
	return true;
}

bool readString(const nlohmann::json& object, const char* key, std::string& out) {
	const auto it = object.find(key);
	if (it == object.end()) {
		return true;
	}
	if (!it->is_string()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] '{}' must be a string.", key));
		return false;
	}
	out = it->get<std::string>();
	return true;
}
} // namespace

std::optional<NodeConfig> parseConfig(const std::string& json) {
	const auto object = nlohmann::json::parse(json, nullptr, false);
	if (object.is_discarded() || !object.is_object()) {
		Logger().Log(Logging::LogLevel::Error, "[Config] Configuration is not a JSON object.");
		return std::nullopt;
	}

	NodeConfig config;
	const auto valid = readUnsigned(object, "port", config.port) && readUnsigned(object, "healthPort", config.healthPort) &&
	                   readUnsigned(object, "nodeIndex", config.nodeIndex) && readString(object, "parentHost", config.parentHost) &&
	                   readUnsigned(object, "parentPort", config.parentPort);
	if (!valid) {
		return std::nullopt;
	}
	if (config.nodeIndex > MAX_NODE_INDEX) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] 'nodeIndex' must be at most {}.", MAX_NODE_INDEX));
		return std::nullopt;
	}
	return config;
}

std::optional<NodeConfig> loadConfig(const std::filesystem::path& path) {
	std::ifstream file(path);
	if (!file) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Config] Could not open '{}'.", path.string()));
		return std::nullopt;
	}

	const std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
	return parseConfig(content);
}

} // namespace relay::node
