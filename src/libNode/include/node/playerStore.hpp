#pragma once

#include "node/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace relay::node {

//! Replicated state of one player. Keyed by identity, independent of the session that owns it.
struct PlayerState {
	std::string identity; //!< "uid" on the wire.
	std::string name;
	std::string room; //!< "myRoom" on the wire.
	std::string outfit;
	Position position; //!< "pos" on the wire as [x, y, facing].

	//! Every other key of the identity object. Passed through untouched.
	nlohmann::json extension = nlohmann::json::object();
};

enum class PlayerField : std::uint8_t { Name, Room, Outfit };

//! Parse the identity object a client sends. Empty if it is not a JSON object with a string "uid".
std::optional<PlayerState> parsePlayerState(std::string_view json);

nlohmann::json toJson(const PlayerState& state);
std::string serialize(const PlayerState& state);

//! identity -> PlayerState. Exactly one record per identity.
//! \note Thread safe. Lookups hand out copies.
class PlayerStore {
public:
	//! Store the record. A taken identity gets 'f' appended until it is free.
	//! \returns The identity the record was stored under.
	std::string insertUnique(PlayerState state);

	bool setPosition(const std::string& identity, const Position& position); //!< False if there is no such record.
	bool setField(const std::string& identity, PlayerField field, std::string value);
	bool remove(const std::string& identity); //!< False if there was nothing to remove.

	std::optional<PlayerState> find(const std::string& identity) const;
	bool contains(const std::string& identity) const;
	std::size_t size() const;
	std::vector<PlayerState> all() const;

private:
	std::unordered_map<std::string, PlayerState> m_players;
	mutable std::mutex m_mutex;
};

} // namespace relay::node
