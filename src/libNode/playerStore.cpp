#include "node/playerStore.hpp"

#include <utility>

namespace relay::node {

namespace {
constexpr const char* KEY_UID    = "uid";
constexpr const char* KEY_NAME   = "name";
constexpr const char* KEY_ROOM   = "myRoom";
constexpr const char* KEY_OUTFIT = "outfit";
constexpr const char* KEY_POS    = "pos";

//! Move a string member out of the object. Members of another type stay in the extension.
void takeString(nlohmann::json& object, const char* key, std::string& out) {
	const auto it = object.find(key);
	if (it != object.end() && it->is_string()) {
		out = it->get<std::string>();
		object.erase(it);
	}
}

void takePosition(nlohmann::json& object, Position& out) {
	const auto it = object.find(KEY_POS);
	if (it == object.end() || !it->is_array() || it->size() < 3) {
		return;
	}
	const auto& pos = *it;
	if (!pos[0].is_number_integer() || !pos[1].is_number_integer() || !pos[2].is_number_integer()) {
		return;
	}
	out.x      = static_cast<std::int16_t>(pos[0].get<int>());
	out.y      = static_cast<std::int16_t>(pos[1].get<int>());
	out.facing = static_cast<std::uint8_t>(pos[2].get<int>());
	object.erase(it);
}

//! A field never set from a typed value leaves the client's own member untouched.
void putString(nlohmann::json& object, const char* key, const std::string& value) {
	if (value.empty() && object.contains(key)) {
		return;
	}
	object[key] = value;
}
} // namespace

std::optional<PlayerState> parsePlayerState(std::string_view json) {
	auto object = nlohmann::json::parse(json, nullptr, false);
	if (object.is_discarded() || !object.is_object()) {
		return std::nullopt;
	}

	const auto uid = object.find(KEY_UID);
	if (uid == object.end() || !uid->is_string()) {
		return std::nullopt;
	}

	PlayerState state;
	takeString(object, KEY_UID, state.identity);
	takeString(object, KEY_NAME, state.name);
	takeString(object, KEY_ROOM, state.room);
	takeString(object, KEY_OUTFIT, state.outfit);
	takePosition(object, state.position);
	state.extension = std::move(object);
	return state;
}

nlohmann::json toJson(const PlayerState& state) {
	auto object = state.extension.is_object() ? state.extension : nlohmann::json::object();

	object[KEY_UID] = state.identity;
	putString(object, KEY_NAME, state.name);
	putString(object, KEY_ROOM, state.room);
	putString(object, KEY_OUTFIT, state.outfit);
	if (state.position != Position{} || !object.contains(KEY_POS)) {
		object[KEY_POS] = {state.position.x, state.position.y, state.position.facing};
	}
	return object;
}

std::string serialize(const PlayerState& state) {
	return toJson(state).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}


std::string PlayerStore::insertUnique(PlayerState state) {
	std::lock_guard<std::mutex> lock(m_mutex);

	while (m_players.contains(state.identity)) {
		state.identity += 'f';
	}

	auto identity = state.identity;
	m_players.emplace(identity, std::move(state));
	return identity;
}

bool PlayerStore::setPosition(const std::string& identity, const Position& position) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_players.find(identity);
	if (it == m_players.end()) {
		return false;
	}
	it->second.position = position;
	return true;
}

bool PlayerStore::setField(const std::string& identity, PlayerField field, std::string value) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_players.find(identity);
	if (it == m_players.end()) {
		return false;
	}

	switch (field) {
	case PlayerField::Name:
		it->second.name = std::move(value);
		break;
	case PlayerField::Room:
		it->second.room = std::move(value);
		break;
	case PlayerField::Outfit:
		it->second.outfit = std::move(value);
		break;
	}
	return true;
}

bool PlayerStore::remove(const std::string& identity) {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_players.erase(identity) > 0;
}

std::optional<PlayerState> PlayerStore::find(const std::string& identity) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_players.find(identity);
	if (it == m_players.end()) {
		return std::nullopt;
	}
	return it->second;
}

bool PlayerStore::contains(const std::string& identity) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_players.contains(identity);
}

std::size_t PlayerStore::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_players.size();
}

std::vector<PlayerState> PlayerStore::all() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<PlayerState> players;
	players.reserve(m_players.size());
	for (const auto& [_, state]: m_players) {
		players.push_back(state);
	}
	return players;
}

} // namespace relay::node
