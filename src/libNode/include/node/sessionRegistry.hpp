#pragma once

#include "network/types.hpp"
#include "node/types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace relay::node {

struct Session {
	SessionId sessionId{0};                                      //!< Identifies the player on the wire.
	network::ConnectionId connectionId{network::INVALID_CONNECTION}; //!< Identifies the connection on network layer.
	network::TransportKind transport{network::TransportKind::Stream};
	std::string identity; //!< Empty until the client sent its identity packet.
};

//! connection <-> session id bookkeeping and id allocation.
//! Ids are nodeIndex * 256 + a rolling 8-bit counter, so ids stay unique across a cluster.
//! \note Capacity limit: a node holds at most 256 sessions. The counter skips ids that are
//!       still live; assign() fails only when all 256 are taken.
//! \note Thread safe. all() returns a snapshot.
class SessionRegistry {
public:
	explicit SessionRegistry(std::uint8_t nodeIndex = 0);

	std::optional<SessionId> assign(network::ConnectionId connectionId, network::TransportKind transport);
	std::optional<Session> remove(SessionId sessionId); //!< Returns the removed session. Removing an absent id is a no-op.
	bool setIdentity(SessionId sessionId, const std::string& identity);

	std::optional<Session> find(SessionId sessionId) const;
	std::optional<Session> findByConnection(network::ConnectionId connectionId) const;
	std::vector<Session> all() const;
	std::size_t size() const;

	std::uint8_t nodeIndex() const;

private:
	const std::uint8_t m_nodeIndex;
	std::uint8_t m_counter{0}; //!< Rolls over at 256.

	std::unordered_map<SessionId, Session> m_sessions;
	std::unordered_map<network::ConnectionId, SessionId> m_connectionToSession;
	mutable std::mutex m_mutex;
};

} // namespace relay::node
