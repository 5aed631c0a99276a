#pragma once

#include "network/transport.hpp"
#include "network/types.hpp"
#include "node/clusterLink.hpp"
#include "node/playerStore.hpp"
#include "node/sessionRegistry.hpp"
#include "node/sideChannel.hpp"
#include "node/types.hpp"
#include "node/wireCodec.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace relay::node {

//! Central packet state machine.
//! Splits every read into sub-packets, mutates the player store and fans updates out to the other
//! sessions and, in unified cluster mode, to the parent node.
//! \note Holds no state of its own between packets. Call from a single thread per connection.
class PacketDispatcher {
public:
	//! Called for packet types the node does not know before they are relayed as a string field.
	using UnknownPacketHook = std::function<void(SessionId sessionId, std::uint8_t type, std::string_view payload)>;

	PacketDispatcher(SessionRegistry& sessions, PlayerStore& players, network::ITransport& transport, IClusterLink& cluster,
	                 SideChannelWorker& sideChannel);

	void registerPersistence(ISidePersistence* persistence);
	void registerMail(ISideMail* mail);
	void registerUnknownPacketHook(UnknownPacketHook hook);

	//! Assign a session id. On failure the connection is closed again.
	std::optional<SessionId> onConnect(network::ConnectionId connectionId, network::TransportKind transport);
	void onData(network::ConnectionId connectionId, std::string_view data);
	void onDisconnect(network::ConnectionId connectionId);

	//! Bytes the parent node relayed down. Processed like client bytes without a sending session.
	void onUpstreamData(std::string_view data);

	//! Remove the session, tell everybody it left and drop its player state. Runs once per session.
	void teardown(SessionId sessionId);

private:
	struct PacketSource {
		SessionId sessionId{UPSTREAM_SESSION_ID};
		network::ConnectionId connectionId{network::INVALID_CONNECTION};
		bool upstream{false};
	};

	void processPacket(const PacketSource& source, std::string_view data); //!< Framing loop over one read.
	void dispatch(const PacketSource& source, const SubPacket& packet);

	void handleIdentity(const PacketSource& source, std::string_view payload);
	void handleChat(const PacketSource& source, std::string_view payload);
	void handleEmail(const PacketSource& source, std::string_view payload);
	void handleUpload(const PacketSource& source, std::string_view payload);
	void handleMiscData(const PacketSource& source, std::string_view payload);
	void handleLeave(const PacketSource& source, const SubPacket& packet);
	void handleHeartbeat(const PacketSource& source);
	void handleFieldUpdate(const PacketSource& source, std::uint8_t type, std::string_view payload);

	void reply(const PacketSource& source, const network::Message& message);
	void broadcastExcept(const PacketSource& source, const network::Message& message);
	std::string identityOf(const PacketSource& source) const;

private:
	SessionRegistry& m_sessions;
	PlayerStore& m_players;
	network::ITransport& m_transport;
	IClusterLink& m_cluster;
	SideChannelWorker& m_sideChannel;

	ISidePersistence* m_persistence{nullptr};
	ISideMail* m_mail{nullptr};
	UnknownPacketHook m_unknownPacketHook;
};

} // namespace relay::node
