#include "node/dispatcher.hpp"

#include "Logging.hpp"
#include "node/packetTypes.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <format>
#include <string>
#include <utility>

namespace relay::node {

PacketDispatcher::PacketDispatcher(SessionRegistry& sessions, PlayerStore& players, network::ITransport& transport,
                                   IClusterLink& cluster, SideChannelWorker& sideChannel)
    : m_sessions(sessions), m_players(players), m_transport(transport), m_cluster(cluster), m_sideChannel(sideChannel) {
}

void PacketDispatcher::registerPersistence(ISidePersistence* persistence) {
	m_persistence = persistence;
}

void PacketDispatcher::registerMail(ISideMail* mail) {
	m_mail = mail;
}

void PacketDispatcher::registerUnknownPacketHook(UnknownPacketHook hook) {
	m_unknownPacketHook = std::move(hook);
}

std::optional<SessionId> PacketDispatcher::onConnect(network::ConnectionId connectionId, network::TransportKind transport) {
	const auto sessionId = m_sessions.assign(connectionId, transport);
	if (!sessionId) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Rejecting connection '{}': no free session id.", connectionId));
		m_transport.close(connectionId);
		return std::nullopt;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Dispatcher] Connection '{}' joined as session {}.", connectionId, *sessionId));

	if (m_cluster.hasParent()) {
		m_cluster.sendToParent(makeClusterCount(m_sessions.size()));
	}
	return sessionId;
}

void PacketDispatcher::onData(network::ConnectionId connectionId, std::string_view data) {
	const auto session = m_sessions.findByConnection(connectionId);
	if (!session) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Dispatcher] Dropping data from unknown connection '{}'.", connectionId));
		return;
	}

	processPacket(PacketSource{.sessionId = session->sessionId, .connectionId = connectionId, .upstream = false}, data);
}

void PacketDispatcher::onDisconnect(network::ConnectionId connectionId) {
	const auto session = m_sessions.findByConnection(connectionId);
	if (!session) {
		return;
	}
	teardown(session->sessionId);
}

void PacketDispatcher::onUpstreamData(std::string_view data) {
	processPacket(PacketSource{.sessionId = UPSTREAM_SESSION_ID, .connectionId = network::INVALID_CONNECTION, .upstream = true}, data);
}

void PacketDispatcher::teardown(SessionId sessionId) {
	const auto session = m_sessions.remove(sessionId);
	if (!session) {
		return;
	}

	const auto leave = makeLeave(sessionId);
	for (const auto& peer: m_sessions.all()) {
		m_transport.send(peer.connectionId, leave);
	}
	if (m_cluster.hasParent()) {
		m_cluster.sendToParent(leave);
	}

	if (!session->identity.empty()) {
		m_players.remove(session->identity);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Dispatcher] Session {} left.", sessionId));
}

void PacketDispatcher::processPacket(const PacketSource& source, std::string_view data) {
	const auto split = splitFrames(data);

	for (const auto& packet: split.packets) {
		try {
			dispatch(source, packet);
		} catch (const std::exception& e) {
			Logger().Log(Logging::LogLevel::Error,
			             std::format("[Dispatcher] Dropping packet type {} from session {}: {}", packet.type, source.sessionId, e.what()));
		}
	}

	if (split.malformed) {
		Logger().Log(Logging::LogLevel::Warning,
		             std::format("[Dispatcher] Malformed framing from session {}. Ignoring the rest of the read.", source.sessionId));
	}
}

void PacketDispatcher::dispatch(const PacketSource& source, const SubPacket& packet) {
	switch (static_cast<ClientPacket>(packet.type)) {
	case ClientPacket::Id:
		handleIdentity(source, packet.payload);
		break;
	case ClientPacket::Message:
		handleChat(source, packet.payload);
		break;
	case ClientPacket::Email:
		handleEmail(source, packet.payload);
		break;
	case ClientPacket::Upload:
		handleUpload(source, packet.payload);
		break;
	case ClientPacket::MiscData:
		handleMiscData(source, packet.payload);
		break;
	case ClientPacket::Heartbeat:
		handleHeartbeat(source);
		break;
	default:
		if (packet.type == toByte(ClusterPacket::Leave)) {
			handleLeave(source, packet);
		} else {
			handleFieldUpdate(source, packet.type, packet.payload);
		}
		break;
	}
}

void PacketDispatcher::handleIdentity(const PacketSource& source, std::string_view payload) {
	const auto json = sanitize(payload);
	auto state      = parsePlayerState(json);
	if (!state) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Invalid identity packet from session {}.", source.sessionId));
		return;
	}

	// Players of the parent node have no local session to own their record.
	if (source.upstream) {
		broadcastExcept(source, makePlayerObject(source.sessionId, json));
		return;
	}

	// Re-identifying replaces the previous record of this session.
	if (const auto previous = identityOf(source); !previous.empty()) {
		m_players.remove(previous);
	}

	const auto identity = m_players.insertUnique(std::move(*state));
	m_sessions.setIdentity(source.sessionId, identity);
	reply(source, makeAssign(source.sessionId, identity));

	if (const auto stored = m_players.find(identity)) {
		broadcastExcept(source, makePlayerObject(source.sessionId, serialize(*stored)));
	}

	for (const auto& peer: m_sessions.all()) {
		if (peer.sessionId == source.sessionId || peer.identity.empty()) {
			continue;
		}
		if (const auto peerState = m_players.find(peer.identity)) {
			reply(source, makePlayerObject(peer.sessionId, serialize(*peerState)));
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Dispatcher] Session {} identified as '{}'.", source.sessionId, identity));
}

void PacketDispatcher::handleChat(const PacketSource& source, std::string_view payload) {
	broadcastExcept(source, makeChat(sanitize(payload)));
}

void PacketDispatcher::handleEmail(const PacketSource& source, std::string_view payload) {
	const auto identity = identityOf(source);

	std::string name;
	if (const auto state = m_players.find(identity)) {
		name = state->name;
	}

	auto subject = std::format("Bug Report - Player {} #{}", name, identity);
	auto body    = std::format("Bug report:\n\n{}", sanitize(payload));

	if (!m_mail) {
		Logger().Log(Logging::LogLevel::Warning, "[Dispatcher] Bug report received but no mail collaborator is registered.");
		return;
	}

	m_sideChannel.post([mail = m_mail, subject = std::move(subject), body = std::move(body)] { mail->send(subject, body); });
}

void PacketDispatcher::handleUpload(const PacketSource& source, std::string_view payload) {
	const auto json = nlohmann::json::parse(sanitize(payload), nullptr, false);
	if (json.is_discarded() || !json.is_object()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Invalid upload packet from session {}.", source.sessionId));
		return;
	}

	std::string photoId;
	const auto it = json.find("ID");
	if (it != json.end() && it->is_string()) {
		photoId = it->get<std::string>();
	} else if (it != json.end() && it->is_number_integer()) {
		photoId = std::to_string(it->get<std::int64_t>());
	} else {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Upload packet from session {} carries no ID.", source.sessionId));
		return;
	}

	if (!m_persistence) {
		Logger().Log(Logging::LogLevel::Warning, "[Dispatcher] Like received but no persistence collaborator is registered.");
		return;
	}

	m_sideChannel.post([persistence = m_persistence, photoId = std::move(photoId)] { persistence->incrementLikeCounter(photoId); });
}

void PacketDispatcher::handleMiscData(const PacketSource& source, std::string_view payload) {
	const auto json = nlohmann::json::parse(sanitize(payload), nullptr, false);
	if (json.is_discarded()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Invalid misc data from session {}.", source.sessionId));
		return;
	}
	Logger().Log(Logging::LogLevel::Debug, std::format("[Dispatcher] Misc data from session {}: {}", source.sessionId, json.dump()));
}

void PacketDispatcher::handleLeave(const PacketSource& source, const SubPacket& packet) {
	if (source.upstream) {
		return;
	}

	m_transport.close(source.connectionId);
	if (m_cluster.isUnified()) {
		m_cluster.sendToParent(std::string(packet.raw));
	}
}

void PacketDispatcher::handleHeartbeat(const PacketSource& source) {
	reply(source, makeHeartbeat());
}

void PacketDispatcher::handleFieldUpdate(const PacketSource& source, std::uint8_t type, std::string_view payload) {
	const auto identity = identityOf(source);

	network::Message update;
	switch (static_cast<ClientPacket>(type)) {
	case ClientPacket::Pos: {
		const auto position = decodePosition(payload);
		if (!position) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Dispatcher] Short position packet from session {}.", source.sessionId));
			return;
		}
		if (!source.upstream && !m_players.setPosition(identity, *position)) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Dispatcher] Session {} has no player record yet.", source.sessionId));
		}
		update = makePositionUpdate(type, source.sessionId, *position);
		break;
	}
	case ClientPacket::MyRoom:
	case ClientPacket::Outfit:
	case ClientPacket::Name: {
		auto value       = sanitize(payload);
		const auto field = type == toByte(ClientPacket::MyRoom) ? PlayerField::Room
		                    : type == toByte(ClientPacket::Outfit) ? PlayerField::Outfit
		                                                           : PlayerField::Name;
		if (!source.upstream && !m_players.setField(identity, field, value)) {
			Logger().Log(Logging::LogLevel::Debug, std::format("[Dispatcher] Session {} has no player record yet.", source.sessionId));
		}
		update = makeFieldUpdate(type, source.sessionId, value);
		break;
	}
	default:
		if (m_unknownPacketHook) {
			m_unknownPacketHook(source.sessionId, type, payload);
		}
		update = makeFieldUpdate(type, source.sessionId, sanitize(payload));
		break;
	}

	broadcastExcept(source, update);
	if (!source.upstream && m_cluster.isUnified()) {
		m_cluster.sendToParent(update);
	}
}

void PacketDispatcher::reply(const PacketSource& source, const network::Message& message) {
	if (source.upstream) {
		m_cluster.sendToParent(message);
	} else {
		m_transport.send(source.connectionId, message);
	}
}

void PacketDispatcher::broadcastExcept(const PacketSource& source, const network::Message& message) {
	for (const auto& peer: m_sessions.all()) {
		if (!source.upstream && peer.sessionId == source.sessionId) {
			continue;
		}
		m_transport.send(peer.connectionId, message);
	}
}

std::string PacketDispatcher::identityOf(const PacketSource& source) const {
	if (source.upstream) {
		return {};
	}
	const auto session = m_sessions.find(source.sessionId);
	return session ? session->identity : std::string{};
}

} // namespace relay::node
