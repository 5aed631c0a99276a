#include "node/sessionRegistry.hpp"

#include "Logging.hpp"

#include <format>

namespace relay::node {

SessionRegistry::SessionRegistry(std::uint8_t nodeIndex) : m_nodeIndex(nodeIndex) {
}

std::optional<SessionId> SessionRegistry::assign(network::ConnectionId connectionId, network::TransportKind transport) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_connectionToSession.contains(connectionId)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[SessionRegistry] Connection '{}' already has a session.", connectionId));
		return std::nullopt;
	}

	if (m_sessions.size() >= SESSIONS_PER_NODE) {
		Logger().Log(Logging::LogLevel::Error, std::format("[SessionRegistry] Node {} already holds {} sessions. Rejecting connection '{}'.",
		                                                   m_nodeIndex, SESSIONS_PER_NODE, connectionId));
		return std::nullopt;
	}

	// Skip ids still held by long-lived sessions. A free one exists below capacity.
	auto sessionId = static_cast<SessionId>(m_counter + m_nodeIndex * SESSIONS_PER_NODE);
	m_counter      = static_cast<std::uint8_t>(m_counter + 1u);
	while (m_sessions.contains(sessionId)) {
		sessionId = static_cast<SessionId>(m_counter + m_nodeIndex * SESSIONS_PER_NODE);
		m_counter = static_cast<std::uint8_t>(m_counter + 1u);
	}

	m_sessions.emplace(sessionId, Session{.sessionId = sessionId, .connectionId = connectionId, .transport = transport, .identity = {}});
	m_connectionToSession.emplace(connectionId, sessionId);

	if (m_sessions.size() == SESSIONS_PER_NODE) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[SessionRegistry] Node {} reached its capacity of {} sessions.", m_nodeIndex, SESSIONS_PER_NODE));
	}
	return sessionId;
}

std::optional<Session> SessionRegistry::remove(SessionId sessionId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return std::nullopt;
	}

	auto session = std::move(it->second);
	m_connectionToSession.erase(session.connectionId);
	m_sessions.erase(it);
	return session;
}

bool SessionRegistry::setIdentity(SessionId sessionId, const std::string& identity) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return false;
	}
	it->second.identity = identity;
	return true;
}

std::optional<Session> SessionRegistry::find(SessionId sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<Session> SessionRegistry::findByConnection(network::ConnectionId connectionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_connectionToSession.find(connectionId);
	if (it == m_connectionToSession.end()) {
		return std::nullopt;
	}
	return m_sessions.at(it->second);
}

std::vector<Session> SessionRegistry::all() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<Session> sessions;
	sessions.reserve(m_sessions.size());
	for (const auto& [_, session]: m_sessions) {
		sessions.push_back(session);
	}
	return sessions;
}

std::size_t SessionRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

std::uint8_t SessionRegistry::nodeIndex() const {
	return m_nodeIndex;
}

} // namespace relay::node
