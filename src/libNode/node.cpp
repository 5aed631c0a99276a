#include "node/node.hpp"

#include "Logging.hpp"
#include "nodeEvents.hpp"

#include <format>
#include <utility>

namespace relay::node {

Node::Node(NodeConfig config)
    : m_config(std::move(config)), m_sessions(m_config.nodeIndex), m_transport(m_config.port), m_cluster(m_config.port),
      m_dispatcher(m_sessions, m_players, m_transport, m_cluster, m_sideChannel) {
	if (m_config.healthPort != 0) {
		m_health = std::make_unique<network::HealthServer>(m_config.healthPort);
	}

	m_dispatcher.registerPersistence(&m_loggingPersistence);
	m_dispatcher.registerMail(&m_loggingMail);

	// Keep network callbacks thin: they only enqueue events.
	network::Transport::Callbacks callbacks;
	callbacks.onConnect = [this](network::ConnectionId connectionId, network::TransportKind transport, const std::string& remoteAddress) {
		onClientConnected(connectionId, transport, remoteAddress);
	};
	callbacks.onMessage    = [this](network::ConnectionId connectionId, const network::Message& payload) { onClientMessage(connectionId, payload); };
	callbacks.onDisconnect = [this](network::ConnectionId connectionId) { onClientDisconnected(connectionId); };
	m_transport.connect(std::move(callbacks));
}

Node::~Node() {
	stop();
}

bool Node::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	// Node thread first, so no connect event is queued without a consumer.
	m_nodeThread = std::thread(&Node::nodeLoop, this);
	m_sideChannel.start();

	if (!m_transport.start()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Node] Could not start client listeners on ports {} and {}.", m_config.port, m_config.port + 1));
		stop();
		return false;
	}

	if (m_health && !m_health->start()) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Node] Health endpoint on port {} unavailable.", m_config.healthPort));
	}

	if (!m_config.parentHost.empty()) {
		ClusterRelay::Callbacks clusterCallbacks;
		clusterCallbacks.onData = [this](network::Message payload) {
			m_eventQueue.Push(NodeEvent{.type = NodeEventType::UpstreamMessage, .payload = std::move(payload)});
		};
		clusterCallbacks.onLost = [this] { m_eventQueue.Push(NodeEvent{.type = NodeEventType::UpstreamLost}); };
		if (!m_cluster.start(m_config.parentHost, m_config.parentPort, std::move(clusterCallbacks))) {
			Logger().Log(Logging::LogLevel::Warning, "[Node] Serving clients without cluster.");
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Node] Node {} running on port {}.", m_config.nodeIndex, m_config.port));
	return true;
}

void Node::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	m_transport.stop();
	if (m_health) {
		m_health->stop();
	}
	m_cluster.stop();

	// Wake the node loop. Events still queued are processed before it exits.
	m_eventQueue.Push(NodeEvent{.type = NodeEventType::Shutdown});
	m_eventQueue.Release();
	if (m_nodeThread.joinable()) {
		m_nodeThread.join();
	}

	m_sideChannel.stop();
	Logger().Log(Logging::LogLevel::Info, "[Node] Stopped.");
}

void Node::registerPersistence(ISidePersistence* persistence) {
	m_dispatcher.registerPersistence(persistence);
}

void Node::registerMail(ISideMail* mail) {
	m_dispatcher.registerMail(mail);
}

const NodeConfig& Node::config() const {
	return m_config;
}

std::size_t Node::sessionCount() const {
	return m_sessions.size();
}

std::size_t Node::playerCount() const {
	return m_players.size();
}

ClusterState Node::clusterState() const {
	return m_cluster.state();
}

void Node::onClientConnected(network::ConnectionId connectionId, network::TransportKind transport, const std::string& remoteAddress) {
	m_eventQueue.Push(NodeEvent{
	        .type         = NodeEventType::ClientConnected,
	        .connectionId = connectionId,
	        .transport    = transport,
	        .payload      = remoteAddress,
	});
}

void Node::onClientMessage(network::ConnectionId connectionId, const network::Message& payload) {
	m_eventQueue.Push(NodeEvent{.type = NodeEventType::ClientMessage, .connectionId = connectionId, .payload = payload});
}

void Node::onClientDisconnected(network::ConnectionId connectionId) {
	m_eventQueue.Push(NodeEvent{.type = NodeEventType::ClientDisconnected, .connectionId = connectionId});
}

void Node::nodeLoop() {
	Logger().Log(Logging::LogLevel::Info, "[Node] Event loop started.");

	while (true) {
		try {
			const auto event = m_eventQueue.Pop();
			processEvent(event);
		} catch (const QueueReleased&) {
			break;
		}
	}

	Logger().Log(Logging::LogLevel::Info, "[Node] Event loop stopped.");
}

void Node::processEvent(const NodeEvent& event) {
	switch (event.type) {
	case NodeEventType::ClientConnected:
		Logger().Log(Logging::LogLevel::Debug, std::format("[Node] Connection '{}' from {}.", event.connectionId, event.payload));
		m_dispatcher.onConnect(event.connectionId, event.transport);
		break;
	case NodeEventType::ClientMessage:
		m_dispatcher.onData(event.connectionId, event.payload);
		break;
	case NodeEventType::ClientDisconnected:
		m_dispatcher.onDisconnect(event.connectionId);
		break;
	case NodeEventType::UpstreamMessage:
		if (!m_cluster.handlePacket(event.payload)) {
			m_dispatcher.onUpstreamData(event.payload);
		}
		break;
	case NodeEventType::UpstreamLost:
		m_cluster.markLost();
		break;
	case NodeEventType::Shutdown:
		break;
	}
}

} // namespace relay::node
