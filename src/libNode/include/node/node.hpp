#pragma once

#include "core/SafeQueue.hpp"
#include "network/healthServer.hpp"
#include "network/transport.hpp"
#include "node/clusterRelay.hpp"
#include "node/config.hpp"
#include "node/dispatcher.hpp"
#include "node/playerStore.hpp"
#include "node/sessionRegistry.hpp"
#include "node/sideChannel.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace relay {
namespace node {

struct NodeEvent;

//! One relay node.
//! - Network layer: Transport and the parent link only push events into the node queue.
//! - Node thread  : Drains the queue in order and runs the packet dispatcher.
class Node {
public:
	explicit Node(NodeConfig config = {});
	~Node();

	Node(const Node&)            = delete;
	Node& operator=(const Node&) = delete;

	//! Boot listeners, side-channel worker, parent link and the node thread.
	//! \returns false if a client listener could not be bound. The node is not running then.
	bool start();
	void stop(); //!< Stop listeners and the parent link, then drain and stop the node thread.

	//! Replace the logging collaborators. Call before start.
	void registerPersistence(ISidePersistence* persistence);
	void registerMail(ISideMail* mail);

	const NodeConfig& config() const;
	std::size_t sessionCount() const;
	std::size_t playerCount() const;
	ClusterState clusterState() const;

private:
	// Network callbacks (run on network threads) just enqueue events.
	void onClientConnected(network::ConnectionId connectionId, network::TransportKind transport, const std::string& remoteAddress);
	void onClientMessage(network::ConnectionId connectionId, const network::Message& payload);
	void onClientDisconnected(network::ConnectionId connectionId);

	void nodeLoop();                           //!< Node thread: drain queue and act.
	void processEvent(const NodeEvent& event); //!< Reads event type and distributes.

private:
	NodeConfig m_config;
	std::atomic<bool> m_isRunning{false};

	SessionRegistry m_sessions;
	PlayerStore m_players;

	LoggingPersistence m_loggingPersistence;
	LoggingMail m_loggingMail;
	SideChannelWorker m_sideChannel;

	network::Transport m_transport;
	std::unique_ptr<network::HealthServer> m_health; //!< Null when disabled.
	ClusterRelay m_cluster;
	PacketDispatcher m_dispatcher;

	SafeQueue<NodeEvent> m_eventQueue; //!< Event queue between network threads and node thread.
	std::thread m_nodeThread;
};

} // namespace node
} // namespace relay
