#pragma once

#include "network/tcpClient.hpp"
#include "network/types.hpp"
#include "node/clusterLink.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace relay {
namespace node {

enum class ClusterState : std::uint8_t {
	Standalone,           //!< No parent configured.
	Connecting,           //!< Connect in progress.
	ConnectedUnknownMode, //!< Announced, waiting for the parent to tell the cluster mode.
	ConnectedIndependent, //!< Parent does not want player updates.
	ConnectedUnified,     //!< Player updates are forwarded to the parent.
	Lost,                 //!< Connect failed or the link dropped. Cluster features stay off.
};

struct ClusterNodeInfo {
	int playerCount{0};
	std::string address;
};

//! Peer node id -> info. Replaced as a whole on every server data packet.
using ClusterView = std::map<std::string, ClusterNodeInfo>;

//! Raw byte pipe to the parent node.
class IUpstreamLink {
public:
	virtual ~IUpstreamLink()                                          = default;
	virtual bool connect(const std::string& host, std::uint16_t port) = 0;
	virtual bool send(const network::Message& message)                = 0;
	virtual std::optional<network::Message> read()                    = 0; //!< Blocks. Empty once the link is gone.
	virtual void disconnect()                                         = 0;
};

class TcpUpstreamLink final : public IUpstreamLink {
public:
	bool connect(const std::string& host, std::uint16_t port) override;
	bool send(const network::Message& message) override;
	std::optional<network::Message> read() override;
	void disconnect() override;

private:
	network::TcpClient m_client;
};

//! Optional connection from this node up to a parent node.
//! Reads are handed out through Callbacks::onData. The owner decides on which thread they are processed:
//! handlePacket() consumes cluster level packets, everything else belongs to the packet dispatcher.
class ClusterRelay : public IClusterLink {
public:
	struct Callbacks {
		std::function<void(network::Message)> onData; //!< Called on the read thread.
		std::function<void()> onLost;                 //!< Called on the read thread once the link dropped.
	};

	explicit ClusterRelay(std::uint16_t listenPort, std::unique_ptr<IUpstreamLink> link = std::make_unique<TcpUpstreamLink>());
	~ClusterRelay() override;

	ClusterRelay(const ClusterRelay&)            = delete;
	ClusterRelay& operator=(const ClusterRelay&) = delete;

	//! Connect, announce this node and start reading. False (and state Lost) on failure.
	bool start(const std::string& host, std::uint16_t port, Callbacks callbacks);
	void stop();

	//! Handle one read from the parent if it is a cluster packet (type at byte 0, no length prefix).
	//! \returns false if the data is meant for the packet dispatcher.
	bool handlePacket(std::string_view data);
	void markLost();

	bool hasParent() const override;
	bool isUnified() const override;
	void sendToParent(const network::Message& message) override;

	ClusterState state() const;
	ClusterView view() const;

private:
	void readLoop();
	void handleType(std::string_view data);
	void handleServerData(std::string_view data);
	void handleMiscData(std::string_view data);

private:
	const std::uint16_t m_listenPort;
	std::unique_ptr<IUpstreamLink> m_link;
	Callbacks m_callbacks;

	std::atomic<ClusterState> m_state{ClusterState::Standalone};
	std::atomic<bool> m_reading{false};
	std::thread m_readThread;

	ClusterView m_view;
	mutable std::mutex m_viewMutex;
};

} // namespace node
} // namespace relay
