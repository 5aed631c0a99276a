#pragma once

#include "network/types.hpp"

namespace relay::node {

// Events flowing from network threads into the node thread.
enum class NodeEventType { ClientConnected, ClientDisconnected, ClientMessage, UpstreamMessage, UpstreamLost, Shutdown };

struct NodeEvent {
	NodeEventType type{};
	network::ConnectionId connectionId{network::INVALID_CONNECTION};
	network::TransportKind transport{network::TransportKind::Stream};
	network::Message payload{}; //!< Raw bytes of one read. Holds the remote address for ClientConnected.
};

} // namespace relay::node
