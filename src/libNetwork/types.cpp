#include "network/types.hpp"

#include <atomic>

namespace relay::network {

static std::atomic<ConnectionId> s_nextConnectionId{1u};

ConnectionId nextConnectionId() {
	auto id = s_nextConnectionId.fetch_add(1u);
	if (id == INVALID_CONNECTION) {
		id = s_nextConnectionId.fetch_add(1u);
	}
	return id;
}

} // namespace relay::network
