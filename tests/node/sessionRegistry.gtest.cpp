#include "node/sessionRegistry.hpp"

#include <gtest/gtest.h>

#include <set>

namespace relay::gtest {

using namespace relay::node;

TEST(SessionRegistry, IdsIncludeNodeIndex) {
	SessionRegistry registry(2u);
	EXPECT_EQ(registry.assign(10u, network::TransportKind::Stream), SessionId{512u});
	EXPECT_EQ(registry.assign(11u, network::TransportKind::Message), SessionId{513u});
	EXPECT_EQ(registry.nodeIndex(), 2u);

	const auto session = registry.findByConnection(11u);
	ASSERT_TRUE(session.has_value());
	EXPECT_EQ(session->sessionId, 513u);
	EXPECT_EQ(session->transport, network::TransportKind::Message);
	EXPECT_TRUE(session->identity.empty());
}

TEST(SessionRegistry, CounterRollsOver) {
	SessionRegistry registry;
	std::set<SessionId> ids;
	for (network::ConnectionId id = 1u; id <= SESSIONS_PER_NODE; ++id) {
		const auto sessionId = registry.assign(id, network::TransportKind::Stream);
		ASSERT_TRUE(sessionId.has_value());
		ids.insert(*sessionId);
	}
	EXPECT_EQ(ids.size(), SESSIONS_PER_NODE);
	EXPECT_EQ(*ids.rbegin(), 255u);

	// Full: no id left.
	EXPECT_FALSE(registry.assign(1000u, network::TransportKind::Stream).has_value());

	registry.remove(1u);
	EXPECT_EQ(registry.assign(1001u, network::TransportKind::Stream), SessionId{1u});
}

TEST(SessionRegistry, CounterSkipsLiveIds) {
	SessionRegistry registry(1u);
	const auto kept = registry.assign(1u, network::TransportKind::Stream);
	ASSERT_EQ(kept, SessionId{256u});

	// Churn until the counter wraps back onto the kept id.
	for (network::ConnectionId id = 2u; id <= SESSIONS_PER_NODE; ++id) {
		const auto sessionId = registry.assign(id, network::TransportKind::Stream);
		ASSERT_TRUE(sessionId.has_value());
		registry.remove(*sessionId);
	}

	EXPECT_EQ(registry.assign(1000u, network::TransportKind::Stream), SessionId{257u});
	EXPECT_EQ(registry.size(), 2u);
	EXPECT_EQ(registry.find(256u)->connectionId, 1u);
}

TEST(SessionRegistry, RemoveIsIdempotent) {
	SessionRegistry registry;
	const auto sessionId = registry.assign(5u, network::TransportKind::Stream);
	ASSERT_TRUE(sessionId.has_value());

	const auto removed = registry.remove(*sessionId);
	ASSERT_TRUE(removed.has_value());
	EXPECT_EQ(removed->connectionId, 5u);
	EXPECT_FALSE(registry.remove(*sessionId).has_value());
	EXPECT_FALSE(registry.findByConnection(5u).has_value());
	EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, ConnectionGetsOneSession) {
	SessionRegistry registry;
	EXPECT_TRUE(registry.assign(5u, network::TransportKind::Stream).has_value());
	EXPECT_FALSE(registry.assign(5u, network::TransportKind::Stream).has_value());
	EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, IdentityAndSnapshot) {
	SessionRegistry registry;
	const auto first  = *registry.assign(1u, network::TransportKind::Stream);
	const auto second = *registry.assign(2u, network::TransportKind::Message);

	EXPECT_TRUE(registry.setIdentity(first, "alice"));
	EXPECT_FALSE(registry.setIdentity(99u, "nobody"));

	auto snapshot = registry.all();
	registry.remove(second);

	EXPECT_EQ(snapshot.size(), 2u);
	EXPECT_EQ(registry.all().size(), 1u);
	EXPECT_EQ(registry.find(first)->identity, "alice");
}

} // namespace relay::gtest
