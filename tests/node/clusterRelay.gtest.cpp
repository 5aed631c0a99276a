#include "mocks.hpp"

#include "node/clusterRelay.hpp"
#include "node/packetTypes.hpp"
#include "node/wireCodec.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>

namespace relay::gtest {

using node::ClusterState;

class ClusterRelay : public ::testing::Test {
protected:
	ClusterRelay() {
		auto link = std::make_unique<MockUpstreamLink>();
		m_link    = link.get();
		m_relay   = std::make_unique<node::ClusterRelay>(PORT, std::move(link));
	}

	static constexpr std::uint16_t PORT = 63456u;

	MockUpstreamLink* m_link{nullptr}; //!< Owned by m_relay.
	std::unique_ptr<node::ClusterRelay> m_relay;
};

TEST_F(ClusterRelay, StartsStandalone) {
	EXPECT_EQ(m_relay->state(), ClusterState::Standalone);
	EXPECT_FALSE(m_relay->hasParent());
	EXPECT_FALSE(m_relay->isUnified());

	m_relay->sendToParent("ignored");
	EXPECT_TRUE(m_link->sentMessages().empty());
}

TEST_F(ClusterRelay, AnnouncesOnConnect) {
	ASSERT_TRUE(m_relay->start("parent", 63458u, {}));

	EXPECT_EQ(m_relay->state(), ClusterState::ConnectedUnknownMode);
	EXPECT_TRUE(m_relay->hasParent());
	EXPECT_FALSE(m_relay->isUnified());

	const auto sent = m_link->sentMessages();
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0], node::makeClusterAnnounce(PORT));
}

TEST_F(ClusterRelay, FailedConnectIsLost) {
	m_link->acceptConnect = false;

	EXPECT_FALSE(m_relay->start("parent", 63458u, {}));
	EXPECT_EQ(m_relay->state(), ClusterState::Lost);
	EXPECT_FALSE(m_relay->hasParent());
}

TEST_F(ClusterRelay, FailedAnnounceIsLost) {
	m_link->acceptSend = false;

	EXPECT_FALSE(m_relay->start("parent", 63458u, {}));
	EXPECT_EQ(m_relay->state(), ClusterState::Lost);
}

TEST_F(ClusterRelay, UnifiedMode) {
	ASSERT_TRUE(m_relay->start("parent", 63458u, {}));

	EXPECT_TRUE(m_relay->handlePacket(std::string("\x2b\x01", 2)));
	EXPECT_EQ(m_relay->state(), ClusterState::ConnectedUnified);
	EXPECT_TRUE(m_relay->isUnified());

	// Mode is negotiated once.
	EXPECT_TRUE(m_relay->handlePacket(std::string("\x2b\x00", 2)));
	EXPECT_EQ(m_relay->state(), ClusterState::ConnectedUnified);

	m_relay->sendToParent("update");
	EXPECT_EQ(m_link->sentMessages().back(), "update");
}

TEST_F(ClusterRelay, IndependentMode) {
	ASSERT_TRUE(m_relay->start("parent", 63458u, {}));

	EXPECT_TRUE(m_relay->handlePacket(std::string("\x2b\x00", 2)));
	EXPECT_EQ(m_relay->state(), ClusterState::ConnectedIndependent);
	EXPECT_TRUE(m_relay->hasParent());
	EXPECT_FALSE(m_relay->isUnified());
}

TEST_F(ClusterRelay, ServerDataReplacesView) {
	ASSERT_TRUE(m_relay->start("parent", 63458u, {}));

	EXPECT_TRUE(m_relay->handlePacket("\x2c" R"({"a":{"count":3,"address":"10.0.0.2:63456"},"b":{"count":1},"bad":5})"));
	auto view = m_relay->view();
	ASSERT_EQ(view.size(), 2u);
	EXPECT_EQ(view["a"].playerCount, 3);
	EXPECT_EQ(view["a"].address, "10.0.0.2:63456");
	EXPECT_EQ(view["b"].playerCount, 1);
	EXPECT_TRUE(view["b"].address.empty());

	EXPECT_TRUE(m_relay->handlePacket("\x2c" R"({"c":{"count":9,"address":"x"}})"));
	view = m_relay->view();
	ASSERT_EQ(view.size(), 1u);
	EXPECT_EQ(view.begin()->first, "c");

	// Broken JSON keeps the last view.
	EXPECT_TRUE(m_relay->handlePacket("\x2c{"));
	EXPECT_EQ(m_relay->view().size(), 1u);
}

TEST_F(ClusterRelay, OtherPacketsBelongToDispatcher) {
	EXPECT_TRUE(m_relay->handlePacket("\x2a{}"));
	EXPECT_FALSE(m_relay->handlePacket(node::encodeFrame(node::toByte(node::ClientPacket::Message), "hi")));
	EXPECT_FALSE(m_relay->handlePacket("\x19"));
}

TEST_F(ClusterRelay, ReadsAreHandedOut) {
	std::promise<network::Message> received;
	node::ClusterRelay::Callbacks callbacks;
	callbacks.onData = [&](network::Message data) { received.set_value(std::move(data)); };
	ASSERT_TRUE(m_relay->start("parent", 63458u, std::move(callbacks)));

	m_link->feed("from parent");

	auto future = received.get_future();
	ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
	EXPECT_EQ(future.get(), "from parent");
}

TEST_F(ClusterRelay, LostLinkDisablesCluster) {
	std::promise<void> lost;
	node::ClusterRelay::Callbacks callbacks;
	callbacks.onLost = [&] { lost.set_value(); };
	ASSERT_TRUE(m_relay->start("parent", 63458u, std::move(callbacks)));
	ASSERT_TRUE(m_relay->handlePacket(std::string("\x2b\x01", 2)));

	m_link->disconnect(); // Parent went away.

	auto future = lost.get_future();
	ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);

	m_relay->markLost();
	EXPECT_EQ(m_relay->state(), ClusterState::Lost);
	EXPECT_FALSE(m_relay->hasParent());
	EXPECT_FALSE(m_relay->isUnified());

	const auto sentBefore = m_link->sentMessages().size();
	m_relay->sendToParent("dropped");
	EXPECT_EQ(m_link->sentMessages().size(), sentBefore);
}

TEST_F(ClusterRelay, FailedSendIsLost) {
	ASSERT_TRUE(m_relay->start("parent", 63458u, {}));

	m_link->acceptSend = false;
	m_relay->sendToParent("update");

	EXPECT_EQ(m_relay->state(), ClusterState::Lost);
}

} // namespace relay::gtest
