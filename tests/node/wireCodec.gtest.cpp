#include "node/packetTypes.hpp"
#include "node/wireCodec.hpp"

#include <gtest/gtest.h>

#include <string>

namespace relay::gtest {

using namespace relay::node;

TEST(WireCodec, SplitsBackToBackFrames) {
	const auto first  = encodeFrame(toByte(ClientPacket::Message), "hello");
	const auto second = encodeFrame(toByte(ClientPacket::Heartbeat), "");
	const auto third  = encodeFrame(toByte(ClientPacket::Name), "bob");
	const auto data   = first + second + third;

	const auto split = splitFrames(data);
	EXPECT_FALSE(split.malformed);
	ASSERT_EQ(split.packets.size(), 3u);

	EXPECT_EQ(split.packets[0].type, toByte(ClientPacket::Message));
	EXPECT_EQ(split.packets[0].payload, "hello");
	EXPECT_EQ(split.packets[0].raw, first);
	EXPECT_EQ(split.packets[1].type, toByte(ClientPacket::Heartbeat));
	EXPECT_TRUE(split.packets[1].payload.empty());
	EXPECT_EQ(split.packets[2].payload, "bob");
}

TEST(WireCodec, FrameLengthCountsHeader) {
	const auto frame = encodeFrame(25u, "abcd");
	ASSERT_EQ(frame.size(), 7u);
	EXPECT_EQ(static_cast<std::uint8_t>(frame[0]), 7u);
	EXPECT_EQ(static_cast<std::uint8_t>(frame[1]), 0u);
	EXPECT_EQ(static_cast<std::uint8_t>(frame[2]), 25u);
}

TEST(WireCodec, MalformedFraming) {
	// Length shorter than the header.
	{
		const auto data  = encodeFrame(29u, "") + std::string("\x01\x00\x1d", 3);
		const auto split = splitFrames(data);
		EXPECT_TRUE(split.malformed);
		EXPECT_EQ(split.packets.size(), 1u);
	}
	// Length past the end of the read.
	{
		const auto data  = std::string("\x10\x00\x19", 3) + "abc";
		const auto split = splitFrames(data);
		EXPECT_TRUE(split.malformed);
		EXPECT_TRUE(split.packets.empty());
	}
	// Trailing bytes that do not make a header.
	{
		const auto data  = encodeFrame(29u, "") + std::string("\x05", 1);
		const auto split = splitFrames(data);
		EXPECT_TRUE(split.malformed);
		EXPECT_EQ(split.packets.size(), 1u);
	}
	// Negative length.
	{
		const auto split = splitFrames(std::string("\xff\xff\x19", 3));
		EXPECT_TRUE(split.malformed);
		EXPECT_TRUE(split.packets.empty());
	}
}

TEST(WireCodec, EmptyReadIsNotMalformed) {
	const auto split = splitFrames("");
	EXPECT_FALSE(split.malformed);
	EXPECT_TRUE(split.packets.empty());
}

TEST(WireCodec, Sanitize) {
	EXPECT_EQ(sanitize("plain"), "plain");
	EXPECT_EQ(sanitize(std::string("a\0b\0\0c", 6)), "abc");
	EXPECT_EQ(sanitize("\x05name"), "name");
	EXPECT_EQ(sanitize("\x05na\x05me"), "na\x05me");
	EXPECT_EQ(sanitize(std::string("\0\x05x\0", 4)), "x");
}

TEST(WireCodec, DecodePosition) {
	const std::string payload{'\x64', '\x00', '\xce', '\xff', '\x02'};
	const auto position = decodePosition(payload);
	ASSERT_TRUE(position.has_value());
	EXPECT_EQ(position->x, 100);
	EXPECT_EQ(position->y, -50);
	EXPECT_EQ(position->facing, 2u);

	EXPECT_FALSE(decodePosition("\x01\x02\x03\x04").has_value());
}

TEST(WireCodec, OutboundLayouts) {
	const auto assign = makeAssign(0x0102, "uid-1");
	ASSERT_EQ(assign.size(), SMALL_PACKET_BYTES);
	EXPECT_EQ(assign[0], '\x01');
	EXPECT_EQ(assign[1], '\x02');
	EXPECT_EQ(assign[2], '\x01');
	EXPECT_EQ(assign.substr(3, 5), "uid-1");
	EXPECT_EQ(assign[8], '\0');

	const auto chat = makeChat("hi");
	ASSERT_EQ(chat.size(), LARGE_PACKET_BYTES);
	EXPECT_EQ(chat.substr(0, 4), std::string("\x02hi\0", 4));

	const auto leave = makeLeave(300);
	ASSERT_EQ(leave.size(), SMALL_PACKET_BYTES);
	EXPECT_EQ(leave.substr(0, 3), std::string("\x08\x2c\x01", 3));

	const auto object = makePlayerObject(0x0105, "{}");
	ASSERT_EQ(object.size(), LARGE_PACKET_BYTES);
	EXPECT_EQ(object.substr(0, 4), std::string("\x09\x05{}", 4));

	const auto heartbeat = makeHeartbeat();
	ASSERT_EQ(heartbeat.size(), SMALL_PACKET_BYTES);
	EXPECT_EQ(heartbeat[0], '\x0a');

	const auto position = makePositionUpdate(21u, 3u, Position{.x = 100, .y = -50, .facing = 2});
	EXPECT_EQ(position.substr(0, 8), std::string("\x15\x03\x00\x64\x00\xce\xff\x02", 8));

	const auto field = makeFieldUpdate(24u, 3u, "name");
	EXPECT_EQ(field.substr(0, 8), std::string("\x18\x03\x00name\0", 8));
}

TEST(WireCodec, ClusterLayouts) {
	const auto count = makeClusterCount(3u);
	ASSERT_EQ(count.size(), SMALL_PACKET_BYTES);
	EXPECT_EQ(count.substr(0, 2), std::string("\x28\x03", 2));
	EXPECT_EQ(static_cast<std::uint8_t>(makeClusterCount(1000u)[1]), 255u);

	const auto announce = makeClusterAnnounce(63456u);
	ASSERT_EQ(announce.size(), SMALL_PACKET_BYTES);
	EXPECT_EQ(announce.substr(0, 4), std::string("\x2b\x01\xe0\xf7", 4));
}

TEST(WireCodec, StringsAreTruncated) {
	const std::string longText(10000u, 'x');
	const auto chat = makeChat(longText);
	ASSERT_EQ(chat.size(), LARGE_PACKET_BYTES);
	EXPECT_EQ(chat.substr(1), std::string(LARGE_PACKET_BYTES - 1u, 'x'));

	const auto assign = makeAssign(1u, longText);
	EXPECT_EQ(assign.size(), SMALL_PACKET_BYTES);
}

} // namespace relay::gtest
