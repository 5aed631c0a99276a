#include "core/SafeQueue.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace relay::gtest {

TEST(SafeQueue, KeepsOrder) {
	SafeQueue<int> queue;
	for (int i = 0; i != 5; ++i) {
		EXPECT_TRUE(queue.Push(i));
	}
	EXPECT_FALSE(queue.Empty());

	for (int i = 0; i != 5; ++i) {
		EXPECT_EQ(queue.Pop(), i);
	}
	EXPECT_TRUE(queue.Empty());
}

TEST(SafeQueue, PopWaitsForPush) {
	SafeQueue<int> queue;
	std::thread producer([&] { queue.Push(42); });

	EXPECT_EQ(queue.Pop(), 42);
	producer.join();
}

TEST(SafeQueue, ReleaseDrainsThenThrows) {
	SafeQueue<int> queue;
	queue.Push(1);
	queue.Push(2);
	queue.Release();

	EXPECT_FALSE(queue.Push(3));
	EXPECT_EQ(queue.Pop(), 1);
	EXPECT_EQ(queue.Pop(), 2);
	EXPECT_THROW(queue.Pop(), QueueReleased);
}

TEST(SafeQueue, ReleaseWakesBlockedConsumer) {
	SafeQueue<int> queue;
	bool released = false;
	std::thread consumer([&] {
		try {
			queue.Pop();
		} catch (const QueueReleased&) {
			released = true;
		}
	});

	queue.Release();
	consumer.join();
	EXPECT_TRUE(released);
}

TEST(SafeQueue, ManyProducers) {
	SafeQueue<int> queue;
	std::vector<std::thread> producers;
	for (int p = 0; p != 4; ++p) {
		producers.emplace_back([&] {
			for (int i = 0; i != 100; ++i) {
				queue.Push(1);
			}
		});
	}
	for (auto& producer: producers) {
		producer.join();
	}

	int sum = 0;
	while (!queue.Empty()) {
		sum += queue.Pop();
	}
	EXPECT_EQ(sum, 400);
}

} // namespace relay::gtest
