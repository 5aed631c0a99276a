#include "mocks.hpp"

#include "node/sideChannel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace relay::gtest {

TEST(SideChannel, RunsInlineWhenStopped) {
	node::SideChannelWorker worker;
	bool ran = false;
	worker.post([&] { ran = true; });
	EXPECT_TRUE(ran);
}

TEST(SideChannel, WorkerRunsJobsOffThread) {
	MockMail mail;
	std::atomic<int> jobs{0};
	std::thread::id workerThread;
	{
		node::SideChannelWorker worker;
		worker.start();
		worker.post([&] {
			workerThread = std::this_thread::get_id();
			mail.send("subject", "body");
			++jobs;
		});
		worker.post([&] { ++jobs; });
		worker.stop(); // Drains queued jobs before joining.
	}

	EXPECT_EQ(jobs, 2);
	EXPECT_NE(workerThread, std::this_thread::get_id());
	ASSERT_EQ(mail.mails.size(), 1u);
	EXPECT_EQ(mail.mails[0].first, "subject");
}

TEST(SideChannel, FailingJobDoesNotStopWorker) {
	std::atomic<int> jobs{0};
	node::SideChannelWorker worker;
	worker.start();
	worker.post([] { throw std::runtime_error("mail server down"); });
	worker.post([&] { ++jobs; });
	worker.stop();

	EXPECT_EQ(jobs, 1);
}

TEST(SideChannel, LoggingCollaboratorsAcceptCalls) {
	node::LoggingMail mail;
	node::LoggingPersistence persistence;
	EXPECT_NO_THROW(mail.send("subject", "body"));
	EXPECT_NO_THROW(persistence.incrementLikeCounter("photo"));
}

} // namespace relay::gtest
