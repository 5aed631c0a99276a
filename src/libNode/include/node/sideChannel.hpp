#pragma once

#include "core/SafeQueue.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace relay::node {

//! Persistence collaborator behind the "like a shared photo" feature.
//! \note Called on the side-channel worker thread. May throw; failures are logged and dropped.
class ISidePersistence {
public:
	virtual ~ISidePersistence()                                 = default;
	virtual void incrementLikeCounter(const std::string& photoId) = 0;
};

//! Outbound mail collaborator behind bug reports.
//! \note Called on the side-channel worker thread. May throw; failures are logged and dropped.
class ISideMail {
public:
	virtual ~ISideMail()                                                  = default;
	virtual void send(const std::string& subject, const std::string& body) = 0;
};

//! Used when no database is configured: records the request in the log.
class LoggingPersistence final : public ISidePersistence {
public:
	void incrementLikeCounter(const std::string& photoId) override;
};

//! Used when no mail account is configured: records the mail in the log.
class LoggingMail final : public ISideMail {
public:
	void send(const std::string& subject, const std::string& body) override;
};

//! Runs side-channel jobs off the packet processing thread, fire-and-forget.
class SideChannelWorker {
public:
	using Job = std::function<void()>;

	SideChannelWorker() = default;
	~SideChannelWorker();

	SideChannelWorker(const SideChannelWorker&)            = delete;
	SideChannelWorker& operator=(const SideChannelWorker&) = delete;

	void start();
	void stop(); //!< Runs the jobs still queued, then joins.

	//! Queue a job. Runs it inline while the worker is not running.
	void post(Job job);

private:
	void workerLoop();

private:
	SafeQueue<Job> m_jobs;
	std::thread m_thread;
	std::atomic<bool> m_running{false};
};

} // namespace relay::node
