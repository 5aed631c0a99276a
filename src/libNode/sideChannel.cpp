#include "node/sideChannel.hpp"

#include "Logging.hpp"

#include <exception>
#include <format>
#include <utility>

namespace relay::node {

static void runJob(const SideChannelWorker::Job& job) {
	try {
		job();
	} catch (const std::exception& e) {
		Logger().Log(Logging::LogLevel::Error, std::format("[SideChannel] Job failed: {}", e.what()));
	}
}

void LoggingPersistence::incrementLikeCounter(const std::string& photoId) {
	Logger().Log(Logging::LogLevel::Info, std::format("[SideChannel] No persistence configured. Like for photo '{}' not stored.", photoId));
}

void LoggingMail::send(const std::string& subject, const std::string& body) {
	Logger().Log(Logging::LogLevel::Info, std::format("[SideChannel] No mail configured. Dropping mail '{}' ({} bytes).", subject, body.size()));
}


SideChannelWorker::~SideChannelWorker() {
	stop();
}

void SideChannelWorker::start() {
	if (m_running.exchange(true)) {
		return;
	}
	m_thread = std::thread([this] { workerLoop(); });
}

void SideChannelWorker::stop() {
	if (!m_running.exchange(false)) {
		return;
	}
	m_jobs.Release();
	if (m_thread.joinable()) {
		m_thread.join();
	}
}

void SideChannelWorker::post(Job job) {
	if (!m_running) {
		runJob(job);
		return;
	}
	if (!m_jobs.Push(std::move(job))) {
		Logger().Log(Logging::LogLevel::Warning, "[SideChannel] Worker stopped; job dropped.");
	}
}

void SideChannelWorker::workerLoop() {
	while (true) {
		try {
			const auto job = m_jobs.Pop();
			runJob(job);
		} catch (const QueueReleased&) {
			break;
		}
	}
}

} // namespace relay::node
