#include "Logging.hpp"

#include "core/logSetup.hpp"

#include <mutex>

namespace relay::network {

static Logging::LogConfig config;

Logging::Logger Logger() {
	static std::once_flag logInitFlag;
	std::call_once(logInitFlag, [] { setupLogConfig(config, "Relay/Network"); });

	return Logging::Logger(config);
}

} // namespace relay::network
