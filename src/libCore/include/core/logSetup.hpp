#pragma once

#include "Logger/LogConfig.hpp"

#include <string_view>

namespace relay {

//! Enable logging of any entries to <default log dir>/<component>/log.txt + console (for debug builds).
void setupLogConfig(Logging::LogConfig& config, std::string_view component);

} // namespace relay
