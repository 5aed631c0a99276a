#pragma once

#include "Logger/Logger.hpp"

namespace relay::network {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace relay::network
