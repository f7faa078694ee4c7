#pragma once

#include "Logger/Logger.hpp"

namespace maze::console {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace maze::console
