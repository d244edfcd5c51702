#pragma once

#include <string>
#include <log4cplus/logger.h>

namespace connect4 {

log4cplus::Logger& core_logger();
log4cplus::Logger& service_logger();
log4cplus::Logger& control_logger();
// Loads a log4cplus property file; an empty or missing path configures the
// console at INFO.
void init_logging(const std::string& config_path);

} // namespace connect4
