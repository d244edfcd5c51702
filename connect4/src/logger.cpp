#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

namespace connect4 {

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("connect4"));
	return logger;
}

log4cplus::Logger& service_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("connect4.service"));
	return logger;
}

log4cplus::Logger& control_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("connect4.control"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}
	return std::filesystem::current_path() / path;
}

void init_logging(const std::string& config_path) {
	std::error_code ec;
	auto resolved = resolve_config_path(config_path);
	if (!config_path.empty() && std::filesystem::is_regular_file(resolved, ec)) {
		std::filesystem::create_directories("logs", ec);
		if (ec) {
			log4cplus::helpers::LogLog::getLogLog()->warn(
				LOG4CPLUS_TEXT("Cannot create logs directory: ") + LOG4CPLUS_STRING_TO_TSTRING(ec.message()));
		}
		log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
		return;
	}

	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

} // namespace connect4
