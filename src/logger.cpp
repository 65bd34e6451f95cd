#include "logger.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>
#include <vector>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/layout.h>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("modelbridge"));
	return logger;
}

log4cplus::Logger& server_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("modelbridge.server"));
	return logger;
}

log4cplus::Logger& relay_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("modelbridge.relay"));
	return logger;
}

log4cplus::Logger& rpc_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("modelbridge.rpc"));
	return logger;
}

log4cplus::Logger& host_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("modelbridge.host"));
	return logger;
}

// Relative paths are tried against the working directory, then next to the executable.
std::optional<std::filesystem::path> find_config_file(const std::string& config_path) {
	std::filesystem::path path(config_path);
	std::error_code ec;

	if (path.is_absolute()) {
		if (std::filesystem::is_regular_file(path, ec)) {
			return path;
		}
		return std::nullopt;
	}

	std::vector<std::filesystem::path> bases;
	bases.push_back(std::filesystem::current_path(ec));
	std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
	if (!ec) {
		bases.push_back(exe.parent_path());
	}

	for (const auto& base : bases) {
		std::filesystem::path candidate = base / path;
		if (std::filesystem::is_regular_file(candidate, ec)) {
			return candidate;
		}
	}
	return std::nullopt;
}

void init_logging(const std::string& config_path) {
	try {
		if (auto found = find_config_file(config_path)) {
			std::filesystem::create_directories("logs");
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(found->string()));
			return;
		}
	} catch (const std::exception& e) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(e.what())));
	}

	// stdout belongs to the JSON-RPC channel, so the fallback logs to stderr
	log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
	appender->setName(LOG4CPLUS_TEXT("stderr"));
	appender->setLayout(std::unique_ptr<log4cplus::Layout>(
		new log4cplus::PatternLayout(LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S.%q} [%t] %-5p %c - %m%n"))));

	log4cplus::Logger root = log4cplus::Logger::getRoot();
	root.removeAllAppenders();
	root.addAppender(appender);
	root.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}
