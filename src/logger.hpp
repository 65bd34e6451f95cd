#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& server_logger();
log4cplus::Logger& relay_logger();
log4cplus::Logger& rpc_logger();
log4cplus::Logger& host_logger();

/// Locates a logging properties file; std::nullopt when none is readable.
std::optional<std::filesystem::path> find_config_file(const std::string& config_path);

void init_logging(const std::string& config_path);
