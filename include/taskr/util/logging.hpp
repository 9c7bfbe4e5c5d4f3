#pragma once

#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "taskr/common.hpp"

namespace taskr::util {

// Parse a level name (trace, debug, info, warn, error, off)
Result<spdlog::level::level_enum> parseLogLevel(const std::string& name);

// Install the "taskr" logger as spdlog default: a stderr sink at
// console_level and a rotating file sink in log_dir at debug level.
// Falls back to console only logging when the file sink cannot be created.
void setupLogging(spdlog::level::level_enum console_level, const std::filesystem::path& log_dir,
                  bool color = true);

}  // namespace taskr::util
