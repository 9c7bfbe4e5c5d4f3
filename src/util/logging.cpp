#include "taskr/util/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace taskr::util {

Result<spdlog::level::level_enum> parseLogLevel(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "trace") return spdlog::level::trace;
  if (lower == "debug") return spdlog::level::debug;
  if (lower == "info") return spdlog::level::info;
  if (lower == "warn" || lower == "warning") return spdlog::level::warn;
  if (lower == "error") return spdlog::level::err;
  if (lower == "critical") return spdlog::level::critical;
  if (lower == "off") return spdlog::level::off;

  return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown log level: " + name));
}

void setupLogging(spdlog::level::level_enum console_level, const std::filesystem::path& log_dir,
                  bool color) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(
      color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
  console_sink->set_level(console_level);

  std::vector<spdlog::sink_ptr> sinks = {console_sink};

  try {
    std::filesystem::create_directories(log_dir);
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (log_dir / "taskr.log").string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
    file_sink->set_level(spdlog::level::debug);
    sinks.push_back(file_sink);
  } catch (const std::exception& e) {
    // Console only; reported once the logger exists
    auto logger = std::make_shared<spdlog::logger>("taskr", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(console_level);
    spdlog::set_default_logger(logger);
    spdlog::warn("Failed to setup file logging: {}", e.what());
    return;
  }

  auto logger = std::make_shared<spdlog::logger>("taskr", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(std::min(console_level, spdlog::level::debug));
  spdlog::set_default_logger(logger);
}

}  // namespace taskr::util
