#include "core/Log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace antsim::core {

namespace {

constexpr const char* kLoggerName = "antsim";
constexpr std::size_t kMaxFileBytes = 1u << 20; // 1MB * 4
constexpr std::size_t kMaxFiles = 4;

void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level) {
  spdlog::set_default_logger(logger);
  spdlog::set_level(level);
  spdlog::flush_on(spdlog::level::warn);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace

void LogInit(const fs::path& logDir, spdlog::level::level_enum level) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  fs::path file;
  if (!logDir.empty()) {
    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (!ec) {
      file = logDir / "antsim.log";
      try {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file.string(), kMaxFileBytes, kMaxFiles));
      } catch (const spdlog::spdlog_ex&) {
        file.clear();
      }
    }
  }

  // Replacing the default logger drops the previous "antsim" from the registry.
  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  configure_default_logger(logger, level);

  if (!logDir.empty() && file.empty()) {
    spdlog::warn("Logging: could not open a log file under {}", logDir.string());
  } else if (!file.empty()) {
    spdlog::info("Logging started at {}", file.string());
  }
}

void LogShutdown() {
  if (auto logger = spdlog::default_logger()) logger->flush();
  spdlog::shutdown();
}

spdlog::level::level_enum ParseLogLevel(std::string_view name, spdlog::level::level_enum fallback) {
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "off") return spdlog::level::off;

  // from_str answers "off" for names it does not know.
  const auto level = spdlog::level::from_str(std::string(name));
  return level == spdlog::level::off ? fallback : level;
}

} // namespace antsim::core
