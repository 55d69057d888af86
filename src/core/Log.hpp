#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace antsim::core {

// Installs the default "antsim" logger: colour console, plus a rotating file
// (1 MiB x 4) under `logDir` when it is not empty. Safe to call more than once.
void LogInit(const std::filesystem::path& logDir = {},
             spdlog::level::level_enum level = spdlog::level::info);

// Flushes and drops every registered logger.
void LogShutdown();

// "trace".."critical" and "off"; anything else gives `fallback`.
[[nodiscard]] spdlog::level::level_enum ParseLogLevel(std::string_view name,
                                                      spdlog::level::level_enum fallback = spdlog::level::info);

} // namespace antsim::core
