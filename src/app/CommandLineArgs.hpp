#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace antsim::app {

// Parsed command line for the headless runner.
//
// Notes:
//   - Option names are case-insensitive; values are not.
//   - Both "--opt value" and "--opt=value" are accepted.
//   - Overrides win over the config file.
struct CommandLineArgs {
  bool showHelp = false; // --help / -h
  bool showcase = false; // --showcase

  std::optional<std::string> configPath; // --config <file>
  std::optional<std::string> logDir;     // --log-dir <dir>
  std::optional<std::string> logLevel;   // --log-level <name>

  std::optional<double> seconds;      // --seconds <n> (simulated)
  std::optional<int> ants;            // --ants <n>
  std::optional<int> food;            // --food <n>
  std::optional<float> speed;         // --speed <x>
  std::optional<std::uint64_t> seed;  // --seed <n>

  // Unknown options and options with bad values, in command-line order.
  std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv);
[[nodiscard]] CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace antsim::app
