#include "app/CommandLineArgs.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <system_error>

namespace antsim::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// "--opt=value": splits the name off; nullopt when there is no '='.
[[nodiscard]] std::optional<std::string_view> InlineValue(std::string_view raw, std::string_view name) {
  if (raw.size() <= name.size() || raw[name.size()] != '=') return std::nullopt;
  if (ToLower(raw.substr(0, name.size())) != name) return std::nullopt;
  return raw.substr(name.size() + 1);
}

template <class Int>
[[nodiscard]] std::optional<Int> ParseInteger(std::string_view s) {
  if (s.empty()) return std::nullopt;
  if (s.front() == '+') s.remove_prefix(1);
  Int v{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

[[nodiscard]] std::optional<double> ParseReal(std::string_view s) {
  if (s.empty()) return std::nullopt;
  const std::string copy(s);
  char* end = nullptr;
  const double v = std::strtod(copy.c_str(), &end);
  if (end != copy.c_str() + copy.size() || !std::isfinite(v)) return std::nullopt;
  return v;
}

[[nodiscard]] std::optional<int> ParseCount(std::string_view s) {
  const auto v = ParseInteger<int>(s);
  if (!v || *v < 0) return std::nullopt;
  return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(std::span<const std::string_view> argv) {
  CommandLineArgs out;
  if (argv.size() <= 1) return out;

  for (std::size_t i = 1; i < argv.size(); ++i) {
    const std::string_view raw = argv[i];
    if (raw.empty()) continue;

    const std::string lowered = ToLower(raw);
    const std::string_view arg(lowered);

    if (arg == "--help" || arg == "-h" || arg == "-?") {
      out.showHelp = true;
      continue;
    }
    if (arg == "--showcase") {
      out.showcase = true;
      continue;
    }

    // Options with values: "--opt value" or "--opt=value".
    // `parse` returns false on a bad value.
    const auto option = [&](std::string_view name, auto&& parse) -> bool {
      if (arg == name) {
        // A bad value is consumed along with its option.
        if (i + 1 >= argv.size() || !parse(argv[++i])) out.unknown.emplace_back(raw);
        return true;
      }
      if (StartsWith(arg, name)) {
        if (const auto v = InlineValue(raw, name)) {
          if (!parse(*v)) out.unknown.emplace_back(raw);
          return true;
        }
      }
      return false;
    };

    const auto text = [](std::optional<std::string>& dst) {
      return [&dst](std::string_view v) {
        if (v.empty()) return false;
        dst = std::string(v);
        return true;
      };
    };
    const auto count = [](std::optional<int>& dst) {
      return [&dst](std::string_view v) {
        dst = ParseCount(v);
        return dst.has_value();
      };
    };

    if (option("--config", text(out.configPath))) continue;
    if (option("--log-dir", text(out.logDir))) continue;
    if (option("--log-level", text(out.logLevel))) continue;
    if (option("--ants", count(out.ants))) continue;
    if (option("--food", count(out.food))) continue;

    if (option("--seconds", [&](std::string_view v) {
          const auto s = ParseReal(v);
          if (!s || *s < 0.0) return false;
          out.seconds = *s;
          return true;
        }))
      continue;

    if (option("--speed", [&](std::string_view v) {
          const auto s = ParseReal(v);
          if (!s || *s <= 0.0) return false;
          out.speed = static_cast<float>(*s);
          return true;
        }))
      continue;

    if (option("--seed", [&](std::string_view v) {
          out.seed = ParseInteger<std::uint64_t>(v);
          return out.seed.has_value();
        }))
      continue;

    out.unknown.emplace_back(raw);
  }

  return out;
}

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv) {
  std::vector<std::string_view> v;
  v.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0u);
  for (int i = 0; i < argc; ++i) v.emplace_back(argv[i] ? argv[i] : "");
  return ParseCommandLineArgsFromArgv(v);
}

std::string BuildCommandLineHelpText() {
  std::ostringstream oss;
  oss << "antsim - headless ant colony simulation\n\n";
  oss << "Usage: antsim [options]\n\n";
  oss << "Run\n";
  oss << "  --config <file>        Load settings from a JSON file\n";
  oss << "  --seconds <n>          Simulated seconds to run (default 120)\n";
  oss << "  --speed <x>            Simulation speed multiplier (0.1..10)\n";
  oss << "  --seed <n>             RNG seed\n";
  oss << "  --showcase             Spawn every ant at once, no breeding or random events\n\n";
  oss << "World\n";
  oss << "  --ants <n>             Initial ant count\n";
  oss << "  --food <n>             Initial food source count\n\n";
  oss << "Logging\n";
  oss << "  --log-dir <dir>        Also write rotating log files under <dir>\n";
  oss << "  --log-level <name>     trace, debug, info, warn, error, critical, off\n\n";
  oss << "Misc\n";
  oss << "  --help, -h             Show this help\n\n";
  oss << "Examples\n";
  oss << "  antsim --seconds 600 --ants 80\n";
  oss << "  antsim --config run.json --log-dir logs --log-level debug\n";
  return oss.str();
}

} // namespace antsim::app
