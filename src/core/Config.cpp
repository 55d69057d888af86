#include "core/Config.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace antsim::core {

namespace {

using json = nlohmann::json;

constexpr float kMinWorldSize = 200.0f;
constexpr float kMaxWorldSize = 10000.0f;
constexpr int kMaxAntCount = 1000;
constexpr int kMaxFoodCount = 100;

[[nodiscard]] const char* CarryModeName(sim::CarryMode m) noexcept {
  return m == sim::CarryMode::FullLoad ? "full" : "any";
}

[[nodiscard]] const char* TrailDecayName(sim::TrailDecay d) noexcept {
  return d == sim::TrailDecay::Exponential ? "exponential" : "linear";
}

[[nodiscard]] float ClampFinite(float v, float lo, float hi, float fallback) noexcept {
  if (!std::isfinite(v)) return fallback;
  return std::clamp(v, lo, hi);
}

template <class T>
void ReadNumber(const json& j, const char* key, T& out) {
  const auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_number()) {
    spdlog::warn("Config: '{}' is not a number, keeping {}", key, out);
    return;
  }
  out = it->template get<T>();
}

void ReadBool(const json& j, const char* key, bool& out) {
  const auto it = j.find(key);
  if (it == j.end()) return;
  if (!it->is_boolean()) {
    spdlog::warn("Config: '{}' is not a boolean, keeping {}", key, out);
    return;
  }
  out = it->get<bool>();
}

[[nodiscard]] std::string ReadString(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

} // namespace

bool LoadSimConfig(SimConfig& cfg, const fs::path& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    spdlog::debug("Config: {} not found", path.string());
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();

  json j = json::parse(oss.str(), nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    spdlog::warn("Config: {} is not a JSON object", path.string());
    return false;
  }

  SimConfig out = cfg;
  try {
    const int version = j.value("version", kSimConfigVersion);
    if (version != kSimConfigVersion) {
      spdlog::warn("Config: {} has version {}, expected {}; reading what matches", path.string(), version,
                   kSimConfigVersion);
    }

    ReadNumber(j, "seed", out.seed);
    ReadNumber(j, "worldWidth", out.worldWidth);
    ReadNumber(j, "worldHeight", out.worldHeight);
    ReadNumber(j, "antCount", out.antCount);
    ReadNumber(j, "foodCount", out.foodCount);
    ReadNumber(j, "puddleCount", out.puddleCount);
    ReadNumber(j, "pheromoneDecayRate", out.pheromoneDecayRate);
    ReadNumber(j, "simulationSpeed", out.simulationSpeed);
    ReadBool(j, "trailClusters", out.trailClusters);
    ReadBool(j, "showcase", out.showcase);
  } catch (const json::exception& e) {
    spdlog::warn("Config: {} rejected: {}", path.string(), e.what());
    return false;
  }

  if (const std::string mode = ReadString(j, "carryMode"); !mode.empty()) {
    if (mode == "any") out.carryMode = sim::CarryMode::AnyAmount;
    else if (mode == "full") out.carryMode = sim::CarryMode::FullLoad;
    else spdlog::warn("Config: unknown carryMode '{}'", mode);
  }

  if (const std::string decay = ReadString(j, "foodTrailDecay"); !decay.empty()) {
    if (decay == "linear") out.foodTrailDecay = sim::TrailDecay::Linear;
    else if (decay == "exponential") out.foodTrailDecay = sim::TrailDecay::Exponential;
    else spdlog::warn("Config: unknown foodTrailDecay '{}'", decay);
  }

  if (const std::string env = ReadString(j, "environment"); !env.empty()) {
    if (const auto parsed = sim::environment_from_string(env)) out.environment = *parsed;
    else spdlog::warn("Config: unknown environment '{}'", env);
  }

  if (const std::string level = ReadString(j, "logLevel"); !level.empty()) out.logLevel = level;

  const SimConfig defaults{};
  out.worldWidth = ClampFinite(out.worldWidth, kMinWorldSize, kMaxWorldSize, defaults.worldWidth);
  out.worldHeight = ClampFinite(out.worldHeight, kMinWorldSize, kMaxWorldSize, defaults.worldHeight);
  out.antCount = std::clamp(out.antCount, 0, kMaxAntCount);
  out.foodCount = std::clamp(out.foodCount, 0, kMaxFoodCount);
  out.puddleCount = std::clamp(out.puddleCount, 0, static_cast<int>(sim::HazardTuning{}.max_puddles));
  out.pheromoneDecayRate =
      ClampFinite(out.pheromoneDecayRate, sim::kMinDecayRate, sim::kMaxDecayRate, defaults.pheromoneDecayRate);
  out.simulationSpeed =
      ClampFinite(out.simulationSpeed, sim::kMinSimulationSpeed, sim::kMaxSimulationSpeed, defaults.simulationSpeed);

  cfg = out;
  spdlog::info("Config: loaded {}", path.string());
  return true;
}

bool SaveSimConfig(const SimConfig& cfg, const fs::path& path) {
  if (path.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error("Config: create_directories failed for {} ({}: {})", path.parent_path().string(), ec.value(),
                    ec.message());
      return false;
    }
  }

  json j;
  j["version"] = kSimConfigVersion;
  j["seed"] = cfg.seed;
  j["worldWidth"] = cfg.worldWidth;
  j["worldHeight"] = cfg.worldHeight;
  j["antCount"] = cfg.antCount;
  j["foodCount"] = cfg.foodCount;
  j["puddleCount"] = cfg.puddleCount;
  j["pheromoneDecayRate"] = cfg.pheromoneDecayRate;
  j["simulationSpeed"] = cfg.simulationSpeed;
  j["carryMode"] = CarryModeName(cfg.carryMode);
  j["foodTrailDecay"] = TrailDecayName(cfg.foodTrailDecay);
  j["trailClusters"] = cfg.trailClusters;
  j["environment"] = std::string(sim::to_string(cfg.environment));
  j["showcase"] = cfg.showcase;
  j["logLevel"] = cfg.logLevel;

  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    spdlog::error("Config: cannot write {}", path.string());
    return false;
  }
  f << j.dump(2) << '\n';
  if (!f) {
    spdlog::error("Config: write to {} failed", path.string());
    return false;
  }
  return true;
}

sim::SimulationSettings ToSimulationSettings(const SimConfig& cfg) {
  sim::SimulationSettings s{};
  s.seed = cfg.seed;
  s.bounds = sim::Bounds{0.0f, 0.0f, cfg.worldWidth, cfg.worldHeight};
  s.environment = cfg.environment;
  s.ant_count = static_cast<std::size_t>(std::max(cfg.antCount, 0));
  s.food_count = static_cast<std::size_t>(std::max(cfg.foodCount, 0));
  s.puddle_count = static_cast<std::size_t>(std::max(cfg.puddleCount, 0));
  s.pheromone_decay_rate = cfg.pheromoneDecayRate;
  s.simulation_speed = cfg.simulationSpeed;
  s.carry_mode = cfg.carryMode;
  s.food_trail_decay = cfg.foodTrailDecay;
  s.trail_clusters = cfg.trailClusters;
  s.showcase = cfg.showcase;
  return s;
}

} // namespace antsim::core
