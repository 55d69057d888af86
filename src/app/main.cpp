#include "app/CommandLineArgs.hpp"
#include "core/Config.hpp"
#include "core/FixedTimestep.hpp"
#include "core/Log.hpp"
#include "sim/SimEvents.hpp"
#include "sim/Simulation.hpp"
#include "sim/Snapshot.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <filesystem>

namespace {

using namespace antsim;

constexpr double kDefaultRunSeconds = 120.0;
constexpr double kReportEverySec = 10.0;
constexpr double kFrameSec = 1.0 / 60.0;

// Tallies outbound simulation events and logs the rare ones.
struct EventLog {
  std::uint32_t spawned{0};
  std::uint32_t died{0};
  std::uint32_t depleted{0};

  void on_spawned(const evt::AntSpawned&) { ++spawned; }
  void on_died(const evt::AntDied& e) {
    ++died;
    spdlog::debug("Ant {} ({}) died: {}", e.ant, sim::to_string(e.role), sim::to_string(e.cause));
  }
  void on_depleted(const evt::FoodDepleted& e) {
    ++depleted;
    spdlog::info("Food source {} at ({:.0f}, {:.0f}) depleted", e.food, e.position.x, e.position.y);
  }
  void on_attack_ended(const evt::AttackEnded& e) { spdlog::info("Colony held, {} ants standing", e.ants_alive); }

  void connect(entt::dispatcher& d) {
    d.sink<evt::AntSpawned>().connect<&EventLog::on_spawned>(*this);
    d.sink<evt::AntDied>().connect<&EventLog::on_died>(*this);
    d.sink<evt::FoodDepleted>().connect<&EventLog::on_depleted>(*this);
    d.sink<evt::AttackEnded>().connect<&EventLog::on_attack_ended>(*this);
  }
};

void ApplyOverrides(core::SimConfig& cfg, const app::CommandLineArgs& args) {
  if (args.ants) cfg.antCount = *args.ants;
  if (args.food) cfg.foodCount = *args.food;
  if (args.speed) cfg.simulationSpeed = *args.speed;
  if (args.seed) cfg.seed = *args.seed;
  if (args.logLevel) cfg.logLevel = *args.logLevel;
  if (args.showcase) cfg.showcase = true;
}

int Run(const app::CommandLineArgs& args) {
  core::SimConfig cfg{};
  bool configLoaded = false;
  if (args.configPath) configLoaded = core::LoadSimConfig(cfg, *args.configPath);
  ApplyOverrides(cfg, args);

  core::LogInit(args.logDir ? std::filesystem::path(*args.logDir) : std::filesystem::path{},
                core::ParseLogLevel(cfg.logLevel));
  if (args.configPath && !configLoaded) spdlog::warn("Config: using defaults, could not load {}", *args.configPath);

  sim::Simulation simulation(core::ToSimulationSettings(cfg));

  EventLog events;
  events.connect(simulation.events());

  const double runSeconds = args.seconds.value_or(kDefaultRunSeconds);
  double nextReport = kReportEverySec;

  core::FixedTimestep clock(kFrameSec);
  while (simulation.elapsed_sec() < runSeconds) {
    clock.step(kFrameSec, [&](double dt, std::uint64_t) { simulation.advance(dt * 1000.0); });

    if (simulation.elapsed_sec() >= nextReport) {
      spdlog::info("{}", sim::describe(simulation.snapshot()));
      nextReport += kReportEverySec;
    }
  }

  const sim::Snapshot last = simulation.snapshot();
  spdlog::info("{}", sim::describe(last));
  spdlog::info("Run finished after {:.1f}s: {} spawned, {} died, {} food sources depleted, {:.0f} food gathered",
               last.elapsed_sec, events.spawned, events.died, events.depleted, last.food.total_collected);

  core::LogShutdown();
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  const antsim::app::CommandLineArgs args = antsim::app::ParseCommandLineArgs(argc, argv);

  if (args.showHelp) {
    std::fputs(antsim::app::BuildCommandLineHelpText().c_str(), stdout);
    return 0;
  }
  if (!args.unknown.empty()) {
    for (const auto& a : args.unknown) std::fprintf(stderr, "antsim: unrecognised or invalid option '%s'\n", a.c_str());
    std::fputs("Try 'antsim --help'.\n", stderr);
    return 2;
  }

  try {
    return Run(args);
  } catch (const std::exception& e) {
    spdlog::critical("Fatal: {}", e.what());
    return 1;
  }
}
