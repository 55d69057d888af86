// tests/test_core_config.cpp
//
// Regression/robustness tests for src/core/Config.{hpp,cpp}.
//
// Goals:
//   - Saving creates the directory and writes JSON that loads back
//   - Missing or corrupt files leave the config untouched
//   - Out-of-range values are clamped, unknown enum names ignored

#include <doctest/doctest.h>

#include "core/Config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using antsim::core::SimConfig;

namespace {

fs::path make_unique_temp_dir()
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("antsim_core_config_tests_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    if (ec)
        return base;

    return dir;
}

void write_text(const fs::path& path, const std::string& text)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << text;
}

} // namespace

TEST_CASE("core::SaveSimConfig creates the directory and LoadSimConfig round-trips values")
{
    const fs::path dir = make_unique_temp_dir() / "roundtrip";
    const fs::path file = dir / "nested" / "antsim.json";

    SimConfig cfg;
    cfg.seed = 987654321ULL;
    cfg.worldWidth = 1200.0f;
    cfg.antCount = 75;
    cfg.puddleCount = 5;
    cfg.carryMode = antsim::sim::CarryMode::FullLoad;
    cfg.foodTrailDecay = antsim::sim::TrailDecay::Exponential;
    cfg.environment = antsim::sim::Environment::DrySoil;
    cfg.trailClusters = false;
    cfg.showcase = true;
    cfg.logLevel = "debug";

    CHECK(antsim::core::SaveSimConfig(cfg, file));
    CHECK(fs::exists(file));

    SimConfig loaded;
    CHECK(antsim::core::LoadSimConfig(loaded, file));
    CHECK(loaded.seed == 987654321ULL);
    CHECK(loaded.worldWidth == doctest::Approx(1200.0f));
    CHECK(loaded.worldHeight == doctest::Approx(1350.0f));
    CHECK(loaded.antCount == 75);
    CHECK(loaded.puddleCount == 5);
    CHECK(loaded.carryMode == antsim::sim::CarryMode::FullLoad);
    CHECK(loaded.foodTrailDecay == antsim::sim::TrailDecay::Exponential);
    CHECK(loaded.environment == antsim::sim::Environment::DrySoil);
    CHECK_FALSE(loaded.trailClusters);
    CHECK(loaded.showcase);
    CHECK(loaded.logLevel == "debug");

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadSimConfig returns false for a missing file (first run)")
{
    const fs::path dir = make_unique_temp_dir() / "missing";
    std::error_code ec;
    fs::create_directories(dir, ec);

    SimConfig cfg;
    cfg.antCount = 12;
    CHECK_FALSE(antsim::core::LoadSimConfig(cfg, dir / "antsim.json"));
    CHECK(cfg.antCount == 12);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadSimConfig rejects malformed JSON without touching the config")
{
    const fs::path dir = make_unique_temp_dir() / "corrupt";
    std::error_code ec;
    fs::create_directories(dir, ec);

    SimConfig cfg;
    cfg.foodCount = 3;

    write_text(dir / "broken.json", "{ \"antCount\": 10, ");
    CHECK_FALSE(antsim::core::LoadSimConfig(cfg, dir / "broken.json"));

    write_text(dir / "array.json", "[1, 2, 3]");
    CHECK_FALSE(antsim::core::LoadSimConfig(cfg, dir / "array.json"));

    write_text(dir / "badversion.json", "{ \"version\": \"one\", \"foodCount\": 9 }");
    CHECK_FALSE(antsim::core::LoadSimConfig(cfg, dir / "badversion.json"));

    CHECK(cfg.foodCount == 3);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::LoadSimConfig clamps out-of-range values and skips bad types")
{
    const fs::path dir = make_unique_temp_dir() / "clamp";
    std::error_code ec;
    fs::create_directories(dir, ec);

    write_text(dir / "antsim.json", R"({
        "version": 1,
        "antCount": 99999,
        "foodCount": -4,
        "puddleCount": 40,
        "worldWidth": 10,
        "worldHeight": 50000,
        "simulationSpeed": 50,
        "pheromoneDecayRate": 0,
        "showcase": "yes",
        "carryMode": "sometimes",
        "environment": "swamp"
    })");

    SimConfig cfg;
    CHECK(antsim::core::LoadSimConfig(cfg, dir / "antsim.json"));
    CHECK(cfg.antCount == 1000);
    CHECK(cfg.foodCount == 0);
    CHECK(cfg.puddleCount == 10);
    CHECK(cfg.worldWidth == doctest::Approx(200.0f));
    CHECK(cfg.worldHeight == doctest::Approx(10000.0f));
    CHECK(cfg.simulationSpeed == doctest::Approx(10.0f));
    CHECK(cfg.pheromoneDecayRate == doctest::Approx(0.1f));
    CHECK_FALSE(cfg.showcase);
    CHECK(cfg.carryMode == antsim::sim::CarryMode::AnyAmount);
    CHECK(cfg.environment == antsim::sim::Environment::Mixed);

    std::error_code dec;
    fs::remove_all(dir, dec);
}

TEST_CASE("core::ToSimulationSettings maps the config onto the simulation")
{
    SimConfig cfg;
    cfg.seed = 7;
    cfg.worldWidth = 640.0f;
    cfg.worldHeight = 480.0f;
    cfg.antCount = 30;
    cfg.foodCount = 2;
    cfg.puddleCount = 1;
    cfg.simulationSpeed = 3.0f;
    cfg.carryMode = antsim::sim::CarryMode::FullLoad;
    cfg.environment = antsim::sim::Environment::Mud;

    const antsim::sim::SimulationSettings s = antsim::core::ToSimulationSettings(cfg);
    CHECK(s.seed == 7);
    CHECK(s.bounds.min_x == 0.0f);
    CHECK(s.bounds.max_x == doctest::Approx(640.0f));
    CHECK(s.bounds.max_y == doctest::Approx(480.0f));
    CHECK(s.ant_count == 30);
    CHECK(s.food_count == 2);
    CHECK(s.puddle_count == 1);
    CHECK(s.simulation_speed == doctest::Approx(3.0f));
    CHECK(s.carry_mode == antsim::sim::CarryMode::FullLoad);
    CHECK(s.environment == antsim::sim::Environment::Mud);
}
