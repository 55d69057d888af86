// tests/test_colony.cpp

#include <doctest/doctest.h>

#include "test_support/SimFixture.hpp"

#include "sim/SimEvents.hpp"

#include <cmath>
#include <vector>

using namespace antsim;
using sim::AntRole;
using sim::ColonyTuning;
using sim::FlightState;

namespace {

ColonyTuning quiet_tuning() {
    ColonyTuning t;
    t.queen_chance = 0.0f;
    t.spawn_interval_sec = 1e9f;
    return t;
}

} // namespace

TEST_CASE("Colony::spawn_ant pays the spawn cost and refuses when short of food")
{
    SUBCASE("one unit short")
    {
        ColonyTuning t = quiet_tuning();
        t.initial_food = 9.0f;
        test::SimFixture fx(42, t);

        CHECK(fx.colony.spawn_ant(fx.ctx) == nullptr);
        CHECK(fx.colony.food_storage() == doctest::Approx(9.0f));
        CHECK(fx.colony.population() == 0);
        CHECK(fx.colony.total_born() == 0);
    }

    SUBCASE("enough food")
    {
        test::SimFixture fx(42, quiet_tuning());
        test::EventCounter<evt::AntSpawned> spawned;
        spawned.connect(fx.events);

        sim::Ant* ant = fx.colony.spawn_ant(fx.ctx);
        REQUIRE(ant != nullptr);
        CHECK(fx.colony.food_storage() == doctest::Approx(490.0f));
        CHECK(fx.colony.population() == 1);
        CHECK(fx.colony.total_born() == 1);
        CHECK(std::abs(ant->position().x - test::kNest.x) <= 20.0f);
        CHECK(std::abs(ant->position().y - test::kNest.y) <= 20.0f);
        CHECK(ant->role() != AntRole::Queen);
        CHECK(fx.colony.try_get(ant->id()) == ant);

        fx.events.update();
        CHECK(spawned.count == 1);
    }
}

TEST_CASE("Colony::spawn_ant stops at the population cap")
{
    ColonyTuning t = quiet_tuning();
    t.max_population = 3;
    test::SimFixture fx(42, t);

    for (int i = 0; i < 3; ++i) REQUIRE(fx.colony.spawn_ant(fx.ctx) != nullptr);
    CHECK(fx.colony.spawn_ant(fx.ctx) == nullptr);
    CHECK(fx.colony.population() == 3);
    CHECK(fx.colony.food_storage() == doctest::Approx(470.0f));
}

TEST_CASE("Only one queen is designated at a time")
{
    ColonyTuning t = quiet_tuning();
    t.queen_chance = 1.0f;
    test::SimFixture fx(42, t);

    CHECK(fx.colony.spawn_ant(fx.ctx)->role() == AntRole::Queen);
    CHECK(fx.colony.has_queen());
    for (int i = 0; i < 10; ++i) {
        CHECK(fx.colony.spawn_ant(fx.ctx)->role() != AntRole::Queen);
    }
}

TEST_CASE("Periodic spawning follows the spawn interval")
{
    ColonyTuning t = quiet_tuning();
    t.spawn_interval_sec = 5.0f;
    test::SimFixture fx(42, t);

    for (int i = 0; i < 9; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.population() == 0);

    fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.population() == 1);
}

TEST_CASE("Brood moves through its stages without losing anyone")
{
    ColonyTuning t = quiet_tuning();
    t.initial_food = 1e6f;
    test::SimFixture fx(7, t);

    fx.colony.add_eggs(30);
    for (int i = 0; i < 4000; ++i) {
        fx.colony.reconcile(0.5f, fx.ctx);
        const sim::BroodStages& b = fx.colony.brood();
        REQUIRE(b.total() + fx.colony.emerged() == 30);
    }

    CHECK(fx.colony.emerged() == 30);
    CHECK(fx.colony.population() == 30);
    CHECK(fx.colony.total_born() == 30);
    // Emerging adults are free; larvae and pupae were fed.
    CHECK(fx.colony.food_storage() == doctest::Approx(1e6f - 30.0f * 250.0f));
}

TEST_CASE("Pupation waits for food")
{
    ColonyTuning t = quiet_tuning();
    t.initial_food = 0.0f;
    test::SimFixture fx(7, t);

    fx.colony.add_eggs(5);
    for (int i = 0; i < 2000; ++i) fx.colony.reconcile(0.5f, fx.ctx);

    CHECK(fx.colony.brood().larvae == 5);
    CHECK(fx.colony.brood().pupae == 0);
    CHECK(fx.colony.emerged() == 0);
}

TEST_CASE("The queen's nuptial flight runs on schedule and ends with eggs")
{
    ColonyTuning t = quiet_tuning();
    t.queen_chance = 1.0f;
    test::SimFixture fx(42, t);

    test::EventCounter<evt::QueenFlightStarted> started;
    test::EventCounter<evt::QueenFlightEnded> ended;
    test::EventCounter<evt::EggsLaid> laid;
    started.connect(fx.events);
    ended.connect(fx.events);
    laid.connect(fx.events);

    REQUIRE(fx.colony.spawn_ant(fx.ctx)->role() == AntRole::Queen);
    fx.colony.set_food_storage(1000.0f);

    for (int i = 0; i < 119; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::Idle);

    fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::NuptialFlight);
    CHECK(fx.colony.food_storage() == doctest::Approx(700.0f));

    for (int i = 0; i < 20; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::PostFlight);

    for (int i = 0; i < 10; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::Idle);

    fx.events.update();
    CHECK(started.count == 1);
    CHECK(ended.count == 1);
    REQUIRE(laid.count == 1);
    CHECK(laid.last.count >= 20);
    CHECK(laid.last.count <= 50);
    CHECK(fx.colony.brood().total() + fx.colony.emerged() == laid.last.count);
}

TEST_CASE("The flight is skipped when the colony cannot afford it")
{
    ColonyTuning t = quiet_tuning();
    t.queen_chance = 1.0f;
    test::SimFixture fx(42, t);

    REQUIRE(fx.colony.spawn_ant(fx.ctx)->role() == AntRole::Queen);
    fx.colony.set_food_storage(200.0f);

    for (int i = 0; i < 130; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::Idle);
    CHECK(fx.colony.food_storage() == doctest::Approx(200.0f));
}

TEST_CASE("Losing the queen resets the flight cycle")
{
    ColonyTuning t = quiet_tuning();
    t.queen_chance = 1.0f;
    test::SimFixture fx(42, t);

    test::EventCounter<evt::QueenFlightEnded> ended;
    ended.connect(fx.events);

    const sim::AntId queen = fx.colony.spawn_ant(fx.ctx)->id();
    fx.colony.set_food_storage(1000.0f);
    for (int i = 0; i < 121; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    REQUIRE(fx.colony.flight_state() == FlightState::NuptialFlight);

    fx.colony.try_get(queen)->take_damage(1000.0f, fx.ctx);
    CHECK(fx.colony.sweep_dead(fx.ctx) == 1);

    CHECK_FALSE(fx.colony.has_queen());
    CHECK(fx.colony.flight_state() == FlightState::Idle);
    fx.events.update();
    CHECK(ended.count == 1);

    // Without a queen the cycle no longer advances.
    for (int i = 0; i < 200; ++i) fx.colony.reconcile(0.5f, fx.ctx);
    CHECK(fx.colony.flight_state() == FlightState::Idle);

    CHECK(fx.colony.spawn_ant(fx.ctx)->role() == AntRole::Queen);
    CHECK(fx.colony.has_queen());
}

TEST_CASE("Emergency relief tops up ants when storage is nearly empty, at most every ten seconds")
{
    ColonyTuning t = quiet_tuning();
    test::SimFixture fx(42, t);

    const sim::AntId a = fx.colony.spawn_ant(fx.ctx)->id();
    const sim::AntId b = fx.colony.spawn_ant(fx.ctx)->id();
    fx.colony.try_get(a)->set_energy(50.0f);
    fx.colony.try_get(b)->set_energy(50.0f);
    fx.colony.set_food_storage(5.0f);

    fx.colony.reconcile(0.1f, fx.ctx);
    CHECK(fx.colony.try_get(a)->energy() == doctest::Approx(60.0f));
    CHECK(fx.colony.try_get(b)->energy() == doctest::Approx(60.0f));

    fx.colony.reconcile(0.1f, fx.ctx);
    CHECK(fx.colony.try_get(a)->energy() == doctest::Approx(60.0f));

    for (int i = 0; i < 9; ++i) fx.colony.reconcile(1.0f, fx.ctx);
    CHECK(fx.colony.try_get(a)->energy() == doctest::Approx(60.0f));

    fx.colony.reconcile(1.0f, fx.ctx);
    CHECK(fx.colony.try_get(a)->energy() == doctest::Approx(70.0f));

    fx.colony.set_food_storage(10.0f);
    for (int i = 0; i < 30; ++i) fx.colony.reconcile(1.0f, fx.ctx);
    CHECK(fx.colony.try_get(a)->energy() == doctest::Approx(70.0f));
}

TEST_CASE("Colony efficiency reflects deaths among the born")
{
    test::SimFixture fx(42, quiet_tuning());
    CHECK(fx.colony.efficiency() == doctest::Approx(1.0f));

    sim::AntId first = sim::kInvalidId;
    for (int i = 0; i < 4; ++i) {
        const sim::AntId id = fx.colony.spawn_ant(fx.ctx)->id();
        if (i == 0) first = id;
    }
    fx.colony.try_get(first)->take_damage(1000.0f, fx.ctx);
    CHECK(fx.colony.population() == 3);
    CHECK(fx.colony.roster_size() == 4);

    fx.colony.sweep_dead(fx.ctx);
    CHECK(fx.colony.roster_size() == 3);
    CHECK(fx.colony.try_get(first) == nullptr);
    CHECK(fx.colony.efficiency() == doctest::Approx(0.75f));
}

TEST_CASE("Swept ants leave the remaining roster addressable by id")
{
    test::SimFixture fx(42, quiet_tuning());

    std::vector<sim::AntId> ids;
    for (int i = 0; i < 6; ++i) ids.push_back(fx.colony.spawn_ant(fx.ctx)->id());

    fx.colony.try_get(ids[0])->take_damage(1000.0f, fx.ctx);
    fx.colony.try_get(ids[3])->take_damage(1000.0f, fx.ctx);
    CHECK(fx.colony.sweep_dead(fx.ctx) == 2);

    for (std::size_t i = 0; i < ids.size(); ++i) {
        const sim::Ant* ant = fx.colony.try_get(ids[i]);
        if (i == 0 || i == 3) {
            CHECK(ant == nullptr);
        } else {
            REQUIRE(ant != nullptr);
            CHECK(ant->id() == ids[i]);
        }
    }
}

TEST_CASE("Colony::evolve lowers the spawn cost and raises the cap within limits")
{
    test::SimFixture fx(42, quiet_tuning());

    fx.colony.evolve();
    CHECK(fx.colony.generation() == 2);
    CHECK(fx.colony.spawn_cost() == doctest::Approx(9.0f));
    CHECK(fx.colony.max_population() == 205);

    for (int i = 0; i < 9; ++i) fx.colony.evolve();
    CHECK(fx.colony.generation() == 11);
    CHECK(fx.colony.spawn_cost() == doctest::Approx(5.0f));
    CHECK(fx.colony.max_population() == 250);

    for (int i = 0; i < 30; ++i) fx.colony.evolve();
    CHECK(fx.colony.spawn_cost() == doctest::Approx(5.0f));
    CHECK(fx.colony.max_population() == 300);
}

TEST_CASE("Colony storage never goes negative")
{
    test::SimFixture fx(42, quiet_tuning());

    CHECK(fx.colony.take_food(600.0f) == doctest::Approx(500.0f));
    CHECK(fx.colony.food_storage() == 0.0f);
    CHECK(fx.colony.take_food(-5.0f) == 0.0f);

    fx.colony.add_food(-10.0f);
    CHECK(fx.colony.food_storage() == 0.0f);
    fx.colony.set_food_storage(-3.0f);
    CHECK(fx.colony.food_storage() == 0.0f);
}

TEST_CASE("A showcase colony neither spawns nor breeds")
{
    ColonyTuning t;
    t.initial_food = 1e6f;
    t.spawn_interval_sec = 1.0f;
    test::SimFixture fx(42, t);
    fx.colony.set_showcase(true);
    fx.colony.add_eggs(5);

    for (int i = 0; i < 200; ++i) fx.colony.reconcile(0.5f, fx.ctx);

    CHECK(fx.colony.roster_size() == 0);
    CHECK(fx.colony.brood().eggs == 5);
    CHECK(fx.colony.emerged() == 0);

    // A host can still spawn by hand.
    CHECK(fx.colony.spawn_ant(fx.ctx) != nullptr);
}

TEST_CASE("Colony::count_by_state counts live ants only")
{
    test::SimFixture fx(42, quiet_tuning());
    for (int i = 0; i < 3; ++i) fx.colony.spawn_ant(fx.ctx);
    fx.colony.ants()[0].take_damage(1000.0f, fx.ctx);

    const auto counts = fx.colony.count_by_state();
    CHECK(counts[static_cast<std::size_t>(sim::AntState::Exploring)] == 2);

    std::size_t total = 0;
    for (std::size_t c : counts) total += c;
    CHECK(total == 2);
}
