// tests/test_ant.cpp
//
// Ant ticks against a hand-built context. Ants made with make_ant() are not on
// the colony roster; their home is where they were made.

#include <doctest/doctest.h>

#include "test_support/SimFixture.hpp"

#include "sim/SimEvents.hpp"

#include <cmath>
#include <variant>

using namespace antsim;
using sim::Ant;
using sim::AntRole;
using sim::AntState;
using sim::PheromoneType;

namespace {

float angle_between(float a, float b) {
    float d = std::fmod(std::fabs(a - b), sim::kTwoPi);
    return d > sim::kPi ? sim::kTwoPi - d : d;
}

} // namespace

TEST_CASE("A full carrier next to a depleted target heads home without collecting")
{
    test::SimFixture fx;
    const auto food = fx.food.create({210, 200}, 50.0f);
    fx.food.try_get(food)->destroy();

    Ant ant = fx.make_ant(AntRole::Worker, {100, 100});
    ant.set_position({200, 200});
    ant.set_carried_food(10.0f);
    ant.set_state(AntState::SeekingFood, sim::FoodRef{food}, fx.ctx);

    ant.update(0.1f, fx.ctx);

    CHECK(ant.state() != AntState::SeekingFood);
    CHECK(ant.state() == AntState::ReturningHome);
    CHECK(ant.food_amount() == doctest::Approx(10.0f));
    CHECK(fx.food.stats().total_collected == 0.0f);
}

TEST_CASE("A starving ant dies, leaves a corpse and is swept from the roster")
{
    test::SimFixture fx;
    test::EventCounter<evt::AntDied> deaths;
    deaths.connect(fx.events);

    Ant* spawned = fx.colony.spawn_ant(fx.ctx);
    REQUIRE(spawned != nullptr);
    spawned->set_energy(5.0f);
    const sim::AntId id = spawned->id();

    fx.colony.update_ants(60.0f, fx.ctx);

    const Ant* ant = fx.colony.try_get(id);
    REQUIRE(ant != nullptr);
    CHECK_FALSE(ant->alive());
    CHECK(ant->death_cause() == sim::DeathCause::Starvation);
    const sim::Vec2 last = ant->position();

    CHECK(fx.colony.sweep_dead(fx.ctx) == 1);
    CHECK(fx.colony.roster_size() == 0);
    CHECK(fx.colony.total_died() == 1);

    REQUIRE(fx.corpses.size() == 1);
    CHECK(fx.corpses.corpses()[0].position.x == last.x);
    CHECK(fx.corpses.corpses()[0].position.y == last.y);

    fx.events.update();
    CHECK(deaths.count == 1);
    CHECK(deaths.last.ant == id);
    CHECK(deaths.last.cause == sim::DeathCause::Starvation);
}

TEST_CASE("Energy drains every tick while exploring")
{
    test::SimFixture fx;
    Ant ant = fx.make_ant(AntRole::Scout, {200, 200});

    float previous = ant.energy();
    for (int i = 0; i < 20; ++i) {
        ant.update(0.1f, fx.ctx);
        CHECK(ant.state() == AntState::Exploring);
        CHECK(ant.energy() < previous);
        previous = ant.energy();
    }
    CHECK(fx.pheromones.count(PheromoneType::Exploration) > 0);
}

TEST_CASE("An ant within reach of food collects a full load")
{
    test::SimFixture fx;
    const auto food = fx.food.create({215, 200}, 50.0f);
    Ant ant = fx.make_ant(AntRole::Forager, {100, 100});
    ant.set_position({200, 200});

    ant.update(0.1f, fx.ctx);

    CHECK(ant.carrying_food());
    CHECK(ant.food_amount() == doctest::Approx(10.0f));
    CHECK(fx.food.try_get(food)->amount() == doctest::Approx(40.0f));
    CHECK(fx.food.stats().total_collected == doctest::Approx(10.0f));
    CHECK_FALSE(sim::has_target(ant.target()));

    ant.update(0.1f, fx.ctx);
    CHECK(ant.state() == AntState::ReturningHome);
}

TEST_CASE("Carry mode decides whether a partial load is carried home")
{
    SUBCASE("any amount")
    {
        test::SimFixture fx;
        fx.food.create({215, 200}, 4.0f);
        Ant ant = fx.make_ant(AntRole::Worker, {200, 200});

        ant.update(0.1f, fx.ctx);
        CHECK(ant.food_amount() == doctest::Approx(4.0f));
        CHECK(ant.carrying_food());
    }

    SUBCASE("full load only")
    {
        sim::AntTuning tuning;
        tuning.carry_mode = sim::CarryMode::FullLoad;
        test::SimFixture fx(42, {}, tuning);
        fx.food.create({215, 200}, 4.0f);
        Ant ant = fx.make_ant(AntRole::Worker, {200, 200});

        ant.update(0.1f, fx.ctx);
        CHECK(ant.food_amount() == doctest::Approx(4.0f));
        CHECK_FALSE(ant.carrying_food());

        ant.update(0.1f, fx.ctx);
        CHECK(ant.state() == AntState::Exploring);
    }
}

TEST_CASE("Delivering food at home stores it and starts a rest")
{
    test::SimFixture fx;
    Ant ant = fx.make_ant(AntRole::Worker, test::kNest);
    ant.set_energy(50.0f);
    ant.set_carried_food(10.0f);

    ant.update(0.1f, fx.ctx);

    CHECK(fx.colony.food_storage() == doctest::Approx(510.0f));
    CHECK(ant.state() == AntState::Resting);
    CHECK(ant.rest_remaining_sec() >= 3.0f);
    CHECK(ant.rest_remaining_sec() <= 5.0f);
    CHECK(ant.food_amount() == 0.0f);
    CHECK_FALSE(ant.carrying_food());
    CHECK(ant.food_collected() == doctest::Approx(10.0f));
    CHECK(ant.energy() == doctest::Approx(70.0f).epsilon(0.001));

    // Resting ants stay put until the timer runs out.
    const sim::Vec2 at = ant.position();
    ant.update(1.0f, fx.ctx);
    CHECK(ant.state() == AntState::Resting);
    CHECK(ant.position().x == at.x);

    ant.update(5.0f, fx.ctx);
    CHECK(ant.state() == AntState::Exploring);
}

TEST_CASE("Trail followers are counted on their deposit and released on reset")
{
    test::SimFixture fx;
    const auto trail = fx.pheromones.deposit({220, 200}, PheromoneType::FoodTrail, 1.0f);
    Ant ant = fx.make_ant(AntRole::Worker, {200, 200});

    ant.update(0.1f, fx.ctx);

    CHECK(ant.state() == AntState::FollowingTrail);
    CHECK(sim::trail_of(ant.target()) == trail);
    REQUIRE(fx.pheromones.try_get(trail) != nullptr);
    CHECK(fx.pheromones.try_get(trail)->follower_count == 1);

    ant.reset_to_exploring(fx.ctx);
    CHECK(ant.state() == AntState::Exploring);
    CHECK(fx.pheromones.try_get(trail)->follower_count == 0);
}

TEST_CASE("A trail walks an ant outward deposit by deposit and hands it to the food")
{
    test::SimFixture fx;
    const auto food = fx.food.create({400, 200}, 50.0f);
    const sim::DepositId trail[] = {
        fx.pheromones.deposit({215, 200}, PheromoneType::FoodTrail, 1.0f),
        fx.pheromones.deposit({230, 200}, PheromoneType::FoodTrail, 1.0f),
        fx.pheromones.deposit({245, 200}, PheromoneType::FoodTrail, 1.0f),
    };
    Ant ant = fx.make_ant(AntRole::Worker, {200, 200});

    ant.update(0.05f, fx.ctx);
    REQUIRE(ant.state() == AntState::FollowingTrail);
    CHECK(sim::trail_of(ant.target()) == trail[0]);

    int steps = 0;
    while (ant.state() == AntState::FollowingTrail && steps < 200) {
        ant.update(0.05f, fx.ctx);
        ++steps;
    }

    // Handed over only at the far end of the trail.
    REQUIRE(ant.state() == AntState::SeekingFood);
    REQUIRE(std::holds_alternative<sim::FoodRef>(ant.target()));
    CHECK(std::get<sim::FoodRef>(ant.target()).id == food);
    CHECK(ant.position().x > 230.0f);
    for (const auto id : trail) {
        REQUIRE(fx.pheromones.try_get(id) != nullptr);
        CHECK(fx.pheromones.try_get(id)->follower_count == 0);
    }

    steps = 0;
    while (ant.food_amount() == 0.0f && steps < 400) {
        ant.update(0.05f, fx.ctx);
        ++steps;
    }
    CHECK(ant.food_amount() > 0.0f);
    CHECK(fx.food.try_get(food)->amount() < 50.0f);
}

TEST_CASE("A trail follower never steps back toward the nest")
{
    test::SimFixture fx;
    const auto inner = fx.pheromones.deposit({210, 200}, PheromoneType::FoodTrail, 1.0f);
    const auto outer = fx.pheromones.deposit({225, 200}, PheromoneType::FoodTrail, 1.0f);
    Ant ant = fx.make_ant(AntRole::Worker, {100, 100});
    ant.set_position({235, 200});
    ant.set_state(AntState::FollowingTrail, sim::PheromoneRef{outer}, fx.ctx);
    REQUIRE(fx.pheromones.try_get(outer)->follower_count == 1);

    // At the outer end with nothing beyond and no food around.
    ant.update(0.05f, fx.ctx);

    CHECK(ant.state() == AntState::Exploring);
    CHECK_FALSE(sim::has_target(ant.target()));
    CHECK(fx.pheromones.try_get(inner)->follower_count == 0);
    CHECK(fx.pheromones.try_get(outer)->follower_count == 0);
}

TEST_CASE("Danger sends an ant running away faster, and the boost ends with the danger")
{
    test::SimFixture fx;
    Ant ant = fx.make_ant(AntRole::Worker, {200, 200});
    fx.pheromones.deposit({220, 200}, PheromoneType::Danger, 1.0f);

    ant.update(0.1f, fx.ctx);

    CHECK(ant.state() == AntState::AvoidingDanger);
    CHECK(angle_between(ant.heading(), sim::kPi) <= sim::kPi / 4.0f + 1e-4f);
    CHECK(ant.speed() == doctest::Approx(std::min(ant.base_speed() * 1.8f, 200.0f)));
    CHECK(ant.position().x < 200.0f);

    fx.pheromones.clear();
    ant.update(0.1f, fx.ctx);
    CHECK(ant.state() == AntState::Exploring);
    CHECK(ant.speed() == doctest::Approx(ant.base_speed()));
}

TEST_CASE("A nearby corpse is picked up and carried home")
{
    test::SimFixture fx;
    test::EventCounter<evt::CorpseCollected> collected;
    collected.connect(fx.events);

    const auto corpse = fx.corpses.add({210, 200}, AntRole::Scout);
    Ant ant = fx.make_ant(AntRole::Worker, {200, 200});

    ant.update(0.1f, fx.ctx);

    CHECK(ant.carrying_corpse());
    CHECK(ant.state() == AntState::ReturningHome);
    CHECK(ant.corpses_collected() == 1);
    CHECK(fx.corpses.try_get(corpse) == nullptr);
    CHECK(fx.corpses.total_collected() == 1);

    fx.events.update();
    CHECK(collected.count == 1);
    CHECK(collected.last.corpse == corpse);
}

TEST_CASE("Combat damage can kill an ant")
{
    test::SimFixture fx;
    Ant ant = fx.make_ant(AntRole::Forager, {300, 300});
    ant.set_energy(10.0f);

    ant.take_damage(4.0f, fx.ctx);
    CHECK(ant.alive());
    CHECK(ant.energy() == doctest::Approx(6.0f));

    ant.take_damage(15.0f, fx.ctx);
    CHECK_FALSE(ant.alive());
    CHECK(ant.death_cause() == sim::DeathCause::Combat);
    CHECK(ant.energy() == 0.0f);
    CHECK(fx.corpses.size() == 1);

    // Already dead: nothing more happens.
    ant.take_damage(15.0f, fx.ctx);
    CHECK(fx.corpses.size() == 1);
}

TEST_CASE("Nurses feed the brood and rest longer afterwards")
{
    test::SimFixture fx;
    Ant nurse = fx.make_ant(AntRole::Nurse, test::kNest);

    nurse.update(0.1f, fx.ctx);

    CHECK(nurse.state() == AntState::Resting);
    CHECK(nurse.rest_remaining_sec() >= 4.0f);
    CHECK(nurse.rest_remaining_sec() <= 7.0f);
    CHECK(nurse.energy() == doctest::Approx(100.0f - 0.01f - 5.0f));
}

TEST_CASE("Soldiers bite termites in range during an attack")
{
    test::SimFixture fx;
    fx.ctx.attack_active = true;
    const auto termite = fx.termites.spawn({210, 200}, fx.rng);
    Ant soldier = fx.make_ant(AntRole::Soldier, {200, 200});

    soldier.update(0.1f, fx.ctx);

    CHECK(soldier.state() == AntState::AttackingTermite);
    CHECK(fx.termites.try_get(termite)->health() == doctest::Approx(35.0f));
    CHECK(soldier.energy() == doctest::Approx(100.0f - 0.01f - 5.0f));
}

TEST_CASE("Non-soldiers shelter at the nest during an attack")
{
    test::SimFixture fx;
    fx.ctx.attack_active = true;

    Ant far = fx.make_ant(AntRole::Worker, {800, 800}, 1);
    const float before = sim::distance(far.position(), test::kNest);
    far.update(0.1f, fx.ctx);
    CHECK(far.state() == AntState::Hiding);
    CHECK(sim::distance(far.position(), test::kNest) < before);

    Ant close = fx.make_ant(AntRole::Scout, {510, 500}, 2);
    close.update(0.1f, fx.ctx);
    CHECK(close.state() == AntState::Hiding);
    CHECK(close.position().x == 510.0f);
    CHECK(close.position().y == 500.0f);

    fx.ctx.attack_active = false;
    close.update(0.1f, fx.ctx);
    CHECK(close.state() == AntState::Exploring);
}
