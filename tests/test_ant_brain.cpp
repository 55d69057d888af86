// tests/test_ant_brain.cpp
//
// decide() is pure, so these cases build minds and perceptions by hand.

#include <doctest/doctest.h>

#include "sim/AntBrain.hpp"

#include <variant>

using namespace antsim::sim;

namespace {

AntMind mind_of(AntRole role, AntState state = AntState::Exploring) {
    AntMind m{};
    m.role = role;
    m.state = state;
    return m;
}

template <class Id>
Sighting<Id> seen_at(Id id, Vec2 p, float d) {
    return Sighting<Id>{id, p, d};
}

} // namespace

TEST_CASE("decide: soldiers engage a visible termite during an attack")
{
    AntPerception seen{};
    seen.attack_active = true;
    seen.termite = seen_at<TermiteId>(7, {10, 0}, 10.0f);
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Soldier), seen);
    CHECK(d.state == AntState::AttackingTermite);
    REQUIRE(std::holds_alternative<TermiteRef>(d.target));
    CHECK(std::get<TermiteRef>(d.target).id == 7);
}

TEST_CASE("decide: a soldier with no termite in range keeps foraging")
{
    AntPerception seen{};
    seen.attack_active = true;
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Soldier), seen);
    CHECK(d.state == AntState::SeekingFood);
}

TEST_CASE("decide: every non-soldier hides during an attack, even when carrying")
{
    AntPerception seen{};
    seen.attack_active = true;
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    for (AntRole role : {AntRole::Worker, AntRole::Scout, AntRole::Forager, AntRole::Nurse, AntRole::Queen}) {
        AntMind m = mind_of(role);
        m.carrying_food = true;
        const AntDecision d = decide(m, seen);
        CHECK(d.state == AntState::Hiding);
        CHECK_FALSE(has_target(d.target));
    }
}

TEST_CASE("decide: hiding ends once the attack is over")
{
    const AntDecision d = decide(mind_of(AntRole::Worker, AntState::Hiding), AntPerception{});
    CHECK(d.state == AntState::Exploring);
}

TEST_CASE("decide: an idle nurse goes to feed the brood")
{
    AntPerception seen{};
    seen.corpse = seen_at<CorpseId>(2, {5, 0}, 5.0f);

    CHECK(decide(mind_of(AntRole::Nurse), seen).state == AntState::FeedingBrood);

    AntMind carrying = mind_of(AntRole::Nurse);
    carrying.carrying_food = true;
    CHECK(decide(carrying, seen).state == AntState::ReturningHome);

    AntMind corpse = mind_of(AntRole::Nurse, AntState::ReturningHome);
    corpse.carrying_corpse = true;
    CHECK(decide(corpse, seen).state == AntState::FeedingBrood);
}

TEST_CASE("decide: corpses outrank danger and food")
{
    AntPerception seen{};
    seen.corpse = seen_at<CorpseId>(2, {5, 0}, 5.0f);
    seen.danger = seen_at<DepositId>(9, {-5, 0}, 5.0f);
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Worker), seen);
    CHECK(d.state == AntState::CollectingCorpse);
    REQUIRE(std::holds_alternative<CorpseRef>(d.target));
    CHECK(std::get<CorpseRef>(d.target).id == 2);
    CHECK_FALSE(d.flee);
}

TEST_CASE("decide: an ant fetching a corpse sticks to it")
{
    AntMind m = mind_of(AntRole::Worker, AntState::CollectingCorpse);
    m.target = CorpseRef{2};
    m.target_valid = true;

    AntPerception seen{};
    seen.corpse = seen_at<CorpseId>(5, {1, 0}, 1.0f); // a closer one
    seen.danger = seen_at<DepositId>(9, {-5, 0}, 5.0f);

    const AntDecision d = decide(m, seen);
    CHECK(d.state == AntState::CollectingCorpse);
    CHECK(std::get<CorpseRef>(d.target).id == 2);
}

TEST_CASE("decide: danger makes an unladen ant flee from the deposit")
{
    AntPerception seen{};
    seen.danger = seen_at<DepositId>(9, {30, 40}, 50.0f);
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Forager), seen);
    CHECK(d.state == AntState::AvoidingDanger);
    CHECK(d.flee);
    CHECK(d.flee_from.x == 30.0f);
    CHECK(d.flee_from.y == 40.0f);
}

TEST_CASE("decide: food carriers ignore danger and head home")
{
    AntPerception seen{};
    seen.danger = seen_at<DepositId>(9, {30, 40}, 50.0f);
    seen.corpse = seen_at<CorpseId>(2, {5, 0}, 5.0f);

    AntMind m = mind_of(AntRole::Worker, AntState::SeekingFood);
    m.carrying_food = true;
    const AntDecision food = decide(m, seen);
    CHECK(food.state == AntState::ReturningHome);
    CHECK_FALSE(food.flee);
}

TEST_CASE("decide: corpse carriers flee danger but pick up no second corpse")
{
    AntPerception seen{};
    seen.danger = seen_at<DepositId>(9, {10, 0}, 10.0f);
    seen.corpse = seen_at<CorpseId>(2, {5, 0}, 5.0f);

    AntMind c = mind_of(AntRole::Worker, AntState::ReturningHome);
    c.carrying_corpse = true;
    const AntDecision fled = decide(c, seen);
    CHECK(fled.state == AntState::AvoidingDanger);
    CHECK(fled.flee);
    CHECK(fled.flee_from.x == 10.0f);

    seen.danger.reset();
    const AntDecision home = decide(c, seen);
    CHECK(home.state == AntState::ReturningHome);
    CHECK_FALSE(has_target(home.target));
}

TEST_CASE("decide: leaving danger drops the flight speed")
{
    const AntDecision d = decide(mind_of(AntRole::Worker, AntState::AvoidingDanger), AntPerception{});
    CHECK(d.state == AntState::Exploring);
    CHECK(d.reset_speed);
    CHECK_FALSE(d.flee);

    const AntDecision calm = decide(mind_of(AntRole::Worker), AntPerception{});
    CHECK_FALSE(calm.reset_speed);
}

TEST_CASE("decide: a valid food target is kept")
{
    AntMind m = mind_of(AntRole::Worker, AntState::SeekingFood);
    m.target = FoodRef{4};
    m.target_valid = true;

    AntPerception seen{};
    seen.trail = seen_at<DepositId>(11, {3, 0}, 3.0f);
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(m, seen);
    CHECK(d.state == AntState::SeekingFood);
    CHECK(std::get<FoodRef>(d.target).id == 4);
}

TEST_CASE("decide: an invalid food target is dropped")
{
    AntMind m = mind_of(AntRole::Worker, AntState::SeekingFood);
    m.target = FoodRef{4};
    m.target_valid = false;

    const AntDecision d = decide(m, AntPerception{});
    CHECK(d.state == AntState::Exploring);
    CHECK_FALSE(has_target(d.target));
}

TEST_CASE("decide: a food trail is preferred over food seen directly")
{
    AntPerception seen{};
    seen.trail = seen_at<DepositId>(11, {3, 0}, 3.0f);
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Scout), seen);
    CHECK(d.state == AntState::FollowingTrail);
    CHECK(trail_of(d.target) == 11);
}

TEST_CASE("decide: a trail follower keeps its current deposit")
{
    AntMind m = mind_of(AntRole::Worker, AntState::FollowingTrail);
    m.target = PheromoneRef{20};
    m.target_valid = true;

    AntPerception seen{};
    seen.trail = seen_at<DepositId>(11, {3, 0}, 3.0f);

    CHECK(trail_of(decide(m, seen).target) == 20);
}

TEST_CASE("decide: visible food without a trail is sought")
{
    AntPerception seen{};
    seen.food = seen_at<FoodId>(3, {50, 0}, 50.0f);

    const AntDecision d = decide(mind_of(AntRole::Worker), seen);
    CHECK(d.state == AntState::SeekingFood);
    CHECK(std::get<FoodRef>(d.target).id == 3);
}

TEST_CASE("decide: nothing around means exploring")
{
    const AntDecision d = decide(mind_of(AntRole::Forager, AntState::SeekingFood), AntPerception{});
    CHECK(d.state == AntState::Exploring);
    CHECK_FALSE(has_target(d.target));
}
