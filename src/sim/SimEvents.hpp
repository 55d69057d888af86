#pragma once
#include "SimTypes.hpp"

#include <entt/entt.hpp>
#include <cstdint>

// Outbound notifications for the presentation layer. The simulation enqueues
// them on an entt::dispatcher during a tick and flushes the queue at its end;
// nothing in the core reads them back.
namespace antsim::evt {
    struct AntSpawned         { sim::AntId ant; sim::AntRole role; sim::Vec2 position; };
    struct AntDied            { sim::AntId ant; sim::AntRole role; sim::Vec2 position; sim::DeathCause cause; };
    struct CorpseCollected    { sim::CorpseId corpse; sim::AntId collector; };
    struct FoodDepleted       { sim::FoodId food; sim::Vec2 position; };
    struct AttackStarted      { std::uint32_t termites; };
    struct AttackEnded        { std::uint32_t ants_alive; };
    struct RainStarted        { float duration_sec; };
    struct RainEnded          {};
    struct QueenFlightStarted { sim::Vec2 origin; float duration_sec; };
    struct QueenFlightEnded   {};
    struct EggsLaid           { std::uint32_t count; };
    struct ColonyEvolved      { std::uint32_t generation; };
    struct PuddleSpawned      { sim::PuddleId puddle; sim::Vec2 position; float radius; };
}
