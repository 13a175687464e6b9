#pragma once

#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/world/UnitRoster.hpp"
#include "chronicle/world/World.hpp"

#include <vector>

namespace chronicle::app {

// Three maps ("Meadow", "Forest", "Ruins") joined by bidirectional gates.
void BuildDemoWorld(world::World& world, rules::GateRegistry& gates);

// Two wardens, two raiders, a neutral trader and a wardens cleric, placed on Meadow and Forest.
[[nodiscard]] std::vector<world::Unit> DemoUnits();

// Adds the demo units to an empty roster. Returns how many were added.
int PopulateDemoRoster(world::UnitRoster& roster);

} // namespace chronicle::app
