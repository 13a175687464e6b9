#include "chronicle/app/DemoWorld.hpp"

#include <string>

namespace chronicle::app {

namespace {

struct UnitSpec {
  const char* id;
  const char* name;
  const char* kind;
  const char* faction;
  const char* mapId;
  int x;
  int y;
  double health;
  double mana;
  double movementRange;
  double experience;
};

constexpr UnitSpec kUnits[] = {
    {"aria",  "Aria",  "ranger",  "wardens", "Meadow",  3, 4, 90.0, 40.0, 3.0, 4.0},
    {"borin", "Borin", "soldier", "wardens", "Meadow",  4, 6, 100.0, 20.0, 2.0, 6.0},
    {"lys",   "Lys",   "cleric",  "wardens", "Meadow",  2, 5, 70.0, 80.0, 2.0, 3.0},
    {"kael",  "Kael",  "raider",  "raiders", "Meadow", 14, 7, 85.0, 30.0, 3.0, 5.0},
    {"mira",  "Mira",  "raider",  "raiders", "Forest",  6, 5, 60.0, 55.0, 3.0, 2.0},
    {"tobin", "Tobin", "trader",  "",        "Forest", 10, 8, 75.0, 35.0, 2.0, 1.0},
};

} // namespace

void BuildDemoWorld(world::World& world, rules::GateRegistry& gates) {
  using world::Terrain;

  world::TileMap meadow("Meadow", 20, 14, Terrain::Grass);
  meadow.fill_rect(8, 2, 9, 10, Terrain::Water);      // river
  meadow.set_terrain(8, 6, Terrain::Road);             // ford
  meadow.set_terrain(9, 6, Terrain::Road);
  meadow.fill_rect(15, 0, 19, 2, Terrain::Mountain);
  meadow.fill_rect(1, 10, 4, 12, Terrain::Forest);
  world.add_map(std::move(meadow));

  world::TileMap forest("Forest", 16, 12, Terrain::Forest);
  forest.fill_rect(0, 5, 15, 6, Terrain::Road);
  forest.fill_rect(4, 0, 5, 3, Terrain::Wall);
  forest.fill_rect(11, 8, 13, 10, Terrain::Swamp);
  world.add_map(std::move(forest));

  world::TileMap ruins("Ruins", 12, 12, Terrain::Sand);
  ruins.fill_rect(0, 0, 11, 0, Terrain::Wall);
  ruins.fill_rect(0, 11, 11, 11, Terrain::Wall);
  ruins.fill_rect(5, 3, 6, 8, Terrain::Wall);
  ruins.set_terrain(5, 6, Terrain::Plains);            // breach
  world.add_map(std::move(ruins));

  gates.add_gate(rules::Gate{"Meadow", {19, 7}, "Forest", {0, 6}, "meadow_forest", true});
  gates.add_gate(rules::Gate{"Forest", {15, 5}, "Ruins", {0, 5}, "forest_ruins", true});
}

std::vector<world::Unit> DemoUnits() {
  std::vector<world::Unit> out;
  for (const UnitSpec& s : kUnits) {
    world::Unit u(s.id, s.name, s.kind);
    u.set(world::prop::kPosition, world::MapPosition{s.mapId, world::GridPoint{s.x, s.y}});
    u.set(world::prop::kHealth, s.health);
    u.set(world::prop::kMaxHealth, 100.0);
    u.set(world::prop::kMana, s.mana);
    u.set(world::prop::kMaxMana, 100.0);
    u.set(world::prop::kStatus, std::string("alive"));
    u.set(world::prop::kFaction, std::string(s.faction));
    u.set(world::prop::kMovementRange, s.movementRange);
    u.set(world::prop::kExperience, s.experience);
    u.set("attack", 10.0);
    u.set("awareness", 5.0);
    u.set("resources", 0.0);
    out.push_back(std::move(u));
  }

  // The trader deals with everyone.
  world::StringMap ties{{"kael", "ally"}, {"mira", "ally"}, {"aria", "ally"}, {"borin", "ally"}, {"lys", "ally"}};
  out.back().define(world::prop::kRelationships, ties, true);
  return out;
}

int PopulateDemoRoster(world::UnitRoster& roster) {
  int added = 0;
  for (world::Unit& u : DemoUnits()) {
    roster.add(std::move(u));
    ++added;
  }
  return added;
}

} // namespace chronicle::app
