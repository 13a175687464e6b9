#include <doctest/doctest.h>

#include "chronicle/core/Errors.hpp"
#include "chronicle/sim/MovementApplier.hpp"

#include "test_support/fixtures.hpp"

#include <vector>

using namespace chronicle;
using namespace chronicle::sim;
using chronicle::world::GridPoint;
using chronicle::world::MapPosition;

namespace {

struct Stage {
    world::World maps;
    rules::GateRegistry gates;
    world::UnitRoster roster;

    Stage()
    {
        maps.add_map(world::TileMap("A", 6, 6));
        maps.add_map(world::TileMap("B", 6, 6));
        gates.add_gate(rules::Gate{"A", {5, 5}, "B", {0, 0}, "portal", true});
    }

    const MapPosition& pos(const char* id) { return roster.require(id).require_position(); }
};

} // namespace

TEST_CASE("MovementApplier: a plain step keeps z")
{
    Stage s;
    world::Unit u = test::make_unit("m", "A", 1, 1);
    u.set(world::prop::kPosition, MapPosition{"A", {1, 1, 3}});
    s.roster.add(std::move(u));
    MovementApplier applier(s.maps, s.gates);

    CHECK(applier.apply_step("m", MapPosition{"A", {1, 2}}, s.roster.units()));
    CHECK(s.pos("m").position == GridPoint{1, 2});
    REQUIRE(s.pos("m").position.z.has_value());
    CHECK(*s.pos("m").position.z == 3);
}

TEST_CASE("MovementApplier: invalid steps leave the unit in place")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 0, 0));
    s.roster.add(world::Unit{"lost", "Lost", "ghost"});
    MovementApplier applier(s.maps, s.gates);
    const auto units = s.roster.units();

    CHECK_FALSE(applier.apply_step("m", MapPosition{"B", {0, 1}}, units));
    CHECK_FALSE(applier.apply_step("m", MapPosition{"A", {-1, 0}}, units));
    CHECK(s.pos("m").position == GridPoint{0, 0});

    CHECK_THROWS_AS(applier.apply_step("nobody", MapPosition{"A", {0, 1}}, units), MissingDataError);
    CHECK_THROWS_AS(applier.apply_step("lost", MapPosition{"A", {0, 1}}, units), MissingDataError);
}

TEST_CASE("MovementApplier: stepping on a gate teleports")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 5, 4));
    MovementApplier applier(s.maps, s.gates);

    CHECK(applier.apply_step("m", MapPosition{"A", {5, 5}}, s.roster.units()));
    CHECK(s.pos("m") == MapPosition{"B", {0, 0}});
}

TEST_CASE("MovementApplier: collisions nudge the mover to the nearest free tile")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 2, 1));
    s.roster.add(test::make_unit("blocker", "A", 2, 2));
    s.roster.add(test::make_unit("east", "A", 3, 2));
    MovementApplier applier(s.maps, s.gates);
    const auto units = s.roster.units();

    CHECK(applier.apply_step("m", MapPosition{"A", {2, 2}}, units));
    CHECK(s.pos("blocker").position == GridPoint{2, 2});
    // North of (2, 2) is free again once the mover has left it.
    CHECK(s.pos("m").position == GridPoint{2, 1});
    CHECK(world::find_collisions(units).empty());

    const auto free = applier.nearest_free_tile(MapPosition{"A", {2, 2}}, units, "");
    REQUIRE(free.has_value());
    CHECK(world::manhattan(*free, {2, 2}) == 1);
}

TEST_CASE("MovementApplier: collisions with no free tile are left in place")
{
    Stage s;
    s.maps.add_map(world::TileMap("Cell", 1, 1));
    s.roster.add(test::make_unit("a", "Cell", 0, 0));
    s.roster.add(test::make_unit("b", "Cell", 0, 0));
    MovementApplier applier(s.maps, s.gates);

    CHECK(applier.apply_step("a", MapPosition{"Cell", {0, 0}}, s.roster.units()));
    CHECK(s.pos("a") == MapPosition{"Cell", {0, 0}});
    CHECK_FALSE(applier.nearest_free_tile(MapPosition{"Cell", {0, 0}}, s.roster.units(), "a").has_value());
}

TEST_CASE("MovementApplier: paths stop at the first failure and report each step")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 0, 0));
    MovementApplier applier(s.maps, s.gates);
    applier.set_step_cooldown_ms(-5);
    CHECK(applier.step_cooldown_ms() == 0);

    const std::vector<MapPosition> path{
        {"A", {1, 0}},
        {"A", {2, 0}},
        {"B", {3, 0}},   // wrong map
        {"A", {4, 0}},
    };

    std::vector<StepEvent> events;
    const int applied = applier.apply_path("m", path, s.roster.units(),
                                           [&](const StepEvent& e) { events.push_back(e); });
    CHECK(applied == 2);
    REQUIRE(events.size() == 2);
    CHECK(events[0].stepIndex == 1);
    CHECK(events[1].stepIndex == 2);
    CHECK(events[1].totalSteps == 4);
    CHECK(events[1].position.position == GridPoint{2, 0});
    CHECK(s.pos("m").position == GridPoint{2, 0});
}

TEST_CASE("MovementApplier: a step that is not adjacent to the live position is refused")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 0, 0));
    MovementApplier applier(s.maps, s.gates);
    const auto units = s.roster.units();

    CHECK_FALSE(applier.apply_step("m", MapPosition{"A", {5, 5}}, units));
    CHECK_FALSE(applier.apply_step("m", MapPosition{"A", {1, 1}}, units));
    CHECK(s.pos("m").position == GridPoint{0, 0});

    const std::vector<MapPosition> jump{{"A", {4, 4}}};
    CHECK(applier.apply_path("m", jump, units) == 0);
    CHECK(s.pos("m").position == GridPoint{0, 0});
}

TEST_CASE("MovementApplier: a nudge that leaves the path ends it")
{
    Stage s;
    s.roster.add(test::make_unit("m", "A", 0, 0));
    s.roster.add(test::make_unit("blocker", "A", 0, 2));
    MovementApplier applier(s.maps, s.gates);
    const auto units = s.roster.units();

    const std::vector<MapPosition> path{
        {"A", {0, 1}},
        {"A", {0, 2}},   // occupied: the mover is nudged back north
        {"A", {0, 3}},   // two tiles from the nudged position
    };

    CHECK(applier.apply_path("m", path, units) == 2);
    CHECK(s.pos("m").position == GridPoint{0, 1});
    CHECK(s.pos("blocker").position == GridPoint{0, 2});
    CHECK(world::find_collisions(units).empty());
}
