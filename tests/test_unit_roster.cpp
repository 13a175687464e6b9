#include <doctest/doctest.h>

#include "chronicle/core/Errors.hpp"
#include "chronicle/world/Occupancy.hpp"
#include "chronicle/world/UnitRoster.hpp"

#include "test_support/fixtures.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace chronicle;
using namespace chronicle::world;

namespace {

std::vector<std::string> ids_of(const std::vector<Unit*>& units)
{
    std::vector<std::string> out;
    for (const Unit* u : units) out.push_back(u->id());
    return out;
}

} // namespace

TEST_CASE("UnitRoster keeps insertion order and rejects bad ids")
{
    UnitRoster roster;
    roster.add(test::make_unit("c", "A", 0, 0));
    roster.add(test::make_unit("a", "A", 1, 0));
    roster.add(test::make_unit("b", "A", 2, 0));

    CHECK(roster.ids() == std::vector<std::string>{"c", "a", "b"});
    CHECK(roster.size() == 3);

    CHECK_THROWS_AS(roster.add(test::make_unit("a", "A", 3, 0)), std::invalid_argument);
    CHECK_THROWS_AS(roster.add(Unit{}), std::invalid_argument);
    CHECK_THROWS_AS((void)roster.require("zz"), MissingDataError);
}

TEST_CASE("UnitRoster references survive removal of other units")
{
    UnitRoster roster;
    roster.add(test::make_unit("a", "A", 0, 0));
    Unit& b = roster.add(test::make_unit("b", "A", 1, 0));
    roster.add(test::make_unit("c", "A", 2, 0));

    CHECK(roster.remove("a"));
    CHECK_FALSE(roster.remove("a"));
    CHECK(&b == roster.find("b"));
    CHECK(b.id() == "b");

    roster.add(test::make_unit("d", "A", 3, 0));
    CHECK(roster.ids() == std::vector<std::string>{"b", "c", "d"});

    roster.clear();
    CHECK(roster.empty());
    CHECK_FALSE(roster.contains("b"));
}

TEST_CASE("Occupancy: snapshot skips the mover and unpositioned units")
{
    UnitRoster roster;
    roster.add(test::make_unit("mover", "A", 1, 1));
    roster.add(test::make_unit("other", "A", 2, 1));
    roster.add(Unit("nowhere", "Nowhere", "ghost"));
    const auto units = roster.units();

    const auto snap = OccupancySnapshot::capture(units, "mover");
    CHECK(snap.size() == 1);
    CHECK(snap.occupied("A", 2, 1));
    CHECK_FALSE(snap.occupied("A", 1, 1));

    // Later moves do not leak into an existing snapshot.
    roster.require("other").set(prop::kPosition, MapPosition{"A", {5, 5}});
    CHECK(snap.occupied("A", 2, 1));
}

TEST_CASE("Occupancy: lookups by id, name, tile and range")
{
    UnitRoster roster;
    Unit named("u7", "Aria", "ranger");
    named.set(prop::kPosition, MapPosition{"A", {0, 0}});
    roster.add(std::move(named));
    roster.add(test::make_unit("b", "A", 1, 1));
    roster.add(test::make_unit("c", "A", 3, 0));
    roster.add(test::make_unit("d", "B", 0, 0));
    const auto units = roster.units();

    REQUIRE(find_unit_by_id_or_name(units, "Aria") != nullptr);
    CHECK(find_unit_by_id_or_name(units, "Aria")->id() == "u7");
    CHECK(find_unit(units, "Aria") == nullptr);

    CHECK(ids_of(units_in_map(units, "A")) == std::vector<std::string>{"u7", "b", "c"});
    CHECK(ids_of(units_within_range(units, "u7", 2.0)) == std::vector<std::string>{"b"});
    CHECK(ids_of(units_within_range(units, "u7", 3.0)) == std::vector<std::string>{"b", "c"});
    CHECK(ids_of(adjacent_units(units, "u7")) == std::vector<std::string>{"b"});
    CHECK(adjacent_units(units, "u7", false).empty());

    CHECK(distance_between(units, "u7", "c") == 3.0);
    CHECK(std::isinf(distance_between(units, "u7", "d")));
    CHECK(std::isinf(distance_between(units, "u7", "missing")));
}

TEST_CASE("Occupancy: collisions are grouped per tile")
{
    UnitRoster roster;
    roster.add(test::make_unit("a", "A", 2, 2));
    roster.add(test::make_unit("b", "A", 2, 2));
    roster.add(test::make_unit("c", "A", 3, 2));
    roster.add(test::make_unit("d", "B", 2, 2));
    const auto units = roster.units();

    const auto collisions = find_collisions(units);
    REQUIRE(collisions.size() == 1);
    CHECK(collisions[0].mapId == "A");
    CHECK(collisions[0].x == 2);
    CHECK(ids_of(collisions[0].units) == std::vector<std::string>{"a", "b"});
    CHECK(units_at(units, "A", 2, 2).size() == 2);
}
