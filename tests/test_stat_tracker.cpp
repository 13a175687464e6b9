#include <doctest/doctest.h>

#include "chronicle/rules/StatTracker.hpp"

#include "test_support/fixtures.hpp"

#include <string>
#include <vector>

using namespace chronicle;
using namespace chronicle::rules;

TEST_CASE("StatTracker: only changed properties are reported")
{
    world::UnitRoster roster;
    roster.add(test::make_unit("a", "A", 0, 0, 70.0));
    roster.add(test::make_unit("b", "A", 1, 0, 40.0));
    const auto units = roster.units();

    const StatSnapshot before = take_snapshot(units);

    roster.require("a").set(world::prop::kHealth, 55.0);
    roster.require("a").set(world::prop::kLastActionTurn, 4.0);   // bookkeeping, never reported
    roster.require("a").set("gold", 3.0);                          // new since the snapshot
    roster.require("b").set(world::prop::kPosition, world::MapPosition{"A", {2, 0}});

    const auto changes = compare_snapshots(before, units);
    REQUIRE(changes.size() == 2);
    CHECK(changes[0].unitId == "a");
    CHECK(changes[0].propertyName == "health");
    CHECK(format_change(changes[0]) == "health: 70 -> 55");
    CHECK(format_change(changes[1]) == "position: A (1, 0) -> A (2, 0)");
}

TEST_CASE("StatTracker: units added after the snapshot are ignored")
{
    world::UnitRoster roster;
    roster.add(test::make_unit("a", "A", 0, 0));
    const StatSnapshot before = take_snapshot(roster.units());

    roster.add(test::make_unit("late", "A", 1, 0));
    roster.require("late").set(world::prop::kHealth, 1.0);
    CHECK(compare_snapshots(before, roster.units()).empty());
}

TEST_CASE("StatTracker: summaries group changes per unit in first-seen order")
{
    std::vector<StatChange> changes{
        {"b", "Borin", "health", 70.0, 55.0},
        {"a", "Aria", "mana", 40.0, 30.0},
        {"b", "Borin", "mana", 10.0, 5.0},
        {"x", "", "gold", 1.0, 2.0},
    };

    const auto groups = group_by_unit(changes);
    REQUIRE(groups.size() == 3);
    CHECK(groups[0].unitId == "b");
    CHECK(groups[0].changes.size() == 2);

    const auto lines = summarize(changes);
    CHECK(lines == std::vector<std::string>{
        "Borin: health: 70 -> 55, mana: 10 -> 5",
        "Aria: mana: 40 -> 30",
        "Unknown: gold: 1 -> 2",
    });
    CHECK(format_changes(changes).size() == 4);
}
