#include <doctest/doctest.h>

#include "chronicle/core/Errors.hpp"
#include "chronicle/world/Geometry.hpp"
#include "chronicle/world/TileMap.hpp"
#include "chronicle/world/Unit.hpp"
#include "chronicle/world/World.hpp"

#include "test_support/fixtures.hpp"

#include <cmath>
#include <string>

using namespace chronicle;
using namespace chronicle::world;

TEST_CASE("Geometry: manhattan, euclidean and cross-map distance")
{
    CHECK(manhattan({0, 0}, {3, 4}) == 7);
    CHECK(euclidean({0, 0}, {3, 4}) == doctest::Approx(5.0));

    const MapPosition a{"A", {1, 1}};
    const MapPosition b{"A", {4, 5}};
    const MapPosition c{"B", {1, 1}};
    CHECK(distance(a, b) == 7.0);
    CHECK(distance(a, b, false) == doctest::Approx(5.0));
    CHECK(std::isinf(distance(a, c)));
}

TEST_CASE("Geometry: adjacency and planar equality")
{
    CHECK(adjacent({2, 2}, {2, 3}));
    CHECK_FALSE(adjacent({2, 2}, {2, 2}));
    CHECK_FALSE(adjacent({2, 2}, {3, 3}));
    CHECK(adjacent({2, 2}, {3, 3}, true));
    CHECK_FALSE(adjacent({2, 2}, {4, 2}, true));

    // z rides along but is not part of tile identity.
    CHECK(GridPoint(1, 2, 7) == GridPoint(1, 2));
}

TEST_CASE("Property: display strings")
{
    CHECK(to_display_string(PropertyValue{55.0}) == "55");
    CHECK(to_display_string(PropertyValue{2.5}) == "2.5");
    CHECK(to_display_string(PropertyValue{std::in_place_type<bool>, true}) == "true");
    CHECK(to_display_string(PropertyValue{MapPosition{"Meadow", {3, 4}}}) == "Meadow (3, 4)");
    CHECK(to_display_string(PropertyValue{StringMap{{"b", "hostile"}}}) == "{b: hostile}");
}

TEST_CASE("Property: same_value compares positions including z")
{
    const PropertyValue flat{MapPosition{"A", {1, 1}}};
    const PropertyValue raised{MapPosition{"A", {1, 1, 2}}};
    CHECK(same_value(flat, flat));
    CHECK_FALSE(same_value(flat, raised));
    CHECK_FALSE(same_value(PropertyValue{1.0}, PropertyValue{std::string("1")}));
}

TEST_CASE("Unit: absent properties read as empty")
{
    Unit u("u1", "Scout", "ranger");
    CHECK_FALSE(u.has("health"));
    CHECK_FALSE(u.number("health").has_value());
    CHECK(u.position() == nullptr);
    CHECK_THROWS_AS((void)u.require_position(), MissingDataError);
    CHECK(u.label() == "Scout (u1)");
}

TEST_CASE("Unit: readonly records reject writes")
{
    Unit u("u1", "Scout", "ranger");
    u.define("faction", std::string("wardens"), true);
    CHECK_FALSE(u.set("faction", std::string("raiders")));
    CHECK_FALSE(u.set_base("faction", std::string("raiders")));
    CHECK(u.text("faction") == std::string("wardens"));
}

TEST_CASE("Unit: modifiers stack on the base value")
{
    Unit u("u1", "Scout", "ranger");
    CHECK(u.set_base("attack", 10.0));
    u.add_modifier("attack", Modifier{"blessing", 5.0, 1});
    u.add_modifier("attack", Modifier{"fatigue", -2.0, 0});
    CHECK(u.number("attack") == 13.0);

    REQUIRE(u.record("attack") != nullptr);
    CHECK(u.record("attack")->modifiers.front().source == "fatigue");

    CHECK(u.remove_modifiers("attack", "blessing") == 1);
    CHECK(u.number("attack") == 8.0);
    CHECK(u.remove_modifiers("attack", "missing") == 0);
}

TEST_CASE("Unit: liveness follows status and health")
{
    Unit u = test::make_unit("u1", "A", 0, 0, 40.0);
    CHECK(is_alive(u));

    u.set(prop::kHealth, 0.0);
    CHECK_FALSE(is_alive(u));

    u.set(prop::kHealth, 40.0);
    u.set(prop::kStatus, std::string("dead"));
    CHECK_FALSE(is_alive(u));

    Unit ghost("g", "Ghost", "spirit");
    CHECK_FALSE(is_alive(ghost));
}

TEST_CASE("TileMap: bounds, fill and walkability")
{
    TileMap map("A", 5, 4, Terrain::Grass);
    CHECK(map.in_bounds(4, 3));
    CHECK_FALSE(map.in_bounds(5, 0));
    CHECK(map.terrain(-1, 0) == Terrain::Wall);

    map.fill_rect(3, 2, 1, 1, Terrain::Water);   // corners in any order, inclusive
    CHECK(map.terrain(1, 1) == Terrain::Water);
    CHECK(map.terrain(3, 2) == Terrain::Water);
    CHECK(map.terrain(4, 2) == Terrain::Grass);
    CHECK_FALSE(map.is_walkable(2, 2));
    CHECK(map.is_walkable(0, 0));

    CHECK(terrain_from_string("mountain") == Terrain::Mountain);
    CHECK_FALSE(terrain_from_string("lava").has_value());
    CHECK(to_string(Terrain::Road) == "road");
}

TEST_CASE("World: maps are looked up by name and replaced on re-add")
{
    World w;
    w.add_map(TileMap("A", 4, 4));
    w.add_map(TileMap("B", 2, 2));
    CHECK(w.size() == 2);

    w.add_map(TileMap("A", 8, 8));
    CHECK(w.size() == 2);
    CHECK(w.get_map("A").width() == 8);
    CHECK(w.all_maps().front()->name() == "A");

    CHECK(w.find_map("C") == nullptr);
    CHECK_THROWS_AS((void)w.get_map("C"), MissingDataError);
}
