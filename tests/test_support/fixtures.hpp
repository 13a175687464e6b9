#pragma once

// Small builders shared by the simulation tests.

#include "chronicle/world/Unit.hpp"
#include "chronicle/world/UnitRoster.hpp"
#include "chronicle/world/World.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace chronicle::test {

namespace fs = std::filesystem;

inline world::Unit make_unit(std::string id, std::string mapId, int x, int y, double health = 100.0,
                             std::string faction = {}) {
    world::Unit u(id, id, "soldier");
    u.set(world::prop::kPosition, world::MapPosition{std::move(mapId), world::GridPoint{x, y}});
    u.set(world::prop::kHealth, health);
    u.set(world::prop::kMaxHealth, 100.0);
    u.set(world::prop::kMana, 100.0);
    u.set(world::prop::kMaxMana, 100.0);
    u.set(world::prop::kStatus, std::string("alive"));
    u.set(world::prop::kMovementRange, 3.0);
    u.set(world::prop::kExperience, 0.0);
    if (!faction.empty()) u.set(world::prop::kFaction, std::move(faction));
    return u;
}

// Open plains map of the given size.
inline world::World make_world(const std::string& mapId = "A", int w = 10, int h = 10) {
    world::World out;
    out.add_map(world::TileMap(mapId, w, h));
    return out;
}

inline fs::path make_unique_temp_dir(const std::string& tag) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec || base.empty())
        base = fs::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    fs::path dir = base / ("chronicle_" + tag + "_" + std::to_string(stamp));
    fs::create_directories(dir, ec);
    return dir;
}

} // namespace chronicle::test
