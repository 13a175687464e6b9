#pragma once

#include "chronicle/world/Unit.hpp"

#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace chronicle::world {

using UnitList = std::span<Unit* const>;

// Immutable copy of the tiles occupied at one instant. Planners search over
// this instead of live unit state.
class OccupancySnapshot final {
public:
  OccupancySnapshot() = default;

  // Units without a position are ignored; `exclude_id` skips the mover.
  static OccupancySnapshot capture(UnitList units, std::string_view exclude_id = {});

  void insert(const MapPosition& p) { tiles_.insert(key(p)); }

  [[nodiscard]] bool occupied(const MapPosition& p) const { return tiles_.count(key(p)) != 0; }
  [[nodiscard]] bool occupied(std::string_view map_id, int x, int y) const {
    return occupied(MapPosition{std::string(map_id), GridPoint{x, y}});
  }
  [[nodiscard]] std::size_t size() const noexcept { return tiles_.size(); }

private:
  // z is not part of occupancy.
  [[nodiscard]] static MapPosition key(const MapPosition& p) {
    return MapPosition{p.mapId, GridPoint{p.position.x, p.position.y}};
  }

  std::unordered_set<MapPosition, MapPositionHash> tiles_{};
};

struct Collision {
  std::string mapId{};
  int x{0};
  int y{0};
  std::vector<Unit*> units{};
};

[[nodiscard]] Unit* find_unit(UnitList units, std::string_view id) noexcept;

// Matches the id first, then the display name.
[[nodiscard]] Unit* find_unit_by_id_or_name(UnitList units, std::string_view key) noexcept;

[[nodiscard]] std::vector<Unit*> units_at(UnitList units, std::string_view map_id, int x, int y);
[[nodiscard]] std::vector<Unit*> units_in_map(UnitList units, std::string_view map_id);

// Tiles holding more than one unit, in first-seen order.
[[nodiscard]] std::vector<Collision> find_collisions(UnitList units);

// Infinite when either unit is unknown, lacks a position, or is on another map.
[[nodiscard]] double distance_between(UnitList units, std::string_view a, std::string_view b,
                                      bool use_manhattan = true);

// Excludes the reference unit itself.
[[nodiscard]] std::vector<Unit*> units_within_range(UnitList units, std::string_view unit_id, double range,
                                                    bool use_manhattan = true);
[[nodiscard]] std::vector<Unit*> adjacent_units(UnitList units, std::string_view unit_id,
                                                bool allow_diagonal = true);

} // namespace chronicle::world
