#pragma once

#include "chronicle/world/Occupancy.hpp"
#include "chronicle/world/Property.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace chronicle::rules {

struct StatChange {
  std::string unitId{};
  std::string unitName{};
  std::string propertyName{};
  world::PropertyValue oldValue{};
  world::PropertyValue newValue{};
};

// unit id -> property name -> value
using StatSnapshot = std::map<std::string, std::map<std::string, world::PropertyValue>>;

struct UnitChanges {
  std::string unitId{};
  std::string unitName{};
  std::vector<StatChange> changes{};
};

[[nodiscard]] StatSnapshot take_snapshot(world::UnitList units);

// Properties present on both sides whose value differs. Units missing from
// the snapshot and "lastActionTurn" are ignored.
[[nodiscard]] std::vector<StatChange> compare_snapshots(const StatSnapshot& before, world::UnitList units);

// "health: 70 -> 55"; positions print as "Map (x, y)".
[[nodiscard]] std::string format_change(const StatChange& c);
[[nodiscard]] std::vector<std::string> format_changes(const std::vector<StatChange>& changes);

// Groups in first-seen order.
[[nodiscard]] std::vector<UnitChanges> group_by_unit(const std::vector<StatChange>& changes);

// One line per unit: "Name: health: 70 -> 55, mana: 10 -> 5".
[[nodiscard]] std::vector<std::string> summarize(const std::vector<StatChange>& changes);

} // namespace chronicle::rules
