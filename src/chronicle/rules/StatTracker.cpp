#include "chronicle/rules/StatTracker.hpp"

namespace chronicle::rules {

StatSnapshot take_snapshot(world::UnitList units) {
  StatSnapshot snap;
  for (const world::Unit* u : units) {
    if (!u) continue;
    auto& props = snap[u->id()];
    for (const auto& [name, record] : u->properties()) props.emplace(name, record.value);
  }
  return snap;
}

std::vector<StatChange> compare_snapshots(const StatSnapshot& before, world::UnitList units) {
  std::vector<StatChange> changes;
  for (const world::Unit* u : units) {
    if (!u) continue;
    const auto unit_it = before.find(u->id());
    if (unit_it == before.end()) continue;

    for (const auto& [name, record] : u->properties()) {
      if (name == world::prop::kLastActionTurn) continue;
      const auto prop_it = unit_it->second.find(name);
      if (prop_it == unit_it->second.end()) continue;
      if (world::same_value(prop_it->second, record.value)) continue;

      changes.push_back(StatChange{u->id(), u->name(), name, prop_it->second, record.value});
    }
  }
  return changes;
}

std::string format_change(const StatChange& c) {
  return c.propertyName + ": " + world::to_display_string(c.oldValue) + " -> " + world::to_display_string(c.newValue);
}

std::vector<std::string> format_changes(const std::vector<StatChange>& changes) {
  std::vector<std::string> out;
  out.reserve(changes.size());
  for (const StatChange& c : changes) out.push_back(format_change(c));
  return out;
}

std::vector<UnitChanges> group_by_unit(const std::vector<StatChange>& changes) {
  std::vector<UnitChanges> groups;
  for (const StatChange& c : changes) {
    UnitChanges* g = nullptr;
    for (UnitChanges& existing : groups) {
      if (existing.unitId == c.unitId) {
        g = &existing;
        break;
      }
    }
    if (!g) {
      groups.push_back(UnitChanges{c.unitId, c.unitName, {}});
      g = &groups.back();
    }
    g->changes.push_back(c);
  }
  return groups;
}

std::vector<std::string> summarize(const std::vector<StatChange>& changes) {
  std::vector<std::string> out;
  for (const UnitChanges& g : group_by_unit(changes)) {
    std::string line = (g.unitName.empty() ? std::string("Unknown") : g.unitName) + ": ";
    bool first = true;
    for (const StatChange& c : g.changes) {
      if (!first) line += ", ";
      line += format_change(c);
      first = false;
    }
    out.push_back(std::move(line));
  }
  return out;
}

} // namespace chronicle::rules
