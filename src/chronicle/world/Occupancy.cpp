#include "chronicle/world/Occupancy.hpp"

namespace chronicle::world {

OccupancySnapshot OccupancySnapshot::capture(UnitList units, std::string_view exclude_id) {
  OccupancySnapshot snap;
  for (const Unit* u : units) {
    if (!u) continue;
    if (!exclude_id.empty() && u->id() == exclude_id) continue;
    if (const MapPosition* p = u->position()) snap.insert(*p);
  }
  return snap;
}

Unit* find_unit(UnitList units, std::string_view id) noexcept {
  for (Unit* u : units) {
    if (u && u->id() == id) return u;
  }
  return nullptr;
}

Unit* find_unit_by_id_or_name(UnitList units, std::string_view key) noexcept {
  if (Unit* u = find_unit(units, key)) return u;
  for (Unit* u : units) {
    if (u && u->name() == key) return u;
  }
  return nullptr;
}

std::vector<Unit*> units_at(UnitList units, std::string_view map_id, int x, int y) {
  std::vector<Unit*> out;
  for (Unit* u : units) {
    if (!u) continue;
    const MapPosition* p = u->position();
    if (p && p->mapId == map_id && p->position.x == x && p->position.y == y) out.push_back(u);
  }
  return out;
}

std::vector<Unit*> units_in_map(UnitList units, std::string_view map_id) {
  std::vector<Unit*> out;
  for (Unit* u : units) {
    if (!u) continue;
    const MapPosition* p = u->position();
    if (p && p->mapId == map_id) out.push_back(u);
  }
  return out;
}

std::vector<Collision> find_collisions(UnitList units) {
  std::vector<Collision> groups;
  for (Unit* u : units) {
    if (!u) continue;
    const MapPosition* p = u->position();
    if (!p) continue;

    bool placed = false;
    for (Collision& g : groups) {
      if (g.mapId == p->mapId && g.x == p->position.x && g.y == p->position.y) {
        g.units.push_back(u);
        placed = true;
        break;
      }
    }
    if (!placed) groups.push_back(Collision{p->mapId, p->position.x, p->position.y, {u}});
  }

  std::vector<Collision> out;
  for (Collision& g : groups) {
    if (g.units.size() > 1) out.push_back(std::move(g));
  }
  return out;
}

double distance_between(UnitList units, std::string_view a, std::string_view b, bool use_manhattan) {
  const Unit* ua = find_unit(units, a);
  const Unit* ub = find_unit(units, b);
  if (!ua || !ub) return kUnreachable;

  const MapPosition* pa = ua->position();
  const MapPosition* pb = ub->position();
  if (!pa || !pb) return kUnreachable;
  return distance(*pa, *pb, use_manhattan);
}

std::vector<Unit*> units_within_range(UnitList units, std::string_view unit_id, double range,
                                      bool use_manhattan) {
  std::vector<Unit*> out;
  const Unit* ref = find_unit(units, unit_id);
  const MapPosition* origin = ref ? ref->position() : nullptr;
  if (!origin) return out;

  for (Unit* u : units) {
    if (!u || u == ref) continue;
    const MapPosition* p = u->position();
    if (p && distance(*origin, *p, use_manhattan) <= range) out.push_back(u);
  }
  return out;
}

std::vector<Unit*> adjacent_units(UnitList units, std::string_view unit_id, bool allow_diagonal) {
  std::vector<Unit*> out;
  const Unit* ref = find_unit(units, unit_id);
  const MapPosition* origin = ref ? ref->position() : nullptr;
  if (!origin) return out;

  for (Unit* u : units) {
    if (!u || u == ref) continue;
    const MapPosition* p = u->position();
    if (p && p->mapId == origin->mapId && adjacent(origin->position, p->position, allow_diagonal)) {
      out.push_back(u);
    }
  }
  return out;
}

} // namespace chronicle::world
