#include "chronicle/sim/MovementApplier.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"

#include <chrono>
#include <deque>
#include <thread>
#include <unordered_set>

namespace chronicle::sim {

namespace {

std::shared_ptr<spdlog::logger> world_log() {
  return logsys::get("world");
}

world::Unit& require_unit(world::UnitList units, std::string_view unit_id) {
  world::Unit* u = world::find_unit(units, unit_id);
  if (!u) throw MissingDataError("Unit " + std::string(unit_id) + " not found");
  return *u;
}

} // namespace

bool MovementApplier::apply_step(std::string_view unit_id, const world::MapPosition& step, world::UnitList units) {
  world::Unit& unit = require_unit(units, unit_id);
  const world::MapPosition current = unit.require_position();

  if (step.mapId != current.mapId) {
    world_log()->warn("Step for {} is on {} but the unit is on {}", unit.label(), step.mapId, current.mapId);
    return false;
  }

  // Steps are checked against the live position, which an earlier nudge may have changed.
  if (!(step.position == current.position) && !world::adjacent(current.position, step.position, false)) {
    world_log()->warn("Step for {} to ({}, {}) is not adjacent to ({}, {})", unit.label(), step.position.x,
                      step.position.y, current.position.x, current.position.y);
    return false;
  }

  if (const rules::Gate* gate = gates_->destination(step.mapId, step.position.x, step.position.y)) {
    world::MapPosition dest{gate->mapTo, world::GridPoint{gate->positionTo.x, gate->positionTo.y,
                                                          current.position.z}};
    unit.set(world::prop::kPosition, dest);
    world_log()->info("{} moved through gate '{}' from {} ({}, {}) to {} ({}, {})", unit.label(), gate->name,
                      step.mapId, step.position.x, step.position.y, dest.mapId, dest.position.x,
                      dest.position.y);
    resolve_collisions(unit, units);
    return true;
  }

  const world::TileMap& map = world_->get_map(step.mapId);
  if (!map.in_bounds(step.position)) {
    world_log()->warn("Invalid step for {}: ({}, {}) is outside {}", unit.label(), step.position.x,
                      step.position.y, map.name());
    return false;
  }

  world::MapPosition next{step.mapId, world::GridPoint{step.position.x, step.position.y, current.position.z}};
  unit.set(world::prop::kPosition, next);
  world_log()->debug("{} moved to ({}, {}) on {}", unit.label(), next.position.x, next.position.y, next.mapId);

  resolve_collisions(unit, units);
  return true;
}

int MovementApplier::apply_path(std::string_view unit_id, std::span<const world::MapPosition> steps,
                                world::UnitList units, const StepHandler& on_step) {
  int applied = 0;
  const int total = static_cast<int>(steps.size());

  for (const world::MapPosition& step : steps) {
    if (!apply_step(unit_id, step, units)) {
      world_log()->warn("Movement of {} stopped after {}/{} steps", unit_id, applied, total);
      break;
    }
    ++applied;

    if (on_step) {
      const world::Unit& unit = require_unit(units, unit_id);
      on_step(StepEvent{std::string(unit_id), applied, total, unit.require_position()});
    }

    if (cooldownMs_ > 0 && applied < total) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cooldownMs_));
    }
  }
  return applied;
}

std::optional<world::GridPoint> MovementApplier::nearest_free_tile(const world::MapPosition& around,
                                                                   world::UnitList units,
                                                                   std::string_view unit_id) const {
  const world::TileMap& map = world_->get_map(around.mapId);
  const auto occupied = world::OccupancySnapshot::capture(units, unit_id);

  struct PointHash {
    std::size_t operator()(const world::GridPoint& p) const noexcept {
      return (static_cast<std::size_t>(static_cast<std::uint32_t>(p.x)) << 32)
           ^ static_cast<std::size_t>(static_cast<std::uint32_t>(p.y));
    }
  };

  std::unordered_set<world::GridPoint, PointHash> seen;
  std::deque<world::GridPoint> open;
  const world::GridPoint start{around.position.x, around.position.y};
  seen.insert(start);
  open.push_back(start);

  while (!open.empty()) {
    const world::GridPoint cur = open.front();
    open.pop_front();

    for (const world::GridPoint& d : world::kCardinalOffsets) {
      const world::GridPoint n{cur.x + d.x, cur.y + d.y};
      if (!map.is_walkable(n)) continue;
      if (!seen.insert(n).second) continue;
      if (!occupied.occupied(around.mapId, n.x, n.y)) return n;
      open.push_back(n);
    }
  }
  return std::nullopt;
}

void MovementApplier::resolve_collisions(world::Unit& mover, world::UnitList units) const {
  const world::MapPosition here = mover.require_position();
  const auto others = world::units_at(units, here.mapId, here.position.x, here.position.y);
  if (others.size() <= 1) return;

  const auto free = nearest_free_tile(here, units, mover.id());
  if (!free) {
    world_log()->warn("Collision at {} ({}, {}): no free tile to nudge {} into", here.mapId, here.position.x,
                      here.position.y, mover.label());
    return;
  }

  mover.set(world::prop::kPosition,
            world::MapPosition{here.mapId, world::GridPoint{free->x, free->y, here.position.z}});
  world_log()->info("Collision at {} ({}, {}): moved {} to ({}, {})", here.mapId, here.position.x,
                    here.position.y, mover.label(), free->x, free->y);
}

} // namespace chronicle::sim
