#include "chronicle/ai/MovementPlanner.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace chronicle::ai {

namespace {

struct Visit {
  world::MapPosition parent{};   // node the step was taken from
  world::MapPosition step{};     // tile entered (gate mouth when teleporting)
  bool root{false};
};

world::MapPosition planar(const world::MapPosition& p) {
  return world::MapPosition{p.mapId, world::GridPoint{p.position.x, p.position.y}};
}

int to_range(double r) {
  if (!std::isfinite(r) || r < 0.0) return 0;
  return static_cast<int>(std::floor(r));
}

} // namespace

int MovementPlanner::movement_range(const world::Unit& u) {
  const auto v = u.number(world::prop::kMovementRange);
  if (!v) return 0;
  return to_range(*v);
}

std::vector<world::MapPosition> MovementPlanner::goal_tiles(const world::MapPosition& target, int range) const {
  const world::TileMap& map = world_->get_map(target.mapId);
  range = std::max(0, range);

  std::vector<world::MapPosition> out;
  for (int dy = -range; dy <= range; ++dy) {
    const int span = range - (dy < 0 ? -dy : dy);
    for (int dx = -span; dx <= span; ++dx) {
      const int x = target.position.x + dx;
      const int y = target.position.y + dy;
      if (map.is_walkable(x, y)) out.push_back(world::MapPosition{target.mapId, world::GridPoint{x, y}});
    }
  }
  return out;
}

Path MovementPlanner::plan(const world::MapPosition& from, const world::MapPosition& target, int action_range,
                           int max_steps, const world::OccupancySnapshot& occupied) const {
  (void)world_->get_map(from.mapId);

  const auto goals_vec = goal_tiles(target, action_range);
  if (goals_vec.empty()) throw NoGoalPositionsError();
  const std::unordered_set<world::MapPosition, world::MapPositionHash> goals(goals_vec.begin(), goals_vec.end());

  const world::MapPosition start = planar(from);
  if (goals.count(start) != 0 || max_steps <= 0) return {};

  std::unordered_map<world::MapPosition, Visit, world::MapPositionHash> visited;
  std::deque<world::MapPosition> open;
  visited.emplace(start, Visit{start, start, true});
  open.push_back(start);

  std::optional<world::MapPosition> reached;
  while (!open.empty() && !reached) {
    const world::MapPosition cur = open.front();
    open.pop_front();

    const world::TileMap* map = world_->find_map(cur.mapId);
    if (!map) continue;

    for (const world::GridPoint& d : world::kCardinalOffsets) {
      const int nx = cur.position.x + d.x;
      const int ny = cur.position.y + d.y;
      if (!map->is_walkable(nx, ny)) continue;
      if (occupied.occupied(cur.mapId, nx, ny)) continue;

      const world::MapPosition step{cur.mapId, world::GridPoint{nx, ny}};
      world::MapPosition node = step;

      if (const rules::Gate* gate = gates_->destination(cur.mapId, nx, ny)) {
        const world::TileMap* dest = world_->find_map(gate->mapTo);
        if (!dest || !dest->is_walkable(gate->positionTo)) continue;
        node = world::MapPosition{gate->mapTo, gate->positionTo};
        if (occupied.occupied(node)) continue;
      }

      if (visited.count(node) != 0) continue;
      visited.emplace(node, Visit{cur, step, false});

      if (goals.count(node) != 0) {
        reached = node;
        break;
      }
      open.push_back(node);
    }
  }

  if (!reached) throw NoPathError();

  Path path;
  for (world::MapPosition n = *reached;;) {
    const Visit& v = visited.at(n);
    if (v.root) break;
    path.push_back(v.step);
    n = v.parent;
  }
  std::reverse(path.begin(), path.end());

  if (path.size() > static_cast<std::size_t>(max_steps)) path.resize(static_cast<std::size_t>(max_steps));

  // Carry the mover's z through the plan.
  for (world::MapPosition& p : path) p.position.z = from.position.z;
  return path;
}

MovementPlan MovementPlanner::plan_toward(const world::Unit& mover, const world::Unit& target,
                                          world::UnitList units, double action_range) const {
  const world::MapPosition& goal = target.require_position();
  MovementPlan plan = plan_toward(mover, goal, units, action_range);
  if (!plan.steps.empty()) {
    const auto& first = plan.steps.front().position;
    logsys::get("world")->info("Planned move for {} -> {}: step to ({}, {})", mover.label(), target.label(),
                               first.x, first.y);
  }
  return plan;
}

MovementPlan MovementPlanner::plan_toward(const world::Unit& mover, const world::MapPosition& target,
                                          world::UnitList units, double action_range) const {
  const int steps = movement_range(mover);
  if (steps == 0) return {};

  const world::MapPosition& from = mover.require_position();
  const double d = world::distance(from, target, true);
  if (d <= action_range) {
    logsys::get("world")->debug("Target already in range for {}: distance {} <= range {}", mover.label(), d,
                                action_range);
    return {};
  }

  const auto occupied = world::OccupancySnapshot::capture(units, mover.id());
  MovementPlan plan;
  plan.steps = this->plan(from, target, to_range(action_range), steps, occupied);
  plan.movedTowardsTarget = !plan.steps.empty();
  return plan;
}

Path MovementPlanner::plan_explore(const world::Unit& mover, world::UnitList units, Rng& rng) const {
  const int range = movement_range(mover);
  if (range == 0) return {};

  const world::MapPosition& from = mover.require_position();
  const world::TileMap& map = world_->get_map(from.mapId);
  const auto occupied = world::OccupancySnapshot::capture(units, mover.id());

  std::vector<world::MapPosition> candidates;
  for (int dy = -range; dy <= range; ++dy) {
    for (int dx = -range; dx <= range; ++dx) {
      if ((dx < 0 ? -dx : dx) + (dy < 0 ? -dy : dy) > range) continue;
      if (dx == 0 && dy == 0) continue;

      const int x = from.position.x + dx;
      const int y = from.position.y + dy;
      if (!map.is_walkable(x, y)) continue;
      if (occupied.occupied(from.mapId, x, y)) continue;
      candidates.push_back(world::MapPosition{from.mapId, world::GridPoint{x, y}});
    }
  }

  const world::MapPosition* target = rng.pick(std::span<const world::MapPosition>(candidates));
  if (!target) {
    logsys::get("world")->info("No available exploration target for {}", mover.label());
    return {};
  }
  return plan(from, *target, 0, range, occupied);
}

} // namespace chronicle::ai
