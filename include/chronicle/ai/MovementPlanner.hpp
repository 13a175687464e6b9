#pragma once

#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/world/Occupancy.hpp"
#include "chronicle/world/World.hpp"

#include <vector>

namespace chronicle::ai {

using Path = std::vector<world::MapPosition>;

struct MovementPlan {
  Path steps{};
  bool movedTowardsTarget{false};
};

// Breadth-first planner over walkable, unoccupied tiles. Neighbours are
// visited N, E, S, W so identical input always yields the identical path.
// Entering a gate mouth records that tile as a step; the search continues
// from the gate's destination tile.
//
// The planner never mutates units; occupancy comes from a snapshot.
class MovementPlanner final {
public:
  MovementPlanner(const world::World& world, const rules::GateRegistry& gates) noexcept
    : world_(&world), gates_(&gates) {}

  // Shortest path from `from` to the nearest tile within Manhattan
  // `action_range` of `target`, truncated to `max_steps`.
  // Throws NoGoalPositionsError, NoPathError, or MissingDataError for unknown maps.
  [[nodiscard]] Path plan(const world::MapPosition& from, const world::MapPosition& target, int action_range,
                          int max_steps, const world::OccupancySnapshot& occupied) const;

  // Empty plan when the mover cannot move or is already in range.
  [[nodiscard]] MovementPlan plan_toward(const world::Unit& mover, const world::Unit& target,
                                         world::UnitList units, double action_range) const;
  [[nodiscard]] MovementPlan plan_toward(const world::Unit& mover, const world::MapPosition& target,
                                         world::UnitList units, double action_range) const;

  // Random walkable, unoccupied tile within movement range (never the
  // current one), then a BFS toward it. Empty when there is no candidate.
  [[nodiscard]] Path plan_explore(const world::Unit& mover, world::UnitList units, Rng& rng) const;

  // Walkable tiles within Manhattan `range` of `target` on the target's map.
  [[nodiscard]] std::vector<world::MapPosition> goal_tiles(const world::MapPosition& target, int range) const;

  // floor(movementRange), 0 when missing or negative.
  [[nodiscard]] static int movement_range(const world::Unit& u);

private:
  const world::World* world_;
  const rules::GateRegistry* gates_;
};

} // namespace chronicle::ai
