#pragma once

#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/world/Occupancy.hpp"
#include "chronicle/world/World.hpp"

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace chronicle::sim {

struct StepEvent {
  std::string unitId{};
  int stepIndex{0};    // 1-based
  int totalSteps{0};
  world::MapPosition position{};
};

using StepHandler = std::function<void(const StepEvent&)>;

// Writes planned steps into live unit state. Gates are honoured at the
// destination tile and collisions are resolved by nudging the mover.
class MovementApplier final {
public:
  MovementApplier(const world::World& world, const rules::GateRegistry& gates) noexcept
    : world_(&world), gates_(&gates) {}

  void set_step_cooldown_ms(int ms) noexcept { cooldownMs_ = ms < 0 ? 0 : ms; }
  [[nodiscard]] int step_cooldown_ms() const noexcept { return cooldownMs_; }

  // False when the step is on another map than the mover, out of bounds, or
  // neither the mover's tile nor 4-adjacent to it.
  // Throws MissingDataError for an unknown mover or one without a position.
  bool apply_step(std::string_view unit_id, const world::MapPosition& step, world::UnitList units);

  // Applies steps in order and returns how many succeeded; stops at the first failure.
  int apply_path(std::string_view unit_id, std::span<const world::MapPosition> steps, world::UnitList units,
                 const StepHandler& on_step = {});

  // Nearest free walkable tile to `around` (BFS, N/E/S/W), ignoring `unit_id`.
  // Adjacent tiles come first; when all of them are taken the search widens
  // ring by ring until the reachable area is exhausted.
  [[nodiscard]] std::optional<world::GridPoint> nearest_free_tile(const world::MapPosition& around,
                                                                  world::UnitList units,
                                                                  std::string_view unit_id) const;

private:
  void resolve_collisions(world::Unit& mover, world::UnitList units) const;

  const world::World* world_;
  const rules::GateRegistry* gates_;
  int cooldownMs_{0};
};

} // namespace chronicle::sim
