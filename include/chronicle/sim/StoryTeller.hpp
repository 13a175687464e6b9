#pragma once

#include "chronicle/ai/GoalSelector.hpp"
#include "chronicle/ai/MovementPlanner.hpp"
#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/ActionCatalog.hpp"
#include "chronicle/rules/EffectEngine.hpp"
#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/rules/StatTracker.hpp"
#include "chronicle/sim/Diary.hpp"
#include "chronicle/sim/MovementApplier.hpp"
#include "chronicle/world/UnitRoster.hpp"
#include "chronicle/world/World.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::sim {

// One prepared candidate: the concrete action plus any movement planned for it.
struct PreparedAction {
  rules::Action action{};
  const world::Unit* target{nullptr};
  ai::Path movementPath{};
  bool movedTowardsTarget{false};
};

struct ExecutedAction {
  int turn{0};
  rules::Action action{};
  std::string goalId{};
  ai::Path movementPath{};
  bool movedTowardsTarget{false};
  int stepsApplied{0};
  std::vector<rules::StatChange> changes{};
};

// Composes goal selection, movement and effects into a single actor turn.
// Exactly one step of a planned path is applied per turn.
class StoryTeller final {
public:
  StoryTeller(const world::World& world, world::UnitRoster& roster, const rules::GateRegistry& gates,
              const rules::ActionCatalog& catalog, const ai::GoalSelector& selector, Diary& diary, Rng& rng);

  StoryTeller(const StoryTeller&) = delete;
  StoryTeller& operator=(const StoryTeller&) = delete;

  // Restricts every unit to these action types (empty = no restriction).
  void set_override_actions(std::vector<std::string> types) { overrideActions_ = std::move(types); }
  void set_step_handler(StepHandler handler) { onStep_ = std::move(handler); }

  [[nodiscard]] MovementApplier& applier() noexcept { return applier_; }
  [[nodiscard]] const ai::MovementPlanner& planner() const noexcept { return planner_; }
  [[nodiscard]] rules::EffectEngine& effects() noexcept { return effects_; }

  // Runs `actor`'s turn and writes the diary entry. Missing data (no
  // position, unknown map) propagates to the caller.
  ExecutedAction take_turn(world::Unit& actor, const DiaryContext& ctx);

  [[nodiscard]] std::vector<rules::Action> available_actions(const world::Unit& unit) const;

  // Empty when the action needs a target and none exists.
  [[nodiscard]] std::optional<PreparedAction> prepare(const world::Unit& actor, const rules::Action& def,
                                                      world::UnitList units);

  [[nodiscard]] const world::Unit* select_target(const world::Unit& actor, const rules::Action& def,
                                                 world::UnitList units) const;

  [[nodiscard]] const std::vector<std::string>& story_history() const noexcept { return history_; }
  [[nodiscard]] std::optional<std::string> latest_story() const;

private:
  int apply_planned_move(const world::Unit& actor, const PreparedAction& prepared, world::UnitList units);
  void log_goal_choice(const world::Unit& actor, const ai::GoalChoice& choice, int turn) const;
  void log_changes(const rules::Action& action, const std::vector<rules::StatChange>& changes) const;

  world::UnitRoster* roster_;
  const rules::ActionCatalog* catalog_;
  const ai::GoalSelector* selector_;
  Diary* diary_;
  Rng* rng_;

  ai::MovementPlanner planner_;
  MovementApplier applier_;
  rules::EffectEngine effects_;

  std::vector<std::string> overrideActions_{};
  StepHandler onStep_{};
  std::vector<std::string> history_{};
};

// Action types that cannot run without a target (every hostile type needs one).
[[nodiscard]] bool requires_target(std::string_view type) noexcept;
[[nodiscard]] bool requires_hostile_target(std::string_view type) noexcept;
[[nodiscard]] bool requires_ally_target(std::string_view type) noexcept;

} // namespace chronicle::sim
