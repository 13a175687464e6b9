#pragma once

#include "chronicle/ai/Goal.hpp"
#include "chronicle/rules/Action.hpp"
#include "chronicle/world/Occupancy.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chronicle::ai {

struct GoalContext {
  std::span<const rules::Action> availableActions{};
  // When absent the selector cannot prove that no hostile exists and treats
  // AttackEnemy as eligible.
  std::optional<world::UnitList> units{};
  int turn{0};
};

struct ScoredGoal {
  const GoalDefinition* goal{nullptr};
  int score{0};
  std::string reason{};
  std::vector<rules::Action> actions{};   // executable candidates for this goal
};

struct GoalChoice {
  GoalDefinition goal{};
  std::optional<rules::Action> action{};
  std::vector<rules::Action> candidateActions{};
  std::string reason{};
  std::vector<ScoredGoal> evaluated{};   // every scored goal, best first
};

// Utility-based selector over a static goal catalog. Deterministic: ties keep
// catalog order and the first matching action wins.
class GoalSelector final {
public:
  explicit GoalSelector(GoalCatalog catalog = GoalCatalog::builtin()) : catalog_(std::move(catalog)) {}

  [[nodiscard]] GoalChoice choose(const world::Unit& unit, const GoalContext& ctx) const;

  // Scored goals (no action matching), sorted by score descending.
  [[nodiscard]] std::vector<ScoredGoal> evaluate(const world::Unit& unit, const GoalContext& ctx) const;

  [[nodiscard]] const GoalCatalog& catalog() const noexcept { return catalog_; }

private:
  GoalCatalog catalog_;
};

// Actions from `available` whose type is listed by the goal, in the goal's order.
[[nodiscard]] std::vector<rules::Action> actions_for_goal(const GoalDefinition& goal,
                                                          std::span<const rules::Action> available);

[[nodiscard]] GoalDefinition default_goal();

} // namespace chronicle::ai
