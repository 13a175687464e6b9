#include "chronicle/ai/GoalSelector.hpp"
#include "chronicle/rules/Relationship.hpp"

#include <algorithm>

namespace chronicle::ai {

namespace {

// Missing or non-positive maximum => treated as full.
double ratio(const world::Unit& u, std::string_view value, std::string_view max) {
  const double cur = u.number(value).value_or(0.0);
  const double cap = u.number(max).value_or(0.0);
  return cap > 0.0 ? cur / cap : 1.0;
}

bool has_hostile(const world::Unit& unit, world::UnitList units) {
  for (const world::Unit* other : units) {
    if (!other || other->id() == unit.id()) continue;
    if (!world::is_alive(*other)) continue;
    if (rules::is_hostile(unit, *other)) return true;
  }
  return false;
}

} // namespace

std::vector<rules::Action> actions_for_goal(const GoalDefinition& goal, std::span<const rules::Action> available) {
  std::vector<rules::Action> out;
  for (const std::string& type : goal.candidateActions) {
    const auto it = std::find_if(available.begin(), available.end(),
                                 [&](const rules::Action& a) { return a.type == type; });
    if (it != available.end()) out.push_back(*it);
  }
  return out;
}

GoalDefinition default_goal() {
  GoalDefinition g{};
  g.id = "Default";
  g.label = "Default";
  return g;
}

std::vector<ScoredGoal> GoalSelector::evaluate(const world::Unit& unit, const GoalContext& ctx) const {
  const double health = ratio(unit, world::prop::kHealth, world::prop::kMaxHealth);
  const double mana = ratio(unit, world::prop::kMana, world::prop::kMaxMana);

  std::vector<ScoredGoal> scored;
  for (const GoalDefinition& goal : catalog_.goals()) {
    if (goal.id == goal_id::kRecoverHealth) {
      if (health < 0.30) {
        scored.push_back({&goal, 100, "Health critically low", {}});
      } else if (health < 0.60) {
        scored.push_back({&goal, 75, "Health below comfort threshold", {}});
      }
    } else if (goal.id == goal_id::kRecoverMana) {
      if (mana < 0.25) {
        scored.push_back({&goal, 70, "Mana critically low", {}});
      } else if (mana < 0.50) {
        scored.push_back({&goal, 45, "Mana running low", {}});
      }
    } else if (goal.id == goal_id::kAttackEnemy) {
      const bool hostile = !ctx.units || has_hostile(unit, *ctx.units);
      if (hostile) {
        scored.push_back({&goal, health > 0.35 ? 60 : 25,
                          ctx.units ? "Hostile target nearby" : "Default offensive posture", {}});
      }
    } else if (goal.id == goal_id::kExplore) {
      scored.push_back({&goal, 10, "Fallback exploration", {}});
    }
  }

  std::stable_sort(scored.begin(), scored.end(),
                   [](const ScoredGoal& a, const ScoredGoal& b) { return a.score > b.score; });
  return scored;
}

GoalChoice GoalSelector::choose(const world::Unit& unit, const GoalContext& ctx) const {
  GoalChoice choice{};
  choice.evaluated = evaluate(unit, ctx);
  for (ScoredGoal& s : choice.evaluated) s.actions = actions_for_goal(*s.goal, ctx.availableActions);

  for (const ScoredGoal& s : choice.evaluated) {
    if (s.actions.empty()) continue;
    choice.goal = *s.goal;
    choice.action = s.actions.front();
    choice.candidateActions = s.actions;
    choice.reason = s.reason;
    return choice;
  }

  // Nothing executable: first available action, paired with the best goal.
  if (!ctx.availableActions.empty()) choice.action = ctx.availableActions.front();
  choice.candidateActions.assign(ctx.availableActions.begin(), ctx.availableActions.end());

  if (!choice.evaluated.empty()) {
    choice.goal = *choice.evaluated.front().goal;
    choice.reason = choice.evaluated.front().reason;
  } else if (!catalog_.empty()) {
    choice.goal = catalog_.goals().front();
    choice.reason = "Fallback selection";
  } else {
    choice.goal = default_goal();
    choice.reason = "Fallback selection";
  }
  return choice;
}

} // namespace chronicle::ai
