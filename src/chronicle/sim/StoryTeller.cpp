#include "chronicle/sim/StoryTeller.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/rules/Relationship.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace chronicle::sim {

namespace {

constexpr std::array<std::string_view, 5> kTargetedTypes{"interact", "attack", "support", "trade", "inspire"};
constexpr std::array<std::string_view, 7> kHostileTypes{"attack", "desperate_attack", "ranged_attack", "shoot",
                                                        "stab",   "melee",            "cast_attack"};
constexpr std::array<std::string_view, 3> kAllyTypes{"support", "heal", "inspire"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& list, std::string_view type) noexcept {
  return std::find(list.begin(), list.end(), type) != list.end();
}

std::shared_ptr<spdlog::logger> story_log() {
  return logsys::get("story");
}

std::vector<std::string> action_types(std::span<const rules::Action> actions) {
  std::vector<std::string> out;
  out.reserve(actions.size());
  for (const rules::Action& a : actions) out.push_back(a.type);
  return out;
}

} // namespace

bool requires_target(std::string_view type) noexcept {
  return contains(kTargetedTypes, type) || contains(kHostileTypes, type);
}

bool requires_hostile_target(std::string_view type) noexcept {
  return contains(kHostileTypes, type);
}

bool requires_ally_target(std::string_view type) noexcept {
  return contains(kAllyTypes, type);
}

StoryTeller::StoryTeller(const world::World& world, world::UnitRoster& roster, const rules::GateRegistry& gates,
                         const rules::ActionCatalog& catalog, const ai::GoalSelector& selector, Diary& diary,
                         Rng& rng)
  : roster_(&roster)
  , catalog_(&catalog)
  , selector_(&selector)
  , diary_(&diary)
  , rng_(&rng)
  , planner_(world, gates)
  , applier_(world, gates)
  , effects_(rng, &catalog) {}

std::vector<rules::Action> StoryTeller::available_actions(const world::Unit& unit) const {
  return catalog_->available_for(unit, overrideActions_);
}

// ----------------------------------------------------------------------------
// Target selection
// ----------------------------------------------------------------------------
const world::Unit* StoryTeller::select_target(const world::Unit& actor, const rules::Action& def,
                                              world::UnitList units) const {
  if (!requires_target(def.type) || units.size() <= 1) return nullptr;

  std::vector<world::Unit*> alive;
  for (world::Unit* u : units) {
    if (u && u->id() != actor.id() && world::is_alive(*u)) alive.push_back(u);
  }

  std::vector<world::Unit*> pool;
  if (requires_hostile_target(def.type)) {
    for (world::Unit* u : alive) {
      if (rules::is_hostile(actor, *u)) pool.push_back(u);
    }
    if (pool.empty()) return nullptr;
  } else if (requires_ally_target(def.type)) {
    for (world::Unit* u : alive) {
      if (rules::is_ally(actor, *u)) pool.push_back(u);
    }
  }
  if (pool.empty()) pool = alive;
  if (pool.empty()) return nullptr;

  struct Scored {
    world::Unit* unit;
    double distance;
  };
  std::vector<Scored> scored;
  for (world::Unit* u : pool) scored.push_back({u, world::distance_between(units, actor.id(), u->id())});

  const auto keep_if = [&](auto pred) {
    std::vector<Scored> kept;
    std::copy_if(scored.begin(), scored.end(), std::back_inserter(kept), pred);
    if (!kept.empty()) scored = std::move(kept);
  };

  const double range = rules::action_range(def);
  keep_if([](const Scored& s) { return std::isfinite(s.distance); });
  keep_if([&](const Scored& s) { return s.distance <= range; });
  std::stable_sort(scored.begin(), scored.end(),
                   [](const Scored& a, const Scored& b) { return a.distance < b.distance; });

  return scored.front().unit;
}

// ----------------------------------------------------------------------------
// Preparation
// ----------------------------------------------------------------------------
std::optional<PreparedAction> StoryTeller::prepare(const world::Unit& actor, const rules::Action& def,
                                                   world::UnitList units) {
  const world::Unit* target = select_target(actor, def, units);
  if (requires_target(def.type) && !target) {
    story_log()->info("Skipping action {} for {}: no valid target", def.type, actor.label());
    return std::nullopt;
  }

  PreparedAction out{};
  out.target = target;
  out.action = def;
  out.action.player = actor.id();
  out.action.payload = rules::resolve_payload(def.payload, target, *rng_);
  if (target) out.action.payload.insert_or_assign(std::string(rules::payload_key::kTargetUnit), target->id());

  try {
    if (def.type == "explore") {
      out.movementPath = planner_.plan_explore(actor, units, *rng_);
    } else if (target) {
      ai::MovementPlan plan = planner_.plan_toward(actor, *target, units, rules::action_range(def));
      out.movementPath = std::move(plan.steps);
      out.movedTowardsTarget = plan.movedTowardsTarget;
    }
  } catch (const PlanningError& e) {
    story_log()->warn("Unable to plan move for {} ({}): {}", actor.label(), def.type, e.what());
  } catch (const MissingDataError& e) {
    story_log()->warn("Unable to plan move for {} ({}): {}", actor.label(), def.type, e.what());
  }

  if (out.movedTowardsTarget) {
    out.action.payload.insert_or_assign("movedTowardsTarget", rules::PayloadValue(std::in_place_type<bool>, true));
    out.action.description = fmt::format("{} is moving closer to {}", actor.name(), target->name());
  } else {
    out.action.description = rules::render_description(def.description, actor.name(), actor.kind(),
                                                       target ? std::string_view(target->name())
                                                              : std::string_view("another unit"));
  }
  return out;
}

// ----------------------------------------------------------------------------
// Turn
// ----------------------------------------------------------------------------
ExecutedAction StoryTeller::take_turn(world::Unit& actor, const DiaryContext& ctx) {
  std::vector<world::Unit*> all = roster_->units();
  const world::UnitList units(all);
  const rules::StatSnapshot before = rules::take_snapshot(units);

  const std::vector<rules::Action> available = available_actions(actor);

  ai::GoalContext gctx{};
  gctx.availableActions = available;
  gctx.units = units;
  gctx.turn = ctx.turn;
  const ai::GoalChoice choice = selector_->choose(actor, gctx);
  log_goal_choice(actor, choice, ctx.turn);

  const std::vector<rules::Action>& prioritized =
      choice.candidateActions.empty() ? available : choice.candidateActions;

  std::vector<PreparedAction> candidates;
  for (const rules::Action& def : prioritized) {
    if (auto p = prepare(actor, def, units)) candidates.push_back(std::move(*p));
  }

  ExecutedAction executed{};
  executed.turn = ctx.turn;
  executed.goalId = choice.goal.id;
  executed.action = rules::default_action(actor);

  for (const PreparedAction& candidate : candidates) {
    const rules::EffectResult result = effects_.execute_action_effect(candidate.action, units);
    const bool move_instead = !result.success && result.failure == rules::FailureKind::Range &&
                              candidate.movedTowardsTarget;

    if (result.success || move_instead) {
      if (move_instead) {
        story_log()->info("Action {} could not execute; applying planned move instead", candidate.action.type);
      }
      executed.action = candidate.action;
      executed.movementPath = candidate.movementPath;
      executed.movedTowardsTarget = candidate.movedTowardsTarget;
      executed.stepsApplied = apply_planned_move(actor, candidate, units);
      break;
    }

    story_log()->warn("Action {} failed ({}), trying next candidate", candidate.action.type,
                      result.errorMessage.empty() ? "unknown reason" : result.errorMessage);
    if (candidate.movedTowardsTarget && candidate.target) {
      story_log()->info("Planned move toward {} skipped because {} failed", candidate.target->label(),
                        candidate.action.type);
    }
  }

  actor.set(world::prop::kLastActionTurn, static_cast<double>(ctx.turn));

  executed.changes = rules::compare_snapshots(before, units);
  log_changes(executed.action, executed.changes);

  const std::string text = executed.action.description.empty()
                                ? executed.action.type + " action by " + executed.action.player
                                : executed.action.description;
  history_.push_back(fmt::format("Turn {}: {}", ctx.turn, text));

  diary_->record(executed.action, ctx, executed.changes);
  return executed;
}

int StoryTeller::apply_planned_move(const world::Unit& actor, const PreparedAction& prepared,
                                    world::UnitList units) {
  if (prepared.movementPath.empty()) return 0;

  const std::span<const world::MapPosition> first = std::span(prepared.movementPath).first(1);
  try {
    return applier_.apply_path(actor.id(), first, units, onStep_);
  } catch (const MissingDataError& e) {
    story_log()->warn("Planned move failed for {}: {}", actor.label(), e.what());
    return 0;
  }
}

std::optional<std::string> StoryTeller::latest_story() const {
  if (history_.empty()) return std::nullopt;
  return history_.back();
}

// ----------------------------------------------------------------------------
// Logging
// ----------------------------------------------------------------------------
void StoryTeller::log_goal_choice(const world::Unit& actor, const ai::GoalChoice& choice, int turn) const {
  auto log = story_log();
  if (choice.evaluated.empty()) {
    log->info("Goal evaluation for {} (turn {}): no scored goals", actor.label(), turn);
  } else {
    log->info("Goal evaluation for {} (turn {}):", actor.label(), turn);
    for (const ai::ScoredGoal& s : choice.evaluated) {
      const std::vector<std::string> types = action_types(s.actions);
      log->info("  {} ({}) score {}: {}. Actions: {}", s.goal->label, s.goal->id, s.score, s.reason,
                types.empty() ? std::string("none") : fmt::format("{}", fmt::join(types, ", ")));
    }
  }

  log->info("Goal selection: {} ({}) -> {} ({})", choice.goal.label, choice.goal.id,
            choice.action ? choice.action->type : std::string("none"),
            choice.reason.empty() ? std::string("no reason") : choice.reason);
}

void StoryTeller::log_changes(const rules::Action& action, const std::vector<rules::StatChange>& changes) const {
  if (changes.empty()) return;

  auto log = story_log();
  log->info("Stat changes for action: {} by {}", action.type, action.player);
  for (const rules::UnitChanges& group : rules::group_by_unit(changes)) {
    log->info("  {} ({}): {}", group.unitName, group.unitId,
              fmt::join(rules::format_changes(group.changes), ", "));
  }
}

} // namespace chronicle::sim
