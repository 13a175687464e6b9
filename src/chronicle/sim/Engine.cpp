#include "chronicle/sim/Engine.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/world/UnitJson.hpp"

#include <chrono>
#include <thread>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace chronicle::sim {

namespace {

std::shared_ptr<spdlog::logger> engine_log() {
  return logsys::get("engine");
}

std::uint64_t seed_from(const EngineConfig& cfg) {
  if (cfg.seed != 0) return cfg.seed;
  return static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

} // namespace

Engine::Engine(EngineConfig cfg)
  : cfg_(std::move(cfg))
  , rng_(seed_from(cfg_))
  , actions_(rules::ActionCatalog::builtin())
  , story_(world_, roster_, gates_, actions_, selector_, diary_, rng_) {
  story_.set_override_actions(cfg_.overrideAvailableActions);
  story_.applier().set_step_cooldown_ms(cfg_.movementStepCooldownMs);
}

std::filesystem::path Engine::data_file(const char* name) const {
  return cfg_.dataDirectory / name;
}

void Engine::initialize() {
  engine_log()->info("Initializing engine (data: {})", cfg_.dataDirectory.string());

  rules::ActionCatalog::load_or_builtin(actions_, data_file("actions.json"));

  ai::GoalCatalog goals;
  ai::GoalCatalog::load_or_builtin(goals, data_file("goals.json"));
  selector_ = ai::GoalSelector(std::move(goals));

  try {
    diary_.load(data_file("diary.json"));
  } catch (const ConfigError& e) {
    engine_log()->warn("Ignoring unreadable diary ({})", e.what());
    diary_.clear();
  }

  SchedulerState state{};
  state.turn = diary_.last_turn();
  scheduler_.restore(state);
  engine_log()->info("Starting from turn: {}", state.turn + 1);
}

bool Engine::in_cooldown(const world::Unit& unit, int turn) const {
  const auto last = unit.number(world::prop::kLastActionTurn);
  return last && static_cast<double>(turn) - *last < static_cast<double>(cfg_.cooldownPeriod);
}

bool Engine::anyone_ready(int turn) const {
  const std::vector<std::string> order = scheduler_.turn_order();
  for (std::size_t i = static_cast<std::size_t>(scheduler_.turn_index_in_round()); i < order.size(); ++i) {
    const world::Unit* u = roster_.find(order[i]);
    if (u && world::is_alive(*u) && !in_cooldown(*u, turn)) return true;
  }
  return false;
}

TurnOutcome Engine::run_turn() {
  if (!scheduler_.round_active()) {
    std::vector<world::Unit*> units = roster_.units();
    const std::vector<std::string>& order = turnOrder_.refresh(units, rng_);
    if (order.empty()) {
      engine_log()->warn("No living units; nothing to schedule");
      return TurnOutcome::Idle;
    }
    scheduler_.start_new_round(order);
    logsys::get("turns")->info("Round {} begins: {}", scheduler_.current_round(), fmt::join(order, ", "));
  }

  const std::optional<std::string> actor_id = scheduler_.current_actor_id();
  if (!actor_id) throw SchedulerError("Active round without a current actor");

  const int turn = scheduler_.current_turn() + 1;
  DiaryContext ctx{};
  ctx.turn = turn;
  ctx.round = scheduler_.current_round();
  ctx.turnInRound = scheduler_.turn_index_in_round() + 1;
  ctx.turnOrder = scheduler_.turn_order();
  ctx.actorId = *actor_id;

  world::Unit* actor = roster_.find(*actor_id);
  if (!actor || !world::is_alive(*actor)) {
    logsys::get("turns")->info("{} is not available; skipping", *actor_id);
    scheduler_.skip_turn();
    return TurnOutcome::Skipped;
  }

  // Cooldowns are waived when nobody left in the round is ready.
  if (in_cooldown(*actor, turn) && anyone_ready(turn)) {
    logsys::get("turns")->info("{} is cooling down; skipping", actor->label());
    scheduler_.skip_turn();
    return TurnOutcome::Skipped;
  }

  if (hooks_.onTurnStart) hooks_.onTurnStart(turn);
  engine_log()->info("--- Turn {} (round {}, {}/{}) : {} ---", turn, ctx.round, ctx.turnInRound,
                     ctx.turnOrder.size(), actor->label());

  ExecutedAction executed{};
  executed.turn = turn;
  try {
    executed = story_.take_turn(*actor, ctx);

    TurnContext tctx{};
    tctx.round = ctx.round;
    tctx.turnInRound = ctx.turnInRound;
    tctx.turnOrder = ctx.turnOrder;
    tctx.actorId = ctx.actorId;
    scheduler_.process_action(executed.action, tctx);

    logsys::get("story")->info("Story Action: {}",
                               executed.action.description.empty() ? executed.action.type
                                                                   : executed.action.description);
  } catch (const std::runtime_error& e) {
    engine_log()->error("Turn {} failed for {}: {}", turn, actor->label(), e.what());
    diary_.record_system(fmt::format("Turn failed for {}: {}", actor->label(), e.what()), &ctx);
  }

  scheduler_.end_turn();
  ++sessionTurns_;
  if (hooks_.onTurnEnd) hooks_.onTurnEnd(turn, executed);
  return TurnOutcome::Acted;
}

int Engine::run(std::optional<int> max_turns) {
  const int limit = max_turns.value_or(cfg_.maxTurnsPerSession);
  const bool unlimited = !max_turns && cfg_.runIndefinitely;

  running_ = true;
  stopped_ = false;
  stopRequested_.store(false);
  sessionTurns_ = 0;
  if (hooks_.onStart) hooks_.onStart();
  engine_log()->info("Starting engine ({} turns)", unlimited ? std::string("unlimited") : std::to_string(limit));

  while (!stopRequested_.load() && (unlimited || sessionTurns_ < limit)) {
    const TurnOutcome outcome = run_turn();
    if (outcome == TurnOutcome::Idle) break;
    if (outcome == TurnOutcome::Acted && cfg_.turnIntervalMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.turnIntervalMs));
    }
  }

  stop();
  return sessionTurns_;
}

void Engine::stop() {
  if (stopped_) return;
  stopped_ = true;
  running_ = false;

  engine_log()->info("Stopping engine after {} turns", sessionTurns_);
  if (hooks_.onStop) hooks_.onStop();

  const bool diary_ok = diary_.save(data_file("diary.json"));
  const bool units_ok = world::SaveUnits(roster_, data_file("units.json"));
  if (diary_ok && units_ok) {
    engine_log()->info("State saved to {}", cfg_.dataDirectory.string());
  } else {
    engine_log()->error("Saving state to {} failed", cfg_.dataDirectory.string());
  }
}

EngineSnapshot Engine::snapshot() const {
  EngineSnapshot snap{};
  snap.scheduler = scheduler_.state();
  for (const world::Unit* u : roster_.units()) {
    UnitView v{};
    v.id = u->id();
    v.name = u->name();
    if (const world::MapPosition* p = u->position()) v.position = *p;
    v.health = u->number(world::prop::kHealth).value_or(0.0);
    v.alive = world::is_alive(*u);
    snap.units.push_back(std::move(v));
  }
  return snap;
}

} // namespace chronicle::sim
