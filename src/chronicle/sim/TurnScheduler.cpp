#include "chronicle/sim/TurnScheduler.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"

#include <algorithm>
#include <stdexcept>

namespace chronicle::sim {

void TurnScheduler::start_new_round(std::vector<std::string> order, std::optional<int> round_number) {
  if (order.empty()) throw SchedulerError("Cannot start a round with an empty turn order");
  if (state_.active()) throw SchedulerError("Cannot start a new round while one is in progress");

  state_.round = round_number.value_or(state_.round + 1);
  logsys::get("turns")->debug("Round {} started with {} actors", state_.round, order.size());
  state_.phase = RoundActive{std::move(order), 0};
}

std::optional<std::string> TurnScheduler::current_actor_id() const {
  const auto* r = std::get_if<RoundActive>(&state_.phase);
  if (!r || r->index >= r->turnOrder.size()) return std::nullopt;
  return r->turnOrder[r->index];
}

void TurnScheduler::end_turn() {
  ++state_.turn;
  advance();
}

void TurnScheduler::skip_turn() {
  if (const auto actor = current_actor_id()) {
    logsys::get("turns")->info("Skipping turn for {}", *actor);
  }
  advance();
}

void TurnScheduler::advance() {
  auto* r = std::get_if<RoundActive>(&state_.phase);
  if (!r) return;

  ++r->index;
  if (r->index >= r->turnOrder.size()) {
    logsys::get("turns")->debug("Round {} complete", state_.round);
    state_.phase = Idle{};
  }
}

void TurnScheduler::process_action(const rules::Action& action, const TurnContext& context) {
  if (action.type.empty() || action.player.empty()) {
    throw std::invalid_argument("Invalid action: type and player are required");
  }

  const auto it = std::find_if(history_.begin(), history_.end(),
                               [&](const Turn& t) { return t.number == state_.turn; });
  if (it != history_.end()) {
    it->actions.push_back(action);
    return;
  }

  Turn t{};
  t.number = state_.turn;
  t.round = context.round.value_or(state_.round);
  t.turnInRound = context.turnInRound.value_or(turn_index_in_round() + 1);
  t.turnOrder = context.turnOrder ? *context.turnOrder : turn_order();
  t.actorId = context.actorId.value_or(action.player);
  t.actions.push_back(action);
  history_.push_back(std::move(t));
}

void TurnScheduler::reset() {
  state_ = SchedulerState{};
  history_.clear();
}

bool TurnScheduler::has_pending_turns() const noexcept {
  const auto* r = std::get_if<RoundActive>(&state_.phase);
  return r && r->index < r->turnOrder.size();
}

int TurnScheduler::turn_index_in_round() const noexcept {
  const auto* r = std::get_if<RoundActive>(&state_.phase);
  return r ? static_cast<int>(r->index) : 0;
}

std::vector<std::string> TurnScheduler::turn_order() const {
  const auto* r = std::get_if<RoundActive>(&state_.phase);
  return r ? r->turnOrder : std::vector<std::string>{};
}

void TurnScheduler::restore(SchedulerState state) {
  // A round that was already exhausted (or empty) is stored as idle.
  if (const auto* r = std::get_if<RoundActive>(&state.phase)) {
    if (r->index >= r->turnOrder.size()) state.phase = Idle{};
  }
  state_ = std::move(state);
}

} // namespace chronicle::sim
