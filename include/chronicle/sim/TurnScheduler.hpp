#pragma once

#include "chronicle/rules/Action.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chronicle::sim {

// ----------------------------------------------------------------------------
// Scheduler state
// ----------------------------------------------------------------------------
struct Idle {};

struct RoundActive {
  std::vector<std::string> turnOrder{};   // fixed for the round
  std::size_t index{0};                   // next actor, always < turnOrder.size()
};

using RoundPhase = std::variant<Idle, RoundActive>;

// Plain, copyable snapshot of the scheduler. Exported for persistence and
// renderers; restore() accepts it back.
struct SchedulerState {
  int turn{0};    // global counter, incremented by every end_turn()
  int round{0};   // last started round
  RoundPhase phase{Idle{}};

  [[nodiscard]] bool active() const noexcept { return std::holds_alternative<RoundActive>(phase); }
};

struct TurnContext {
  std::optional<int> round{};
  std::optional<int> turnInRound{};
  std::optional<std::vector<std::string>> turnOrder{};
  std::optional<std::string> actorId{};
};

struct Turn {
  int number{0};
  int round{0};
  int turnInRound{0};   // 1-based
  std::vector<std::string> turnOrder{};
  std::string actorId{};
  std::vector<rules::Action> actions{};
};

// Idle -> RoundActive (start_new_round) -> Idle once every actor in the
// order has ended or skipped its turn.
class TurnScheduler final {
public:
  TurnScheduler() = default;
  explicit TurnScheduler(SchedulerState state) { restore(std::move(state)); }

  // Throws SchedulerError on an empty order or while a round is active.
  // The round number defaults to current + 1.
  void start_new_round(std::vector<std::string> order, std::optional<int> round_number = std::nullopt);

  // Empty when idle.
  [[nodiscard]] std::optional<std::string> current_actor_id() const;

  // Increments the global turn and advances the round.
  void end_turn();

  // Advances the round without consuming a global turn (unavailable actor).
  void skip_turn();

  // Records `action` in the history of the current turn. Throws
  // std::invalid_argument when its type or player is empty.
  void process_action(const rules::Action& action, const TurnContext& context = {});

  void reset();

  [[nodiscard]] int current_turn() const noexcept { return state_.turn; }
  [[nodiscard]] int current_round() const noexcept { return state_.round; }
  [[nodiscard]] bool round_active() const noexcept { return state_.active(); }
  [[nodiscard]] bool has_pending_turns() const noexcept;

  // 0-based index of the next actor; 0 when idle.
  [[nodiscard]] int turn_index_in_round() const noexcept;

  // Empty when idle.
  [[nodiscard]] std::vector<std::string> turn_order() const;

  [[nodiscard]] const std::vector<Turn>& history() const noexcept { return history_; }

  [[nodiscard]] const SchedulerState& state() const noexcept { return state_; }
  void restore(SchedulerState state);

private:
  void advance();

  SchedulerState state_{};
  std::vector<Turn> history_{};
};

} // namespace chronicle::sim
