#pragma once

#include "chronicle/ai/GoalSelector.hpp"
#include "chronicle/core/Config.hpp"
#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/ActionCatalog.hpp"
#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/sim/Diary.hpp"
#include "chronicle/sim/StoryTeller.hpp"
#include "chronicle/sim/TurnOrder.hpp"
#include "chronicle/sim/TurnScheduler.hpp"
#include "chronicle/world/UnitRoster.hpp"
#include "chronicle/world/World.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::sim {

struct EngineHooks {
  std::function<void()> onStart{};
  std::function<void(int)> onTurnStart{};
  std::function<void(int, const ExecutedAction&)> onTurnEnd{};
  std::function<void()> onStop{};
};

// Read-only view handed to renderers between turns.
struct UnitView {
  std::string id{};
  std::string name{};
  std::optional<world::MapPosition> position{};
  double health{0.0};
  bool alive{false};
};

struct EngineSnapshot {
  SchedulerState scheduler{};
  std::vector<UnitView> units{};
};

enum class TurnOutcome : std::uint8_t {
  Acted,     // the actor ran the story pipeline (possibly ending in a logged failure)
  Skipped,   // actor dead, removed or cooling down
  Idle,      // no living unit to build a round from
};

// Owns the simulation and drives it one actor-turn at a time.
class Engine final {
public:
  explicit Engine(EngineConfig cfg = {});

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Loads catalogs and the diary from the data directory and resumes the turn
  // counter from the last recorded turn. Malformed catalogs throw ConfigError.
  void initialize();

  // One scheduler step. SchedulerError propagates.
  TurnOutcome run_turn();

  // Runs until `max_turns` actions (config limit when absent), a stop request,
  // or there is nobody left to act. Returns the number of actions taken.
  int run(std::optional<int> max_turns = std::nullopt);

  // Safe from another thread or a signal handler; honoured between turns.
  void request_stop() noexcept { stopRequested_.store(true); }

  // Idempotent. Persists diary.json and units.json.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_; }
  [[nodiscard]] EngineSnapshot snapshot() const;

  void set_hooks(EngineHooks hooks) { hooks_ = std::move(hooks); }

  [[nodiscard]] const EngineConfig& config() const noexcept { return cfg_; }
  [[nodiscard]] world::World& world() noexcept { return world_; }
  [[nodiscard]] world::UnitRoster& roster() noexcept { return roster_; }
  [[nodiscard]] rules::GateRegistry& gates() noexcept { return gates_; }
  [[nodiscard]] rules::ActionCatalog& actions() noexcept { return actions_; }
  [[nodiscard]] const ai::GoalSelector& selector() const noexcept { return selector_; }
  [[nodiscard]] TurnScheduler& scheduler() noexcept { return scheduler_; }
  [[nodiscard]] const TurnOrder& turn_order() const noexcept { return turnOrder_; }
  [[nodiscard]] Diary& diary() noexcept { return diary_; }
  [[nodiscard]] StoryTeller& story_teller() noexcept { return story_; }
  [[nodiscard]] Rng& rng() noexcept { return rng_; }
  [[nodiscard]] int session_turns() const noexcept { return sessionTurns_; }

private:
  [[nodiscard]] std::filesystem::path data_file(const char* name) const;
  [[nodiscard]] bool in_cooldown(const world::Unit& unit, int turn) const;
  // True when an actor from the current index onward is alive and off cooldown.
  [[nodiscard]] bool anyone_ready(int turn) const;

  EngineConfig cfg_;
  Rng rng_{};

  world::World world_{};
  world::UnitRoster roster_{};
  rules::GateRegistry gates_{};
  rules::ActionCatalog actions_{};
  ai::GoalSelector selector_{};
  Diary diary_{};
  TurnScheduler scheduler_{};
  TurnOrder turnOrder_{};
  StoryTeller story_;

  EngineHooks hooks_{};
  int sessionTurns_{0};
  bool running_{false};
  bool stopped_{false};
  std::atomic<bool> stopRequested_{false};
};

} // namespace chronicle::sim
