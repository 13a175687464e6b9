#pragma once

#include "chronicle/world/Unit.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chronicle::ai {

enum class GoalScope : std::uint8_t { Unit, Squad };
enum class CompletionKind : std::uint8_t { None, StatAtLeast, ConditionMet };

struct GoalCompletion {
  CompletionKind kind{CompletionKind::None};
  std::string property{};     // StatAtLeast
  double value{0.0};          // StatAtLeast
  std::string condition{};    // ConditionMet, e.g. "health >= 60"
};

struct GoalDefinition {
  std::string id{};
  std::string label{};
  GoalScope scope{GoalScope::Unit};
  GoalCompletion completion{};
  std::vector<std::string> candidateActions{};   // action types, in preference order
};

namespace goal_id {
inline constexpr std::string_view kRecoverHealth = "RecoverHealth";
inline constexpr std::string_view kRecoverMana = "RecoverMana";
inline constexpr std::string_view kAttackEnemy = "AttackEnemy";
inline constexpr std::string_view kExplore = "Explore";
} // namespace goal_id

void from_json(const nlohmann::json& j, GoalDefinition& g);
void to_json(nlohmann::json& j, const GoalDefinition& g);

class GoalCatalog final {
public:
  GoalCatalog() = default;
  explicit GoalCatalog(std::vector<GoalDefinition> goals) : goals_(std::move(goals)) {}

  [[nodiscard]] static GoalCatalog builtin();

  // Accepts an array or {"goals": [...]}. Throws ConfigError.
  [[nodiscard]] static GoalCatalog load(const std::filesystem::path& path);
  static bool load_or_builtin(GoalCatalog& out, const std::filesystem::path& path);

  [[nodiscard]] const std::vector<GoalDefinition>& goals() const noexcept { return goals_; }
  [[nodiscard]] const GoalDefinition* find(std::string_view id) const noexcept;
  [[nodiscard]] bool empty() const noexcept { return goals_.empty(); }

private:
  std::vector<GoalDefinition> goals_{};
};

// False for CompletionKind::None.
[[nodiscard]] bool is_goal_complete(const GoalDefinition& goal, const world::Unit& unit);

} // namespace chronicle::ai
