#pragma once

#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/Action.hpp"
#include "chronicle/world/Unit.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chronicle::rules {

// Static action templates. Catalog order is significant: goal selection
// returns the first matching action in this order.
class ActionCatalog final {
public:
  ActionCatalog() = default;
  explicit ActionCatalog(std::vector<Action> actions);

  // rest, retreat, search, meditate, attack, desperate_attack, explore,
  // patrol, train, gather, interact, support, trade.
  [[nodiscard]] static ActionCatalog builtin();

  // Accepts a flat array, {"actions": ...}, or the health-band layout
  // ({"low_health": [...], "healthy": [...], "default": [...], "special": [...]}).
  // Duplicate types keep their first occurrence. Throws ConfigError.
  [[nodiscard]] static ActionCatalog from_json(const nlohmann::json& j);
  [[nodiscard]] static ActionCatalog load(const std::filesystem::path& path);

  // Missing file => built-in catalog (returns false); malformed => throws ConfigError.
  static bool load_or_builtin(ActionCatalog& out, const std::filesystem::path& path);

  void add(Action action);

  [[nodiscard]] const std::vector<Action>& actions() const noexcept { return actions_; }
  [[nodiscard]] const Action* find(std::string_view type) const noexcept;
  [[nodiscard]] bool empty() const noexcept { return actions_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return actions_.size(); }

  // Actions whose comparison requirements the unit meets and whose type
  // passes the allow-list (empty = everything). Falls back to the whole
  // catalog when nothing qualifies.
  [[nodiscard]] std::vector<Action> available_for(const world::Unit& unit,
                                                  std::span<const std::string> allow_list = {}) const;

private:
  std::vector<Action> actions_{};
};

// A missing numeric property counts as 0.
[[nodiscard]] bool meets_requirements(const world::Unit& unit, const Action& action);

// Replaces payload descriptors with concrete values: random => inclusive
// integer, random_direction / random_resource => a name, calculated =>
// max(0, target[base] + modifier) (modifier alone without a target).
[[nodiscard]] Payload resolve_payload(const Payload& payload, const world::Unit* target, Rng& rng);

// Substitutes {{unitName}}, {{unitType}}, {{targetUnitName}}.
[[nodiscard]] std::string render_description(std::string_view tmpl, std::string_view unit_name,
                                             std::string_view unit_type, std::string_view target_name);

// The "idle" action used when nothing else can run.
[[nodiscard]] Action default_action(const world::Unit& unit);

} // namespace chronicle::rules
