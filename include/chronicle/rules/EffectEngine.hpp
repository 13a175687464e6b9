#pragma once

#include "chronicle/core/Rng.hpp"
#include "chronicle/rules/Action.hpp"
#include "chronicle/rules/ActionCatalog.hpp"
#include "chronicle/world/Occupancy.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace chronicle::rules {

enum class FailureKind : std::uint8_t { None, Range, Effect };

struct EffectResult {
  bool success{true};
  std::string errorMessage{};
  FailureKind failure{FailureKind::None};

  [[nodiscard]] static EffectResult ok() { return {}; }
  [[nodiscard]] static EffectResult fail(std::string msg, FailureKind kind) {
    return EffectResult{false, std::move(msg), kind};
  }
};

struct RangeCheck {
  bool valid{true};
  std::string errorMessage{};
};

inline constexpr double kStatCap = 100.0;

// Resolves declarative effects against units and mutates their properties.
// Targets are resolved per effect; a target that cannot be resolved skips
// that effect only. An exception while applying aborts the rest of the batch.
class EffectEngine final {
public:
  explicit EffectEngine(Rng& rng, const ActionCatalog* catalog = nullptr) noexcept
    : rng_(&rng), catalog_(catalog) {}

  void set_catalog(const ActionCatalog* catalog) noexcept { catalog_ = catalog; }

  // Uses `effects` when non-empty, else action.effects, else the payload
  // effects; no effects at all is a successful no-op.
  EffectResult apply(const Action& action, std::span<const EffectDefinition> effects, world::UnitList units);

  // Catalog definition effects take precedence over the action's own. The
  // payload target must be in range before anything is applied.
  EffectResult execute_action_effect(const Action& action, world::UnitList units);

  [[nodiscard]] RangeCheck validate_range(const Action& action, world::UnitList units) const;

  [[nodiscard]] double resolve_value(const EffectValue& value, const Action& action, const world::Unit& target);

  // Applies one effect to one unit (operation, clamping, permanence, death).
  void apply_to_unit(const EffectDefinition& effect, world::Unit& target, const Action& action);

private:
  [[nodiscard]] std::span<const EffectDefinition> effects_for(const Action& action) const noexcept;
  void apply_single(const EffectDefinition& effect, const Action& action, world::UnitList units);

  Rng* rng_;
  const ActionCatalog* catalog_;
};

} // namespace chronicle::rules
