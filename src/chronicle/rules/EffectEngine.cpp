#include "chronicle/rules/EffectEngine.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <type_traits>

#include <fmt/format.h>

namespace chronicle::rules {

namespace {

std::shared_ptr<spdlog::logger> effects_log() { return logsys::get("effects"); }

double clamp_for(std::string_view property, double v) {
  if (property == world::prop::kHealth || property == world::prop::kMana) {
    return std::clamp(v, 0.0, kStatCap);
  }
  return std::max(0.0, v);
}

} // namespace

// ----------------------------------------------------------------------------
// Batch entry points
// ----------------------------------------------------------------------------
EffectResult EffectEngine::apply(const Action& action, std::span<const EffectDefinition> effects,
                                 world::UnitList units) {
  std::span<const EffectDefinition> batch = effects;
  if (batch.empty()) batch = action.effects;
  if (batch.empty()) batch = action.payloadEffects;
  if (batch.empty()) {
    effects_log()->debug("No effects for action {}, nothing to apply", action.type);
    return EffectResult::ok();
  }

  try {
    for (const EffectDefinition& e : batch) apply_single(e, action, units);
  } catch (const std::exception& e) {
    effects_log()->error("Effect batch for {} aborted: {}", action.type, e.what());
    return EffectResult::fail(e.what(), FailureKind::Effect);
  }
  return EffectResult::ok();
}

EffectResult EffectEngine::execute_action_effect(const Action& action, world::UnitList units) {
  const auto batch = effects_for(action);
  if (batch.empty()) {
    effects_log()->info("No effects found for action type: {}, skipping effects execution", action.type);
    return EffectResult::ok();
  }

  const RangeCheck range = validate_range(action, units);
  if (!range.valid) {
    effects_log()->warn("Range validation failed for action {}: {}", action.type, range.errorMessage);
    return EffectResult::fail(range.errorMessage, FailureKind::Range);
  }
  return apply(action, batch, units);
}

std::span<const EffectDefinition> EffectEngine::effects_for(const Action& action) const noexcept {
  if (catalog_) {
    if (const Action* def = catalog_->find(action.type); def && !def->effects.empty()) return def->effects;
  }
  if (!action.effects.empty()) return action.effects;
  return action.payloadEffects;
}

RangeCheck EffectEngine::validate_range(const Action& action, world::UnitList units) const {
  const world::Unit* actor = world::find_unit_by_id_or_name(units, action.player);
  if (!actor) return {};

  const auto target_id = payload_text(action, payload_key::kTargetUnit);
  if (!target_id || target_id->empty()) return {};

  if (!world::find_unit(units, *target_id)) {
    return {false, "Target unit " + *target_id + " not found"};
  }

  const double max_range = action_range(action);
  const double d = world::distance_between(units, actor->id(), *target_id, true);
  if (std::isinf(d)) {
    return {false, "Units " + actor->id() + " and " + *target_id + " are on different maps"};
  }
  if (d > max_range) {
    return {false, fmt::format("Target unit {} is out of range. Distance: {}, Max range: {}", *target_id, d,
                               max_range)};
  }
  return {};
}

// ----------------------------------------------------------------------------
// Target resolution
// ----------------------------------------------------------------------------
void EffectEngine::apply_single(const EffectDefinition& effect, const Action& action, world::UnitList units) {
  world::Unit* actor = world::find_unit_by_id_or_name(units, action.player);

  world::Unit* explicit_target = nullptr;
  if (const auto id = payload_text(action, payload_key::kTargetUnit)) {
    explicit_target = world::find_unit(units, *id);
  }

  switch (effect.target) {
    case EffectTarget::Self:
      if (!actor) break;
      apply_to_unit(effect, *actor, action);
      return;

    case EffectTarget::Target:
      if (!explicit_target) break;
      apply_to_unit(effect, *explicit_target, action);
      return;

    case EffectTarget::All:
      for (world::Unit* u : units) {
        if (u) apply_to_unit(effect, *u, action);
      }
      return;

    case EffectTarget::Ally:
      if (!actor && !explicit_target) break;
      if (actor) apply_to_unit(effect, *actor, action);
      if (explicit_target && explicit_target != actor) apply_to_unit(effect, *explicit_target, action);
      return;

    case EffectTarget::Enemy: {
      world::Unit* enemy = explicit_target;
      if (!enemy) {
        for (world::Unit* u : units) {
          if (u && u != actor) {
            enemy = u;
            break;
          }
        }
      }
      if (!enemy) break;
      apply_to_unit(effect, *enemy, action);
      return;
    }
  }

  effects_log()->error("Could not find target unit for action {} with target: {}", action.type,
                       to_string(effect.target));
}

// ----------------------------------------------------------------------------
// Value resolution and mutation
// ----------------------------------------------------------------------------
double EffectEngine::resolve_value(const EffectValue& value, const Action& action, const world::Unit& target) {
  switch (value.kind) {
    case ValueKind::Static:
    case ValueKind::Calculation:
      return value.value;

    case ValueKind::Random:
      if (!value.min || !value.max) return 0.0;
      return static_cast<double>(rng_->range(*value.min, *value.max));

    case ValueKind::Variable: {
      if (const auto it = action.payload.find(value.variable); it != action.payload.end()) {
        return std::visit([&](const auto& x) -> double {
          using V = std::decay_t<decltype(x)>;
          if constexpr (std::is_same_v<V, double>) {
            return x;
          } else if constexpr (std::is_same_v<V, bool>) {
            return x ? 1.0 : 0.0;
          } else if constexpr (std::is_same_v<V, RandomRange>) {
            return static_cast<double>(rng_->range(x.min, x.max));
          } else if constexpr (std::is_same_v<V, CalculatedValue>) {
            return std::max(0.0, target.number(x.base).value_or(0.0) + x.modifier);
          } else {
            return 0.0;
          }
        }, it->second);
      }
      return target.number(value.variable).value_or(0.0);
    }
  }
  return 0.0;
}

void EffectEngine::apply_to_unit(const EffectDefinition& effect, world::Unit& target, const Action& action) {
  const std::string& name = effect.property;
  if (name.empty()) throw EffectError("Effect for action " + action.type + " has no property");

  if (const world::PropertyRecord* r = target.record(name); r && r->readonly) {
    effects_log()->info("Property {} on {} is readonly, effect skipped", name, target.label());
    return;
  }

  const double amount = resolve_value(effect.value, action, target);

  const auto existing = target.number(name);
  if (!target.has(name)) target.set(name, 1.0);
  const double current = existing.value_or(1.0);

  double next = current;
  switch (effect.operation) {
    case EffectOperation::Add: next = current + amount; break;
    case EffectOperation::Subtract: next = current - amount; break;
    case EffectOperation::Multiply: next = std::round(current * amount); break;
    case EffectOperation::Divide:
      if (amount == 0.0) throw EffectError("Division by zero applying " + name + " to " + target.label());
      next = std::round(current / amount);
      break;
    case EffectOperation::Set: next = amount; break;
  }
  next = clamp_for(name, next);

  if (effect.permanent) {
    target.set_base(name, next);
  } else {
    target.set(name, next);
  }
  effects_log()->debug("{}: {} {} {} -> {}", target.label(), name, to_string(effect.operation), amount, next);

  if (name == world::prop::kHealth && next <= 0.0) {
    target.set(world::prop::kStatus, std::string("dead"));
    effects_log()->info("{} has fallen", target.label());
  }
}

} // namespace chronicle::rules
