#include "chronicle/rules/Action.hpp"

namespace chronicle::rules {

std::optional<double> payload_number(const Action& a, std::string_view key) {
  const auto it = a.payload.find(key);
  if (it == a.payload.end()) return std::nullopt;
  if (const double* d = std::get_if<double>(&it->second)) return *d;
  return std::nullopt;
}

std::optional<std::string> payload_text(const Action& a, std::string_view key) {
  const auto it = a.payload.find(key);
  if (it == a.payload.end()) return std::nullopt;
  if (const std::string* s = std::get_if<std::string>(&it->second)) return *s;
  return std::nullopt;
}

double action_range(const Action& a) {
  return payload_number(a, payload_key::kRange).value_or(1.0);
}

std::string_view to_string(EffectTarget t) noexcept {
  switch (t) {
    case EffectTarget::Self: return "self";
    case EffectTarget::Target: return "target";
    case EffectTarget::All: return "all";
    case EffectTarget::Ally: return "ally";
    case EffectTarget::Enemy: return "enemy";
  }
  return "self";
}

std::string_view to_string(EffectOperation op) noexcept {
  switch (op) {
    case EffectOperation::Add: return "add";
    case EffectOperation::Subtract: return "subtract";
    case EffectOperation::Multiply: return "multiply";
    case EffectOperation::Divide: return "divide";
    case EffectOperation::Set: return "set";
  }
  return "add";
}

std::string_view to_string(ValueKind k) noexcept {
  switch (k) {
    case ValueKind::Static: return "static";
    case ValueKind::Calculation: return "calculation";
    case ValueKind::Variable: return "variable";
    case ValueKind::Random: return "random";
  }
  return "static";
}

std::optional<EffectTarget> effect_target_from_string(std::string_view s) noexcept {
  if (s == "self") return EffectTarget::Self;
  if (s == "target" || s == "unit") return EffectTarget::Target;
  if (s == "all") return EffectTarget::All;
  if (s == "ally") return EffectTarget::Ally;
  if (s == "enemy") return EffectTarget::Enemy;
  return std::nullopt;
}

std::optional<EffectOperation> effect_operation_from_string(std::string_view s) noexcept {
  if (s == "add") return EffectOperation::Add;
  if (s == "subtract") return EffectOperation::Subtract;
  if (s == "multiply") return EffectOperation::Multiply;
  if (s == "divide") return EffectOperation::Divide;
  if (s == "set") return EffectOperation::Set;
  return std::nullopt;
}

std::optional<ValueKind> value_kind_from_string(std::string_view s) noexcept {
  if (s == "static") return ValueKind::Static;
  if (s == "calculation") return ValueKind::Calculation;
  if (s == "variable") return ValueKind::Variable;
  if (s == "random") return ValueKind::Random;
  return std::nullopt;
}

} // namespace chronicle::rules
