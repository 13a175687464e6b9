#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chronicle::rules {

// ----------------------------------------------------------------------------
// Effects
// ----------------------------------------------------------------------------
enum class EffectTarget : std::uint8_t { Self, Target, All, Ally, Enemy };
enum class EffectOperation : std::uint8_t { Add, Subtract, Multiply, Divide, Set };
enum class ValueKind : std::uint8_t { Static, Calculation, Variable, Random };

struct EffectValue {
  ValueKind kind{ValueKind::Static};
  double value{0.0};
  std::string expression{};   // Calculation: carried, not evaluated
  std::string variable{};     // Variable: payload key
  std::optional<int> min{};   // Random: inclusive bounds
  std::optional<int> max{};

  [[nodiscard]] static EffectValue fixed(double v) {
    EffectValue e{};
    e.value = v;
    return e;
  }
  [[nodiscard]] static EffectValue random(int lo, int hi) {
    EffectValue e{};
    e.kind = ValueKind::Random;
    e.min = lo;
    e.max = hi;
    return e;
  }
  [[nodiscard]] static EffectValue from_variable(std::string name) {
    EffectValue e{};
    e.kind = ValueKind::Variable;
    e.variable = std::move(name);
    return e;
  }
};

struct EffectDefinition {
  EffectTarget target{EffectTarget::Self};
  std::string property{};
  EffectOperation operation{EffectOperation::Add};
  EffectValue value{};
  bool permanent{false};
};

// ----------------------------------------------------------------------------
// Payload
// ----------------------------------------------------------------------------
struct RandomRange {
  int min{0};
  int max{0};
};
struct RandomDirection {};
struct RandomResource {};
struct CalculatedValue {
  std::string base{};
  double modifier{0.0};
};

// Unresolved descriptors (RandomRange, RandomDirection, RandomResource,
// CalculatedValue) are replaced by concrete values when an action is prepared.
using PayloadValue =
    std::variant<double, bool, std::string, RandomRange, RandomDirection, RandomResource, CalculatedValue>;
using Payload = std::map<std::string, PayloadValue, std::less<>>;

namespace payload_key {
inline constexpr std::string_view kTargetUnit = "targetUnit";
inline constexpr std::string_view kRange = "range";
} // namespace payload_key

// ----------------------------------------------------------------------------
// Actions
// ----------------------------------------------------------------------------
struct Requirement {
  std::string type{"comparison"};
  std::string property{};
  std::string op{};
  double value{0.0};
};

struct Action {
  std::string type{};
  std::string player{};        // acting unit id (or name)
  std::string description{};   // may contain {{unitName}}, {{unitType}}, {{targetUnitName}}
  std::vector<Requirement> requirements{};
  Payload payload{};
  std::vector<EffectDefinition> effects{};
  std::vector<EffectDefinition> payloadEffects{};   // "payload.effects" in catalog files
};

[[nodiscard]] std::optional<double> payload_number(const Action& a, std::string_view key);
[[nodiscard]] std::optional<std::string> payload_text(const Action& a, std::string_view key);

// Payload "range" when numeric, else 1.
[[nodiscard]] double action_range(const Action& a);

[[nodiscard]] std::string_view to_string(EffectTarget t) noexcept;
[[nodiscard]] std::string_view to_string(EffectOperation op) noexcept;
[[nodiscard]] std::string_view to_string(ValueKind k) noexcept;

// "unit" is accepted as an alias of "target".
[[nodiscard]] std::optional<EffectTarget> effect_target_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<EffectOperation> effect_operation_from_string(std::string_view s) noexcept;
[[nodiscard]] std::optional<ValueKind> value_kind_from_string(std::string_view s) noexcept;

} // namespace chronicle::rules
