#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace chronicle::rules {

enum class Comparison { LessEqual, GreaterEqual, Less, Greater, Equal, NotEqual };

struct Condition {
  std::string property{};
  Comparison op{Comparison::Equal};
  double threshold{0.0};
};

// Parses "health <= 30". Two-character operators are matched before their
// one-character prefixes. Returns nullopt on an unknown operator or a
// non-numeric threshold.
[[nodiscard]] std::optional<Condition> parse_condition(std::string_view text);
[[nodiscard]] std::optional<Comparison> comparison_from_string(std::string_view op) noexcept;

[[nodiscard]] bool compare(double value, Comparison op, double threshold) noexcept;

// False when the condition cannot be parsed.
[[nodiscard]] bool evaluate_condition(std::string_view text, double value);

} // namespace chronicle::rules
