#include "chronicle/rules/ConditionParser.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <utility>

namespace chronicle::rules {

namespace {

constexpr std::array<std::pair<std::string_view, Comparison>, 6> kOperators{{
    {"<=", Comparison::LessEqual},
    {">=", Comparison::GreaterEqual},
    {"==", Comparison::Equal},
    {"!=", Comparison::NotEqual},
    {"<", Comparison::Less},
    {">", Comparison::Greater},
}};

std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto b = s.find_first_not_of(kSpace);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(kSpace);
  return s.substr(b, e - b + 1);
}

std::optional<double> parse_number(std::string_view s) noexcept {
  s = trim(s);
  if (!s.empty() && s.front() == '+') s.remove_prefix(1);
  if (s.empty()) return std::nullopt;

  double v = 0.0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr == s.data()) return std::nullopt;
  return v;
}

} // namespace

std::optional<Comparison> comparison_from_string(std::string_view op) noexcept {
  op = trim(op);
  for (const auto& [symbol, cmp] : kOperators) {
    if (symbol == op) return cmp;
  }
  return std::nullopt;
}

std::optional<Condition> parse_condition(std::string_view text) {
  for (const auto& [symbol, cmp] : kOperators) {
    const auto pos = text.find(symbol);
    if (pos == std::string_view::npos) continue;

    const auto threshold = parse_number(text.substr(pos + symbol.size()));
    if (!threshold) return std::nullopt;

    Condition c{};
    c.property = std::string(trim(text.substr(0, pos)));
    c.op = cmp;
    c.threshold = *threshold;
    return c;
  }
  return std::nullopt;
}

bool compare(double value, Comparison op, double threshold) noexcept {
  switch (op) {
    case Comparison::LessEqual: return value <= threshold;
    case Comparison::GreaterEqual: return value >= threshold;
    case Comparison::Less: return value < threshold;
    case Comparison::Greater: return value > threshold;
    case Comparison::Equal: return std::fabs(value - threshold) < 1e-9;
    case Comparison::NotEqual: return std::fabs(value - threshold) >= 1e-9;
  }
  return false;
}

bool evaluate_condition(std::string_view text, double value) {
  const auto c = parse_condition(text);
  return c && compare(value, c->op, c->threshold);
}

} // namespace chronicle::rules
