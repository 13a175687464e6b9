#pragma once

#include "chronicle/world/Geometry.hpp"

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chronicle::world {

// Keyed string table; used for the explicit per-unit relationship overrides.
using StringMap = std::map<std::string, std::string>;

// Tagged union stored in a property record. Numbers are doubles; integral
// stats simply hold whole values.
using PropertyValue = std::variant<double, bool, std::string, MapPosition, StringMap>;

struct Modifier {
  std::string source{};
  double value{0.0};
  int priority{0};
};

struct PropertyRecord {
  PropertyValue value{0.0};
  PropertyValue baseValue{0.0};
  std::vector<Modifier> modifiers{};
  bool readonly{false};

  [[nodiscard]] const double* number() const noexcept { return std::get_if<double>(&value); }
  [[nodiscard]] const std::string* text() const noexcept { return std::get_if<std::string>(&value); }
  [[nodiscard]] const MapPosition* position() const noexcept { return std::get_if<MapPosition>(&value); }

  // Sum of modifier values, applied in ascending priority order.
  [[nodiscard]] double modifier_total() const noexcept;
};

[[nodiscard]] std::string to_display_string(const PropertyValue& v);
[[nodiscard]] bool same_value(const PropertyValue& a, const PropertyValue& b) noexcept;

} // namespace chronicle::world
