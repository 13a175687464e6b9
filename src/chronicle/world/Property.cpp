#include "chronicle/world/Property.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace chronicle::world {

double PropertyRecord::modifier_total() const noexcept {
  double total = 0.0;
  for (const Modifier& m : modifiers) total += m.value;
  return total;
}

namespace {

std::string format_number(double v) {
  if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
    return std::to_string(static_cast<long long>(v));
  }
  std::ostringstream os;
  os << v;
  return os.str();
}

} // namespace

std::string to_display_string(const PropertyValue& v) {
  return std::visit([](const auto& x) -> std::string {
    using T = std::decay_t<decltype(x)>;
    if constexpr (std::is_same_v<T, double>) {
      return format_number(x);
    } else if constexpr (std::is_same_v<T, bool>) {
      return x ? "true" : "false";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return x;
    } else if constexpr (std::is_same_v<T, MapPosition>) {
      return x.mapId + " (" + std::to_string(x.position.x) + ", " + std::to_string(x.position.y) + ")";
    } else {
      std::string out = "{";
      bool first = true;
      for (const auto& [k, val] : x) {
        if (!first) out += ", ";
        out += k + ": " + val;
        first = false;
      }
      return out + "}";
    }
  }, v);
}

bool same_value(const PropertyValue& a, const PropertyValue& b) noexcept {
  if (a.index() != b.index()) return false;
  if (const auto* pa = std::get_if<MapPosition>(&a)) {
    // Positions compare on the full coordinate, z included.
    const auto& pb = std::get<MapPosition>(b);
    return *pa == pb && pa->position.z == pb.position.z;
  }
  return a == b;
}

} // namespace chronicle::world
