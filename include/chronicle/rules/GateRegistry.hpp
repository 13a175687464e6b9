#pragma once

#include "chronicle/world/Geometry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace chronicle::rules {

// Directional teleport link from a tile on one map to a tile on another.
struct Gate {
  std::string mapFrom{};
  world::GridPoint positionFrom{};
  std::string mapTo{};
  world::GridPoint positionTo{};
  std::string name{};
  bool bidirectional{false};
};

inline constexpr std::string_view kReverseGateSuffix = "_reverse";

class GateRegistry final {
public:
  // False when a gate with the same name is already registered. A
  // bidirectional gate also registers "<name>_reverse" (itself one-way).
  bool add_gate(const Gate& gate);

  // Removes every record whose name starts with `name_prefix`.
  bool remove_gate(std::string_view name_prefix);

  [[nodiscard]] bool has_gate(std::string_view map_id, int x, int y) const noexcept;
  [[nodiscard]] const Gate* destination(std::string_view map_id, int x, int y) const noexcept;

  [[nodiscard]] std::vector<Gate> gates_for_map(std::string_view map_id) const;
  [[nodiscard]] const std::vector<Gate>& all_gates() const noexcept { return gates_; }

  [[nodiscard]] std::size_t size() const noexcept { return gates_.size(); }
  void clear() noexcept { gates_.clear(); }

private:
  std::vector<Gate> gates_{};
};

} // namespace chronicle::rules
