#pragma once

#include "chronicle/core/Rng.hpp"
#include "chronicle/world/Occupancy.hpp"

#include <string>
#include <vector>

namespace chronicle::sim {

// Campaign-wide actor order. Built once (experience descending, then a random
// key, then name) and kept across rounds: newcomers are appended, dead or
// removed units are dropped without reordering the rest.
class TurnOrder final {
public:
  // Brings the order up to date with `units` and returns it.
  const std::vector<std::string>& refresh(world::UnitList units, Rng& rng);

  [[nodiscard]] const std::vector<std::string>& order() const noexcept { return order_; }
  [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

  // Replaces the order (restored sessions).
  void assign(std::vector<std::string> order) { order_ = std::move(order); }
  void clear() noexcept { order_.clear(); }

private:
  std::vector<std::string> order_{};
};

// Experience descending, random tiebreak, then name. Dead units are excluded.
[[nodiscard]] std::vector<std::string> build_turn_order(world::UnitList units, Rng& rng);

} // namespace chronicle::sim
