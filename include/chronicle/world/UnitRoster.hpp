#pragma once

#include "chronicle/world/Unit.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <entt/entt.hpp>

namespace chronicle::world {

// Owns every unit in the simulation. Backed by an EnTT registry; Unit opts
// into in-place deletion so references survive unrelated removals.
// Iteration follows insertion order.
class UnitRoster final {
public:
  UnitRoster() = default;

  UnitRoster(const UnitRoster&) = delete;
  UnitRoster& operator=(const UnitRoster&) = delete;

  // Throws std::invalid_argument on an empty or duplicate id.
  Unit& add(Unit unit);

  [[nodiscard]] Unit* find(std::string_view id) noexcept;
  [[nodiscard]] const Unit* find(std::string_view id) const noexcept;

  // Throws MissingDataError for unknown ids.
  [[nodiscard]] Unit& require(std::string_view id);

  bool remove(std::string_view id);
  void clear();

  [[nodiscard]] bool contains(std::string_view id) const noexcept { return find(id) != nullptr; }
  [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
  [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

  [[nodiscard]] std::vector<Unit*> units();
  [[nodiscard]] std::vector<const Unit*> units() const;
  [[nodiscard]] std::vector<std::string> ids() const;

  [[nodiscard]] entt::registry& registry() noexcept { return reg_; }

private:
  [[nodiscard]] entt::entity entity_of(std::string_view id) const noexcept;

  entt::registry reg_{};
  std::vector<entt::entity> order_{};
  std::unordered_map<std::string, entt::entity> by_id_{};
};

} // namespace chronicle::world
