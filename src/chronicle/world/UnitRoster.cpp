#include "chronicle/world/UnitRoster.hpp"
#include "chronicle/core/Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace chronicle::world {

Unit& UnitRoster::add(Unit unit) {
  if (unit.id().empty()) throw std::invalid_argument("Unit id must not be empty");
  if (by_id_.count(unit.id()) != 0) {
    throw std::invalid_argument("Duplicate unit id: " + unit.id());
  }

  const entt::entity e = reg_.create();
  const std::string id = unit.id();
  Unit& stored = reg_.emplace<Unit>(e, std::move(unit));
  order_.push_back(e);
  by_id_.emplace(id, e);
  return stored;
}

entt::entity UnitRoster::entity_of(std::string_view id) const noexcept {
  const auto it = by_id_.find(std::string(id));
  return it == by_id_.end() ? entt::null : it->second;
}

Unit* UnitRoster::find(std::string_view id) noexcept {
  const entt::entity e = entity_of(id);
  if (e == entt::null) return nullptr;
  return reg_.try_get<Unit>(e);
}

const Unit* UnitRoster::find(std::string_view id) const noexcept {
  const entt::entity e = entity_of(id);
  if (e == entt::null) return nullptr;
  return reg_.try_get<Unit>(e);
}

Unit& UnitRoster::require(std::string_view id) {
  Unit* u = find(id);
  if (!u) throw MissingDataError("Unit " + std::string(id) + " not found");
  return *u;
}

bool UnitRoster::remove(std::string_view id) {
  const auto it = by_id_.find(std::string(id));
  if (it == by_id_.end()) return false;

  const entt::entity e = it->second;
  by_id_.erase(it);
  order_.erase(std::remove(order_.begin(), order_.end(), e), order_.end());
  reg_.destroy(e);
  return true;
}

void UnitRoster::clear() {
  for (const entt::entity e : order_) reg_.destroy(e);
  order_.clear();
  by_id_.clear();
}

std::vector<Unit*> UnitRoster::units() {
  std::vector<Unit*> out;
  out.reserve(order_.size());
  for (const entt::entity e : order_) out.push_back(&reg_.get<Unit>(e));
  return out;
}

std::vector<const Unit*> UnitRoster::units() const {
  std::vector<const Unit*> out;
  out.reserve(order_.size());
  for (const entt::entity e : order_) out.push_back(&reg_.get<Unit>(e));
  return out;
}

std::vector<std::string> UnitRoster::ids() const {
  std::vector<std::string> out;
  out.reserve(order_.size());
  for (const entt::entity e : order_) out.push_back(reg_.get<Unit>(e).id());
  return out;
}

} // namespace chronicle::world
