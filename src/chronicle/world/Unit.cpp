#include "chronicle/world/Unit.hpp"
#include "chronicle/core/Errors.hpp"

#include <algorithm>

namespace chronicle::world {

Unit::Unit(std::string id, std::string name, std::string kind)
  : id_(std::move(id)), name_(std::move(name)), kind_(std::move(kind)) {}

std::string Unit::label() const {
  return name_ + " (" + id_ + ")";
}

bool Unit::has(std::string_view name) const {
  return properties_.find(name) != properties_.end();
}

const PropertyRecord* Unit::record(std::string_view name) const {
  const auto it = properties_.find(name);
  if (it == properties_.end()) return nullptr;
  return &it->second;
}

const PropertyValue* Unit::value(std::string_view name) const {
  const PropertyRecord* r = record(name);
  return r ? &r->value : nullptr;
}

std::optional<double> Unit::number(std::string_view name) const {
  const PropertyRecord* r = record(name);
  if (!r) return std::nullopt;
  if (const double* d = r->number()) return *d;
  if (const bool* b = std::get_if<bool>(&r->value)) return *b ? 1.0 : 0.0;
  return std::nullopt;
}

std::optional<std::string> Unit::text(std::string_view name) const {
  const PropertyRecord* r = record(name);
  if (!r) return std::nullopt;
  if (const std::string* s = r->text()) return *s;
  return std::nullopt;
}

const MapPosition* Unit::position() const {
  const PropertyRecord* r = record(prop::kPosition);
  return r ? r->position() : nullptr;
}

const StringMap* Unit::string_map(std::string_view name) const {
  const PropertyRecord* r = record(name);
  return r ? std::get_if<StringMap>(&r->value) : nullptr;
}

const MapPosition& Unit::require_position() const {
  const MapPosition* p = position();
  if (!p) throw MissingDataError("Unit " + label() + " has no valid position");
  return *p;
}

bool Unit::set(std::string_view name, PropertyValue v) {
  const auto it = properties_.find(name);
  if (it == properties_.end()) {
    PropertyRecord r{};
    r.baseValue = v;
    r.value = std::move(v);
    properties_.emplace(std::string(name), std::move(r));
    return true;
  }
  if (it->second.readonly) return false;
  it->second.value = std::move(v);
  return true;
}

bool Unit::set_base(std::string_view name, PropertyValue v) {
  auto it = properties_.find(name);
  if (it == properties_.end()) {
    it = properties_.emplace(std::string(name), PropertyRecord{}).first;
  } else if (it->second.readonly) {
    return false;
  }
  it->second.baseValue = std::move(v);
  recompute(it->second);
  return true;
}

void Unit::define(std::string_view name, PropertyValue v, bool readonly) {
  PropertyRecord r{};
  r.baseValue = v;
  r.value = std::move(v);
  r.readonly = readonly;
  properties_.insert_or_assign(std::string(name), std::move(r));
}

void Unit::define(std::string_view name, PropertyRecord record) {
  properties_.insert_or_assign(std::string(name), std::move(record));
}

void Unit::add_modifier(std::string_view name, Modifier m) {
  auto it = properties_.find(name);
  if (it == properties_.end()) {
    it = properties_.emplace(std::string(name), PropertyRecord{}).first;
  }
  auto& mods = it->second.modifiers;
  const auto pos = std::upper_bound(mods.begin(), mods.end(), m.priority,
                                    [](int p, const Modifier& x) { return p < x.priority; });
  mods.insert(pos, std::move(m));
  recompute(it->second);
}

std::size_t Unit::remove_modifiers(std::string_view name, std::string_view source) {
  const auto it = properties_.find(name);
  if (it == properties_.end()) return 0;
  auto& mods = it->second.modifiers;
  const auto before = mods.size();
  std::erase_if(mods, [&](const Modifier& m) { return m.source == source; });
  const auto removed = before - mods.size();
  if (removed > 0) recompute(it->second);
  return removed;
}

bool Unit::erase(std::string_view name) {
  const auto it = properties_.find(name);
  if (it == properties_.end()) return false;
  properties_.erase(it);
  return true;
}

void Unit::recompute(PropertyRecord& r) {
  if (const double* base = std::get_if<double>(&r.baseValue)) {
    r.value = *base + r.modifier_total();
  } else {
    r.value = r.baseValue;
  }
}

bool is_alive(const Unit& u) {
  if (const auto status = u.text(prop::kStatus); status && *status == "dead") return false;
  const auto health = u.number(prop::kHealth);
  return health.has_value() && *health > 0.0;
}

} // namespace chronicle::world
