#pragma once

#include "chronicle/world/Property.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::world {

// Property names shared by every subsystem.
namespace prop {
inline constexpr std::string_view kPosition       = "position";
inline constexpr std::string_view kHealth         = "health";
inline constexpr std::string_view kMaxHealth      = "maxHealth";
inline constexpr std::string_view kMana           = "mana";
inline constexpr std::string_view kMaxMana        = "maxMana";
inline constexpr std::string_view kStatus         = "status";
inline constexpr std::string_view kFaction        = "faction";
inline constexpr std::string_view kRelationships  = "relationships";
inline constexpr std::string_view kMovementRange  = "movementRange";
inline constexpr std::string_view kExperience     = "experience";
inline constexpr std::string_view kLastActionTurn = "lastActionTurn";
} // namespace prop

// An autonomous agent: identity plus a bag of named properties.
// Absence is explicit: every read returns a pointer/optional.
class Unit final {
public:
  // Addresses stay valid for the lifetime of the owning UnitRoster.
  static constexpr bool in_place_delete = true;

  Unit() = default;
  Unit(std::string id, std::string name, std::string kind);

  [[nodiscard]] const std::string& id() const noexcept { return id_; }
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

  // "Name (id)" for log lines.
  [[nodiscard]] std::string label() const;

  [[nodiscard]] bool has(std::string_view name) const;
  [[nodiscard]] const PropertyRecord* record(std::string_view name) const;
  [[nodiscard]] const PropertyValue* value(std::string_view name) const;

  [[nodiscard]] std::optional<double> number(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> text(std::string_view name) const;
  [[nodiscard]] const MapPosition* position() const;
  [[nodiscard]] const StringMap* string_map(std::string_view name) const;

  // Throws MissingDataError when the unit has no position.
  [[nodiscard]] const MapPosition& require_position() const;

  // Writes the current value; creates the record (value == base) when missing.
  // Returns false for readonly records.
  bool set(std::string_view name, PropertyValue v);

  // Writes the base value and recomputes value = base + modifiers for numbers.
  bool set_base(std::string_view name, PropertyValue v);

  // Adds a record with explicit flags, replacing any existing one.
  void define(std::string_view name, PropertyValue v, bool readonly = false);
  void define(std::string_view name, PropertyRecord record);

  void add_modifier(std::string_view name, Modifier m);
  std::size_t remove_modifiers(std::string_view name, std::string_view source);

  bool erase(std::string_view name);

  [[nodiscard]] const std::map<std::string, PropertyRecord, std::less<>>& properties() const noexcept {
    return properties_;
  }

private:
  void recompute(PropertyRecord& r);

  std::string id_{};
  std::string name_{};
  std::string kind_{};
  std::map<std::string, PropertyRecord, std::less<>> properties_{};
};

// Alive unless status == "dead" or health is missing / <= 0.
[[nodiscard]] bool is_alive(const Unit& u);

} // namespace chronicle::world
