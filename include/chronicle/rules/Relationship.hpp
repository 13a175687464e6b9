#pragma once

#include "chronicle/world/Unit.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chronicle::rules {

enum class Relationship : std::uint8_t { Ally, Neutral, Hostile };

inline constexpr std::string_view kNeutralFaction = "neutral";

[[nodiscard]] std::string_view to_string(Relationship r) noexcept;
[[nodiscard]] std::optional<Relationship> relationship_from_string(std::string_view s) noexcept;

// Faction tag with surrounding whitespace trimmed; blank or missing => "neutral".
[[nodiscard]] std::string faction_of(const world::Unit& u);

// Pure classification from two faction tags and an optional explicit override.
[[nodiscard]] Relationship classify(std::string_view actor_faction, std::string_view target_faction,
                                    std::optional<Relationship> explicit_override = std::nullopt) noexcept;

// Same unit => ally; the actor's "relationships" map wins over factions.
[[nodiscard]] Relationship relationship(const world::Unit& actor, const world::Unit& target);

[[nodiscard]] inline bool is_ally(const world::Unit& a, const world::Unit& b) {
  return relationship(a, b) == Relationship::Ally;
}
[[nodiscard]] inline bool is_hostile(const world::Unit& a, const world::Unit& b) {
  return relationship(a, b) == Relationship::Hostile;
}
[[nodiscard]] inline bool is_neutral(const world::Unit& a, const world::Unit& b) {
  return relationship(a, b) == Relationship::Neutral;
}

} // namespace chronicle::rules
