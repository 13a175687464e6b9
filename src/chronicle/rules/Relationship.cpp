#include "chronicle/rules/Relationship.hpp"

namespace chronicle::rules {

namespace {

std::string_view trim(std::string_view s) noexcept {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto b = s.find_first_not_of(kSpace);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(kSpace);
  return s.substr(b, e - b + 1);
}

} // namespace

std::string_view to_string(Relationship r) noexcept {
  switch (r) {
    case Relationship::Ally: return "ally";
    case Relationship::Neutral: return "neutral";
    case Relationship::Hostile: return "hostile";
  }
  return "neutral";
}

std::optional<Relationship> relationship_from_string(std::string_view s) noexcept {
  if (s == "ally") return Relationship::Ally;
  if (s == "neutral") return Relationship::Neutral;
  if (s == "hostile") return Relationship::Hostile;
  return std::nullopt;
}

std::string faction_of(const world::Unit& u) {
  const auto f = u.text(world::prop::kFaction);
  if (!f) return std::string(kNeutralFaction);
  const std::string_view t = trim(*f);
  return t.empty() ? std::string(kNeutralFaction) : std::string(t);
}

Relationship classify(std::string_view actor_faction, std::string_view target_faction,
                      std::optional<Relationship> explicit_override) noexcept {
  if (explicit_override) return *explicit_override;
  if (actor_faction == kNeutralFaction || target_faction == kNeutralFaction) return Relationship::Neutral;
  if (actor_faction == target_faction) return Relationship::Ally;
  return Relationship::Hostile;
}

Relationship relationship(const world::Unit& actor, const world::Unit& target) {
  if (actor.id() == target.id()) return Relationship::Ally;

  std::optional<Relationship> explicit_override;
  if (const world::StringMap* rel = actor.string_map(world::prop::kRelationships)) {
    if (const auto it = rel->find(target.id()); it != rel->end()) {
      explicit_override = relationship_from_string(it->second);
    }
  }
  return classify(faction_of(actor), faction_of(target), explicit_override);
}

} // namespace chronicle::rules
