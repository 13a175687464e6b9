#pragma once

#include "chronicle/world/UnitRoster.hpp"

#include <filesystem>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chronicle::world {

// Positions are objects with "mapId" and "position"; any other object is read
// as a string table.
[[nodiscard]] nlohmann::json property_value_to_json(const PropertyValue& v);
[[nodiscard]] PropertyValue property_value_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const MapPosition& p);
void from_json(const nlohmann::json& j, MapPosition& p);

// {"id", "name", "type", "properties": {name: {"value", "baseValue", "readonly", "modifiers"}}}
// A bare value is accepted in place of the record object.
void to_json(nlohmann::json& j, const Unit& u);
void from_json(const nlohmann::json& j, Unit& u);

// Writes every unit as a JSON array. Returns false when the file cannot be written.
bool SaveUnits(const UnitRoster& roster, const std::filesystem::path& path);

// Throws ConfigError on unreadable or malformed files.
[[nodiscard]] std::vector<Unit> LoadUnits(const std::filesystem::path& path);

} // namespace chronicle::world
