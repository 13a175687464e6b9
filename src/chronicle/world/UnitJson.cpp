#include "chronicle/world/UnitJson.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"

#include <fstream>
#include <system_error>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace chronicle::world {
using json = nlohmann::json;

void to_json(json& j, const MapPosition& p) {
  json pos = json::object({{"x", p.position.x}, {"y", p.position.y}});
  if (p.position.z) pos["z"] = *p.position.z;
  j = json::object({{"mapId", p.mapId}, {"position", pos}});
}

void from_json(const json& j, MapPosition& p) {
  p = MapPosition{};
  p.mapId = j.at("mapId").get<std::string>();
  const json& pos = j.at("position");
  p.position.x = pos.at("x").get<int>();
  p.position.y = pos.at("y").get<int>();
  if (const auto it = pos.find("z"); it != pos.end() && it->is_number()) p.position.z = it->get<int>();
}

json property_value_to_json(const PropertyValue& v) {
  return std::visit(
      [](const auto& x) -> json {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, MapPosition>) {
          json j;
          to_json(j, x);
          return j;
        } else {
          return json(x);
        }
      },
      v);
}

PropertyValue property_value_from_json(const json& j) {
  if (j.is_boolean()) return PropertyValue(std::in_place_type<bool>, j.get<bool>());
  if (j.is_number()) return j.get<double>();
  if (j.is_string()) return j.get<std::string>();
  if (j.is_object()) {
    if (j.contains("mapId") && j.contains("position")) return j.get<MapPosition>();

    StringMap table;
    for (const auto& [key, value] : j.items()) {
      table[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return table;
  }
  if (j.is_null()) return 0.0;
  throw ConfigError("Unsupported property value: " + j.dump());
}

void to_json(json& j, const Unit& u) {
  json props = json::object();
  for (const auto& [name, record] : u.properties()) {
    json mods = json::array();
    for (const Modifier& m : record.modifiers) {
      mods.push_back({{"source", m.source}, {"value", m.value}, {"priority", m.priority}});
    }
    props[name] = json::object({
        {"value", property_value_to_json(record.value)},
        {"baseValue", property_value_to_json(record.baseValue)},
        {"readonly", record.readonly},
        {"modifiers", mods},
    });
  }
  j = json::object({{"id", u.id()}, {"name", u.name()}, {"type", u.kind()}, {"properties", props}});
}

void from_json(const json& j, Unit& u) {
  u = Unit(j.at("id").get<std::string>(), j.value("name", std::string{}), j.value("type", std::string{}));

  const auto it = j.find("properties");
  if (it == j.end()) return;

  for (const auto& [name, entry] : it->items()) {
    if (!entry.is_object() || !entry.contains("value")) {
      u.define(name, property_value_from_json(entry));
      continue;
    }

    PropertyRecord record{};
    record.value = property_value_from_json(entry.at("value"));
    record.baseValue = entry.contains("baseValue") ? property_value_from_json(entry.at("baseValue")) : record.value;
    record.readonly = entry.value("readonly", false);
    if (const auto mods = entry.find("modifiers"); mods != entry.end() && mods->is_array()) {
      for (const json& m : *mods) {
        record.modifiers.push_back(
            Modifier{m.value("source", std::string{}), m.value("value", 0.0), m.value("priority", 0)});
      }
    }
    u.define(name, std::move(record));
  }
}

bool SaveUnits(const UnitRoster& roster, const std::filesystem::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  json arr = json::array();
  for (const Unit* u : roster.units()) arr.push_back(*u);

  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    logsys::get("engine")->error("SaveUnits: failed to open {}", path.string());
    return false;
  }
  out << arr.dump(2) << '\n';
  return static_cast<bool>(out);
}

std::vector<Unit> LoadUnits(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw ConfigError("Could not open " + path.string());

  try {
    const json j = json::parse(in);
    const json& arr = (j.is_object() && j.contains("units")) ? j["units"] : j;
    if (!arr.is_array()) throw ConfigError(path.string() + ": units must be an array");
    return arr.get<std::vector<Unit>>();
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

} // namespace chronicle::world
