#include "chronicle/core/Config.hpp"
#include "chronicle/core/Errors.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace chronicle {
using json = nlohmann::json;

void from_json(const json& j, EngineConfig& cfg) {
  const EngineConfig defaults{};
  cfg.maxTurnsPerSession       = j.value("maxTurnsPerSession", defaults.maxTurnsPerSession);
  cfg.runIndefinitely          = j.value("runIndefinitely", defaults.runIndefinitely);
  cfg.overrideAvailableActions = j.value("overrideAvailableActions", std::vector<std::string>{});
  cfg.cooldownPeriod           = j.value("cooldownPeriod", defaults.cooldownPeriod);
  cfg.movementStepCooldownMs   = j.value("movementStepCooldownMs", defaults.movementStepCooldownMs);
  cfg.turnIntervalMs           = j.value("turnIntervalMs", defaults.turnIntervalMs);
  cfg.seed                     = j.value("seed", defaults.seed);
  cfg.dataDirectory            = j.value("dataDirectory", defaults.dataDirectory.string());

  if (cfg.cooldownPeriod < 1) cfg.cooldownPeriod = 1;
  if (cfg.movementStepCooldownMs < 0) cfg.movementStepCooldownMs = 0;
  if (cfg.turnIntervalMs < 0) cfg.turnIntervalMs = 0;

  cfg.logging = defaults.logging;
  if (const auto it = j.find("logging"); it != j.end() && it->is_object()) {
    cfg.logging.level   = it->value("level", cfg.logging.level);
    cfg.logging.file    = it->value("file", cfg.logging.file);
    cfg.logging.disable = it->value("disable", cfg.logging.disable);
  }
}

void to_json(json& j, const EngineConfig& cfg) {
  j = json::object({
      {"maxTurnsPerSession", cfg.maxTurnsPerSession},
      {"runIndefinitely", cfg.runIndefinitely},
      {"overrideAvailableActions", cfg.overrideAvailableActions},
      {"cooldownPeriod", cfg.cooldownPeriod},
      {"movementStepCooldownMs", cfg.movementStepCooldownMs},
      {"turnIntervalMs", cfg.turnIntervalMs},
      {"seed", cfg.seed},
      {"dataDirectory", cfg.dataDirectory.string()},
      {"logging", json::object({
          {"level", cfg.logging.level},
          {"file", cfg.logging.file},
          {"disable", cfg.logging.disable},
      })},
  });
}

EngineConfig LoadConfigOrThrow(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw ConfigError("Could not open " + path.string());

  try {
    const json j = json::parse(in);
    if (!j.is_object()) throw ConfigError(path.string() + ": expected a JSON object");
    return j.get<EngineConfig>();
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

bool LoadConfig(EngineConfig& cfg, const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    logsys::get("engine")->warn("{} not found, using defaults", path.string());
    cfg = EngineConfig{};
    return false;
  }

  try {
    cfg = LoadConfigOrThrow(path);
    return true;
  } catch (const ConfigError& e) {
    logsys::get("engine")->warn("Invalid config ({}), using defaults", e.what());
    cfg = EngineConfig{};
    return false;
  }
}

bool SaveConfig(const EngineConfig& cfg, const std::filesystem::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);

  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    logsys::get("engine")->error("SaveConfig: failed to open {}", path.string());
    return false;
  }
  out << json(cfg).dump(2) << '\n';
  return static_cast<bool>(out);
}

} // namespace chronicle
