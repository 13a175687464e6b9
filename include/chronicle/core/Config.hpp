#pragma once

#include "chronicle/core/Log.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace chronicle {

struct EngineConfig {
  int  maxTurnsPerSession{10};
  bool runIndefinitely{false};

  // Restricts a unit's available actions to these types (empty = no restriction).
  std::vector<std::string> overrideAvailableActions{};

  // Turns a unit must wait between actions.
  int cooldownPeriod{1};

  int movementStepCooldownMs{0};
  int turnIntervalMs{0};

  // 0 => seeded from the clock at engine start.
  std::uint64_t seed{0};

  std::filesystem::path dataDirectory{"data"};
  logsys::LogConfig logging{};
};

void from_json(const nlohmann::json& j, EngineConfig& cfg);
void to_json(nlohmann::json& j, const EngineConfig& cfg);

// Strict load: throws ConfigError when the file is missing or malformed.
[[nodiscard]] EngineConfig LoadConfigOrThrow(const std::filesystem::path& path);

// Tolerant load: missing file is normal on first run; malformed files are
// logged and replaced by defaults. Returns false when defaults were used.
bool LoadConfig(EngineConfig& cfg, const std::filesystem::path& path);

bool SaveConfig(const EngineConfig& cfg, const std::filesystem::path& path);

} // namespace chronicle
