#pragma once

#include "chronicle/rules/Action.hpp"

#include <nlohmann/json_fwd.hpp>

namespace chronicle::rules {

// Tolerant readers: unknown targets fall back to self, unknown operations to
// add, and a bare number is accepted wherever an effect value is expected.
void from_json(const nlohmann::json& j, EffectValue& v);
void to_json(nlohmann::json& j, const EffectValue& v);

void from_json(const nlohmann::json& j, EffectDefinition& e);
void to_json(nlohmann::json& j, const EffectDefinition& e);

void from_json(const nlohmann::json& j, Requirement& r);
void to_json(nlohmann::json& j, const Requirement& r);

// Payload is a std::map alias, so it gets named helpers instead of ADL hooks.
[[nodiscard]] Payload payload_from_json(const nlohmann::json& j);
[[nodiscard]] nlohmann::json payload_to_json(const Payload& p);

void from_json(const nlohmann::json& j, Action& a);
void to_json(nlohmann::json& j, const Action& a);

} // namespace chronicle::rules
