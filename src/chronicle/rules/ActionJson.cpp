#include "chronicle/rules/ActionJson.hpp"

#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

namespace chronicle::rules {
using json = nlohmann::json;

// ---------- EffectValue ----------
void from_json(const json& j, EffectValue& v) {
  v = EffectValue{};
  if (j.is_number()) {
    v.value = j.get<double>();
    return;
  }
  if (j.is_string()) {
    // Numeric strings are accepted; anything else resolves to 0.
    const std::string s = j.get<std::string>();
    try {
      v.value = std::stod(s);
    } catch (const std::exception&) {
      v.value = 0.0;
    }
    return;
  }
  if (!j.is_object()) {
    throw json::type_error::create(302, "effect value expects number, string or object", &j);
  }

  v.kind = value_kind_from_string(j.value("type", std::string{"static"})).value_or(ValueKind::Static);
  v.value = j.value("value", 0.0);
  v.expression = j.value("expression", std::string{});
  v.variable = j.value("variable", std::string{});
  if (j.contains("min") && j["min"].is_number()) v.min = j["min"].get<int>();
  if (j.contains("max") && j["max"].is_number()) v.max = j["max"].get<int>();
}

void to_json(json& j, const EffectValue& v) {
  j = json::object({{"type", std::string(to_string(v.kind))}});
  switch (v.kind) {
    case ValueKind::Static:
      j["value"] = v.value;
      break;
    case ValueKind::Calculation:
      j["value"] = v.value;
      if (!v.expression.empty()) j["expression"] = v.expression;
      break;
    case ValueKind::Variable:
      j["variable"] = v.variable;
      break;
    case ValueKind::Random:
      if (v.min) j["min"] = *v.min;
      if (v.max) j["max"] = *v.max;
      break;
  }
}

// ---------- EffectDefinition ----------
void from_json(const json& j, EffectDefinition& e) {
  e = EffectDefinition{};
  e.target = effect_target_from_string(j.value("target", std::string{"self"})).value_or(EffectTarget::Self);
  e.property = j.value("property", std::string{});
  e.operation = effect_operation_from_string(j.value("operation", std::string{"add"}))
                    .value_or(EffectOperation::Add);
  if (const auto it = j.find("value"); it != j.end()) e.value = it->get<EffectValue>();
  e.permanent = j.value("permanent", false);
}

void to_json(json& j, const EffectDefinition& e) {
  j = json::object({
      {"target", std::string(to_string(e.target))},
      {"property", e.property},
      {"operation", std::string(to_string(e.operation))},
      {"value", e.value},
      {"permanent", e.permanent},
  });
}

// ---------- Requirement ----------
void from_json(const json& j, Requirement& r) {
  r.type = j.value("type", std::string{"comparison"});
  r.property = j.value("property", std::string{});
  r.op = j.value("operator", std::string{});
  r.value = j.value("value", 0.0);
}

void to_json(json& j, const Requirement& r) {
  j = json::object({
      {"type", r.type},
      {"property", r.property},
      {"operator", r.op},
      {"value", r.value},
  });
}

// ---------- Payload ----------
Payload payload_from_json(const json& j) {
  Payload p;
  if (!j.is_object()) return p;

  for (const auto& [key, v] : j.items()) {
    if (key == "effects") continue;   // lifted into Action::payloadEffects

    if (v.is_boolean()) {
      p.emplace(key, v.get<bool>());
    } else if (v.is_number()) {
      p.emplace(key, v.get<double>());
    } else if (v.is_string()) {
      p.emplace(key, v.get<std::string>());
    } else if (v.is_object() && v.contains("type")) {
      const std::string type = v.value("type", std::string{});
      if (type == "random") {
        p.emplace(key, RandomRange{v.value("min", 0), v.value("max", 0)});
      } else if (type == "random_direction") {
        p.emplace(key, RandomDirection{});
      } else if (type == "random_resource") {
        p.emplace(key, RandomResource{});
      } else if (type == "calculated") {
        p.emplace(key, CalculatedValue{v.value("base", std::string{}), v.value("modifier", 0.0)});
      } else {
        p.emplace(key, v.dump());
      }
    } else if (!v.is_null()) {
      p.emplace(key, v.dump());
    }
  }
  return p;
}

json payload_to_json(const Payload& p) {
  json j = json::object();
  for (const auto& [key, value] : p) {
    std::visit([&](const auto& x) {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, RandomRange>) {
        j[key] = json::object({{"type", "random"}, {"min", x.min}, {"max", x.max}});
      } else if constexpr (std::is_same_v<T, RandomDirection>) {
        j[key] = json::object({{"type", "random_direction"}});
      } else if constexpr (std::is_same_v<T, RandomResource>) {
        j[key] = json::object({{"type", "random_resource"}});
      } else if constexpr (std::is_same_v<T, CalculatedValue>) {
        j[key] = json::object({{"type", "calculated"}, {"base", x.base}, {"modifier", x.modifier}});
      } else {
        j[key] = x;
      }
    }, value);
  }
  return j;
}

// ---------- Action ----------
void from_json(const json& j, Action& a) {
  a = Action{};
  a.type = j.value("type", std::string{});
  a.player = j.value("player", std::string{});
  a.description = j.value("description", std::string{});
  if (const auto it = j.find("requirements"); it != j.end() && it->is_array()) {
    a.requirements = it->get<std::vector<Requirement>>();
  }
  if (const auto it = j.find("payload"); it != j.end() && it->is_object()) {
    a.payload = payload_from_json(*it);
    if (const auto fx = it->find("effects"); fx != it->end() && fx->is_array()) {
      a.payloadEffects = fx->get<std::vector<EffectDefinition>>();
    }
  }
  if (const auto it = j.find("effects"); it != j.end() && it->is_array()) {
    a.effects = it->get<std::vector<EffectDefinition>>();
  }
}

void to_json(json& j, const Action& a) {
  j = json::object({
      {"type", a.type},
      {"player", a.player},
      {"description", a.description},
  });
  if (!a.requirements.empty()) j["requirements"] = a.requirements;
  if (!a.payload.empty() || !a.payloadEffects.empty()) {
    json p = payload_to_json(a.payload);
    if (!a.payloadEffects.empty()) p["effects"] = a.payloadEffects;
    j["payload"] = std::move(p);
  }
  if (!a.effects.empty()) j["effects"] = a.effects;
}

} // namespace chronicle::rules
