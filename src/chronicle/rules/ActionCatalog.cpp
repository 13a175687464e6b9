#include "chronicle/rules/ActionCatalog.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/rules/ActionJson.hpp"
#include "chronicle/rules/ConditionParser.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace chronicle::rules {
using json = nlohmann::json;

namespace {

constexpr std::array<std::string_view, 8> kDirections{
    "north", "south", "east", "west", "northeast", "northwest", "southeast", "southwest",
};
constexpr std::array<std::string_view, 6> kResources{
    "gold", "wood", "stone", "food", "herbs", "ore",
};
constexpr std::array<std::string_view, 4> kBands{"low_health", "healthy", "default", "special"};

EffectDefinition effect(EffectTarget target, std::string property, EffectOperation op, EffectValue value,
                        bool permanent = false) {
  EffectDefinition e{};
  e.target = target;
  e.property = std::move(property);
  e.operation = op;
  e.value = std::move(value);
  e.permanent = permanent;
  return e;
}

Requirement requires_stat(std::string property, std::string op, double value) {
  Requirement r{};
  r.property = std::move(property);
  r.op = std::move(op);
  r.value = value;
  return r;
}

Action make_action(std::string type, std::string description) {
  Action a{};
  a.type = std::move(type);
  a.description = std::move(description);
  return a;
}

void append_unique(std::vector<Action>& out, std::unordered_set<std::string>& seen, const json& arr) {
  if (!arr.is_array()) throw ConfigError("action list must be an array");
  for (const json& item : arr) {
    if (!item.is_object()) throw ConfigError("action entries must be objects");
    Action a = item.get<Action>();
    if (a.type.empty()) throw ConfigError("action entry without a type");
    if (seen.insert(a.type).second) out.push_back(std::move(a));
  }
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

// ----------------------------------------------------------------------------
// Catalog
// ----------------------------------------------------------------------------
ActionCatalog::ActionCatalog(std::vector<Action> actions) : actions_(std::move(actions)) {}

ActionCatalog ActionCatalog::builtin() {
  using T = EffectTarget;
  using Op = EffectOperation;
  std::vector<Action> v;

  {
    Action a = make_action("rest", "{{unitName}} the {{unitType}} takes a moment to rest.");
    a.effects.push_back(effect(T::Self, "health", Op::Add, EffectValue::random(5, 10)));
    a.effects.push_back(effect(T::Self, "mana", Op::Add, EffectValue::random(5, 10)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("retreat", "{{unitName}} the {{unitType}} retreats to recover.");
    a.requirements.push_back(requires_stat("health", "<=", 60));
    a.effects.push_back(effect(T::Self, "health", Op::Add, EffectValue::random(15, 25)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("search", "{{unitName}} the {{unitType}} searches for healing herbs.");
    a.requirements.push_back(requires_stat("health", "<=", 60));
    a.effects.push_back(effect(T::Self, "health", Op::Add, EffectValue::random(10, 20)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("meditate", "{{unitName}} the {{unitType}} meditates quietly.");
    a.effects.push_back(effect(T::Self, "mana", Op::Add, EffectValue::random(10, 20)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("attack", "{{unitName}} the {{unitType}} attacks {{targetUnitName}}.");
    a.payload.emplace("damage", RandomRange{10, 20});
    a.payload.emplace(std::string(payload_key::kRange), 1.0);
    a.effects.push_back(effect(T::Target, "health", Op::Subtract, EffectValue::from_variable("damage")));
    a.effects.push_back(effect(T::Self, "experience", Op::Add, EffectValue::fixed(1), true));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("desperate_attack",
                           "{{unitName}} the {{unitType}} lashes out desperately at {{targetUnitName}}.");
    a.requirements.push_back(requires_stat("health", "<=", 30));
    a.payload.emplace(std::string(payload_key::kRange), 1.0);
    a.effects.push_back(effect(T::Target, "health", Op::Subtract, EffectValue::fixed(25)));
    a.effects.push_back(effect(T::Self, "health", Op::Subtract, EffectValue::fixed(5)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("explore", "{{unitName}} the {{unitType}} explores the surroundings.");
    a.payload.emplace("direction", RandomDirection{});
    a.effects.push_back(effect(T::Self, "experience", Op::Add, EffectValue::fixed(1), true));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("patrol", "{{unitName}} the {{unitType}} patrols vigilantly.");
    a.effects.push_back(effect(T::Self, "awareness", Op::Add, EffectValue::fixed(1)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("train", "{{unitName}} the {{unitType}} practices skills.");
    a.effects.push_back(effect(T::Self, "attack", Op::Add, EffectValue::random(2, 5), true));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("gather", "{{unitName}} the {{unitType}} gathers resources.");
    a.payload.emplace("resource", RandomResource{});
    a.effects.push_back(effect(T::Self, "resources", Op::Add, EffectValue::random(3, 8)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("interact", "{{unitName}} the {{unitType}} talks with {{targetUnitName}}.");
    a.payload.emplace(std::string(payload_key::kRange), 1.0);
    a.effects.push_back(effect(T::Ally, "experience", Op::Add, EffectValue::fixed(1), true));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("support", "{{unitName}} the {{unitType}} supports {{targetUnitName}}.");
    a.payload.emplace(std::string(payload_key::kRange), 2.0);
    a.effects.push_back(effect(T::Target, "health", Op::Add, EffectValue::random(10, 15)));
    v.push_back(std::move(a));
  }
  {
    Action a = make_action("trade", "{{unitName}} the {{unitType}} trades with {{targetUnitName}}.");
    a.payload.emplace(std::string(payload_key::kRange), 1.0);
    v.push_back(std::move(a));
  }

  return ActionCatalog(std::move(v));
}

ActionCatalog ActionCatalog::from_json(const json& j) {
  const json* root = &j;
  if (j.is_object() && j.contains("actions")) root = &j["actions"];

  std::vector<Action> out;
  std::unordered_set<std::string> seen;
  try {
    if (root->is_array()) {
      append_unique(out, seen, *root);
    } else if (root->is_object()) {
      bool any = false;
      for (const std::string_view band : kBands) {
        const auto it = root->find(std::string(band));
        if (it == root->end()) continue;
        append_unique(out, seen, *it);
        any = true;
      }
      if (!any) throw ConfigError("action catalog object has no known health bands");
    } else {
      throw ConfigError("action catalog must be an array or an object");
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid action entry: ") + e.what());
  }
  return ActionCatalog(std::move(out));
}

ActionCatalog ActionCatalog::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw ConfigError("Could not open " + path.string());
  try {
    const json j = json::parse(in);
    return from_json(j);
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  } catch (const ConfigError& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

bool ActionCatalog::load_or_builtin(ActionCatalog& out, const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    logsys::get("engine")->info("{} not found, using built-in actions", path.string());
    out = builtin();
    return false;
  }
  out = load(path);
  logsys::get("engine")->info("Loaded {} actions from {}", out.size(), path.string());
  return true;
}

void ActionCatalog::add(Action action) {
  const auto it = std::find_if(actions_.begin(), actions_.end(),
                               [&](const Action& a) { return a.type == action.type; });
  if (it != actions_.end()) {
    *it = std::move(action);
    return;
  }
  actions_.push_back(std::move(action));
}

const Action* ActionCatalog::find(std::string_view type) const noexcept {
  for (const Action& a : actions_) {
    if (a.type == type) return &a;
  }
  return nullptr;
}

std::vector<Action> ActionCatalog::available_for(const world::Unit& unit,
                                                 std::span<const std::string> allow_list) const {
  std::vector<Action> out;
  for (const Action& a : actions_) {
    if (!allow_list.empty() && std::find(allow_list.begin(), allow_list.end(), a.type) == allow_list.end()) {
      continue;
    }
    if (!meets_requirements(unit, a)) continue;
    out.push_back(a);
  }
  if (out.empty()) return actions_;
  return out;
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------
bool meets_requirements(const world::Unit& unit, const Action& action) {
  for (const Requirement& r : action.requirements) {
    if (r.type != "comparison") continue;

    const auto op = comparison_from_string(r.op);
    if (!op) return false;
    const double value = unit.number(r.property).value_or(0.0);
    if (!compare(value, *op, r.value)) return false;
  }
  return true;
}

Payload resolve_payload(const Payload& payload, const world::Unit* target, Rng& rng) {
  Payload out;
  for (const auto& [key, value] : payload) {
    PayloadValue resolved = std::visit([&](const auto& x) -> PayloadValue {
      using V = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<V, RandomRange>) {
        return static_cast<double>(rng.range(x.min, x.max));
      } else if constexpr (std::is_same_v<V, RandomDirection>) {
        const auto* d = rng.pick(std::span<const std::string_view>(kDirections));
        return std::string(d ? *d : kDirections.front());
      } else if constexpr (std::is_same_v<V, RandomResource>) {
        const auto* r = rng.pick(std::span<const std::string_view>(kResources));
        return std::string(r ? *r : kResources.front());
      } else if constexpr (std::is_same_v<V, CalculatedValue>) {
        if (target && !x.base.empty()) {
          const double base = target->number(x.base).value_or(0.0);
          return std::max(0.0, base + x.modifier);
        }
        return x.modifier;
      } else {
        return x;
      }
    }, value);
    out.emplace(key, std::move(resolved));
  }
  return out;
}

std::string render_description(std::string_view tmpl, std::string_view unit_name, std::string_view unit_type,
                               std::string_view target_name) {
  std::string s(tmpl);
  replace_all(s, "{{unitName}}", unit_name);
  replace_all(s, "{{unitType}}", unit_type);
  replace_all(s, "{{targetUnitName}}", target_name);
  return s;
}

Action default_action(const world::Unit& unit) {
  Action a{};
  a.type = "idle";
  a.player = unit.id();
  a.description = unit.name() + " idles, doing nothing of note.";
  a.payload.emplace("target", std::string("self"));
  return a;
}

} // namespace chronicle::rules
