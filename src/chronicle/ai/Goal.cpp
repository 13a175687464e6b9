#include "chronicle/ai/Goal.hpp"
#include "chronicle/core/Errors.hpp"
#include "chronicle/core/Log.hpp"
#include "chronicle/rules/ConditionParser.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

namespace chronicle::ai {
using json = nlohmann::json;

void from_json(const json& j, GoalDefinition& g) {
  g = GoalDefinition{};
  g.id = j.at("id").get<std::string>();
  g.label = j.value("label", g.id);
  g.scope = j.value("scope", std::string{"unit"}) == "squad" ? GoalScope::Squad : GoalScope::Unit;
  g.candidateActions = j.value("candidateActions", std::vector<std::string>{});

  if (const auto it = j.find("completion"); it != j.end() && it->is_object()) {
    const std::string type = it->value("type", std::string{"none"});
    if (type == "stat_at_least" || type == "statAtLeast") {
      g.completion.kind = CompletionKind::StatAtLeast;
      g.completion.property = it->value("property", std::string{});
      g.completion.value = it->value("value", 0.0);
    } else if (type == "condition" || type == "condition_met") {
      g.completion.kind = CompletionKind::ConditionMet;
      g.completion.condition = it->value("condition", std::string{});
    }
  }
}

void to_json(json& j, const GoalDefinition& g) {
  json completion = json::object();
  switch (g.completion.kind) {
    case CompletionKind::None:
      completion["type"] = "none";
      break;
    case CompletionKind::StatAtLeast:
      completion = json::object({{"type", "stat_at_least"},
                                 {"property", g.completion.property},
                                 {"value", g.completion.value}});
      break;
    case CompletionKind::ConditionMet:
      completion = json::object({{"type", "condition"}, {"condition", g.completion.condition}});
      break;
  }
  j = json::object({
      {"id", g.id},
      {"label", g.label},
      {"scope", g.scope == GoalScope::Squad ? "squad" : "unit"},
      {"completion", completion},
      {"candidateActions", g.candidateActions},
  });
}

GoalCatalog GoalCatalog::builtin() {
  std::vector<GoalDefinition> goals(4);

  goals[0].id = goal_id::kRecoverHealth;
  goals[0].label = "Recover health";
  goals[0].completion = {CompletionKind::StatAtLeast, "health", 60.0, {}};
  goals[0].candidateActions = {"rest", "retreat", "search"};

  goals[1].id = goal_id::kRecoverMana;
  goals[1].label = "Recover mana";
  goals[1].completion = {CompletionKind::StatAtLeast, "mana", 50.0, {}};
  goals[1].candidateActions = {"meditate", "rest"};

  goals[2].id = goal_id::kAttackEnemy;
  goals[2].label = "Attack an enemy";
  goals[2].candidateActions = {"attack", "desperate_attack"};

  goals[3].id = goal_id::kExplore;
  goals[3].label = "Explore";
  goals[3].candidateActions = {"explore", "patrol", "gather", "train", "interact", "support", "trade"};

  return GoalCatalog(std::move(goals));
}

GoalCatalog GoalCatalog::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) throw ConfigError("Could not open " + path.string());

  try {
    const json j = json::parse(in);
    const json& arr = (j.is_object() && j.contains("goals")) ? j["goals"] : j;
    if (!arr.is_array()) throw ConfigError(path.string() + ": goals must be an array");
    return GoalCatalog(arr.get<std::vector<GoalDefinition>>());
  } catch (const json::exception& e) {
    throw ConfigError(path.string() + ": " + e.what());
  }
}

bool GoalCatalog::load_or_builtin(GoalCatalog& out, const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    logsys::get("engine")->info("{} not found, using built-in goals", path.string());
    out = builtin();
    return false;
  }
  out = load(path);
  return true;
}

const GoalDefinition* GoalCatalog::find(std::string_view id) const noexcept {
  for (const GoalDefinition& g : goals_) {
    if (g.id == id) return &g;
  }
  return nullptr;
}

bool is_goal_complete(const GoalDefinition& goal, const world::Unit& unit) {
  switch (goal.completion.kind) {
    case CompletionKind::None:
      return false;
    case CompletionKind::StatAtLeast: {
      const auto v = unit.number(goal.completion.property);
      return v && *v >= goal.completion.value;
    }
    case CompletionKind::ConditionMet: {
      const auto c = rules::parse_condition(goal.completion.condition);
      if (!c) return false;
      const auto v = unit.number(c->property);
      return v && rules::compare(*v, c->op, c->threshold);
    }
  }
  return false;
}

} // namespace chronicle::ai
