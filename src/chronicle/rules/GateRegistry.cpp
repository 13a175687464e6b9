#include "chronicle/rules/GateRegistry.hpp"
#include "chronicle/core/Log.hpp"

#include <algorithm>

namespace chronicle::rules {

bool GateRegistry::add_gate(const Gate& gate) {
  const bool exists = std::any_of(gates_.begin(), gates_.end(),
                                  [&](const Gate& g) { return g.name == gate.name; });
  if (exists) {
    logsys::get("world")->debug("Gate {} already registered", gate.name);
    return false;
  }

  gates_.push_back(gate);
  if (gate.bidirectional) {
    Gate reverse{};
    reverse.mapFrom = gate.mapTo;
    reverse.positionFrom = gate.positionTo;
    reverse.mapTo = gate.mapFrom;
    reverse.positionTo = gate.positionFrom;
    reverse.name = gate.name + std::string(kReverseGateSuffix);
    reverse.bidirectional = false;
    gates_.push_back(std::move(reverse));
  }
  return true;
}

bool GateRegistry::remove_gate(std::string_view name_prefix) {
  const auto removed = std::erase_if(gates_, [&](const Gate& g) {
    return std::string_view(g.name).substr(0, name_prefix.size()) == name_prefix;
  });
  return removed > 0;
}

const Gate* GateRegistry::destination(std::string_view map_id, int x, int y) const noexcept {
  for (const Gate& g : gates_) {
    if (g.mapFrom == map_id && g.positionFrom.x == x && g.positionFrom.y == y) return &g;
  }
  return nullptr;
}

bool GateRegistry::has_gate(std::string_view map_id, int x, int y) const noexcept {
  return destination(map_id, x, y) != nullptr;
}

std::vector<Gate> GateRegistry::gates_for_map(std::string_view map_id) const {
  std::vector<Gate> out;
  for (const Gate& g : gates_) {
    if (g.mapFrom == map_id) out.push_back(g);
  }
  return out;
}

} // namespace chronicle::rules
