#pragma once

#include <stdexcept>
#include <string>

namespace chronicle {

// Required data is absent (unit without a position, unknown unit or map).
// Fatal to the single operation, caught at the turn-loop boundary.
class MissingDataError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Movement planning could not produce a plan.
class PlanningError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No walkable tile lies within action range of the target.
class NoGoalPositionsError final : public PlanningError {
public:
  NoGoalPositionsError() : PlanningError("No available goal positions.") {}
};

// Goal tiles exist but none is reachable from the mover.
class NoPathError final : public PlanningError {
public:
  NoPathError() : PlanningError("No path found.") {}
};

// Raised while applying an effect batch; aborts the remainder of the batch.
class EffectError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Turn scheduler misuse. Not recoverable.
class SchedulerError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace chronicle
