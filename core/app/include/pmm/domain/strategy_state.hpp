#pragma once

namespace pmm {
namespace domain {

// -----------------------------------------------------------------------------
// StrategyState - Strategy Loop run state
// -----------------------------------------------------------------------------
//
//   Idle ──run()──> Running ──deadline or stop()──> WindingDown ──> Done
//
// Running: refresh cycles are executing.
// WindingDown: the deadline passed (or stop() was called); outstanding
//              quotes are being canceled.
// Done: the run returned. A loop object serves exactly one run.
// -----------------------------------------------------------------------------
enum class StrategyState {
  Idle,
  Running,
  WindingDown,
  Done,
};

inline const char* toString(StrategyState state) {
  switch (state) {
    case StrategyState::Idle:        return "Idle";
    case StrategyState::Running:     return "Running";
    case StrategyState::WindingDown: return "WindingDown";
    case StrategyState::Done:        return "Done";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace pmm
