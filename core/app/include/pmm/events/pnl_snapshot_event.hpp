#pragma once

#include "pmm/domain/pnl_snapshot.hpp"

#include <cstddef>

namespace pmm {

// -----------------------------------------------------------------------------
// PnlSnapshotEvent
// -----------------------------------------------------------------------------
// Published by PnlTracker after a snapshot has been appended. history_size
// is the history length including this snapshot.
// -----------------------------------------------------------------------------
struct PnlSnapshotEvent {
  domain::PnlSnapshot snapshot;
  std::size_t history_size{0};
};

}  // namespace pmm
