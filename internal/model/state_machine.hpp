#pragma once

#include <map>
#include <set>

#include "reservation/engine/v1.hpp"

namespace reservation::model {

using ReservationStatus = reservation::engine::v1::ReservationStatus;

/*
  Reservation status state machine.

  Legal transitions are listed explicitly in TransitionTable(); nothing
  outside the table is allowed. Terminal states map to an empty set.
*/

using TransitionMap = std::map<ReservationStatus, std::set<ReservationStatus>>;

const TransitionMap& TransitionTable();

bool IsTerminal(ReservationStatus status);

// Statuses that consume slot capacity.
bool IsOccupying(ReservationStatus status);

bool CanTransition(ReservationStatus from, ReservationStatus to);

const std::set<ReservationStatus>& OccupyingStatuses();

} // namespace reservation::model
