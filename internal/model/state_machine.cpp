#include "state_machine.hpp"

namespace reservation::model {

using namespace reservation::engine::v1;

const TransitionMap& TransitionTable() {
  static const TransitionMap kTable = {
      {RESERVATION_STATUS_PENDING, {RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_CANCELLED}},
      {RESERVATION_STATUS_CONFIRMED,
       {RESERVATION_STATUS_PENDING, RESERVATION_STATUS_SEATED, RESERVATION_STATUS_CANCELLED, RESERVATION_STATUS_NO_SHOW}},
      {RESERVATION_STATUS_SEATED, {RESERVATION_STATUS_COMPLETED}},
      {RESERVATION_STATUS_COMPLETED, {}},
      {RESERVATION_STATUS_CANCELLED, {}},
      {RESERVATION_STATUS_NO_SHOW, {}},
  };
  return kTable;
}

const std::set<ReservationStatus>& OccupyingStatuses() {
  static const std::set<ReservationStatus> kOccupying = {RESERVATION_STATUS_PENDING, RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_SEATED};
  return kOccupying;
}

bool IsTerminal(ReservationStatus status) {
  const auto& table = TransitionTable();
  const auto  it    = table.find(status);
  return it != table.end() && it->second.empty();
}

bool IsOccupying(ReservationStatus status) {
  return OccupyingStatuses().count(status) > 0;
}

bool CanTransition(ReservationStatus from, ReservationStatus to) {
  const auto& table = TransitionTable();
  const auto  it    = table.find(from);
  if (it == table.end()) {
    return false;
  }
  return it->second.count(to) > 0;
}

} // namespace reservation::model
