#include "internal/model/names.hpp"
#include "internal/model/slot_key.hpp"
#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

namespace {

using namespace reservation::engine::v1;
using reservation::model::CanTransition;

void TestLegalTransitions() {
  assert(CanTransition(RESERVATION_STATUS_PENDING, RESERVATION_STATUS_CONFIRMED));
  assert(CanTransition(RESERVATION_STATUS_PENDING, RESERVATION_STATUS_CANCELLED));

  assert(CanTransition(RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_PENDING));
  assert(CanTransition(RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_SEATED));
  assert(CanTransition(RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_CANCELLED));
  assert(CanTransition(RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_NO_SHOW));

  assert(CanTransition(RESERVATION_STATUS_SEATED, RESERVATION_STATUS_COMPLETED));
}

void TestIllegalTransitions() {
  assert(!CanTransition(RESERVATION_STATUS_PENDING, RESERVATION_STATUS_SEATED));
  assert(!CanTransition(RESERVATION_STATUS_PENDING, RESERVATION_STATUS_PENDING));
  assert(!CanTransition(RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_COMPLETED));
  assert(!CanTransition(RESERVATION_STATUS_SEATED, RESERVATION_STATUS_CANCELLED));
  assert(!CanTransition(RESERVATION_STATUS_SEATED, RESERVATION_STATUS_NO_SHOW));
  assert(!CanTransition(RESERVATION_STATUS_UNSPECIFIED, RESERVATION_STATUS_CONFIRMED));

  for (auto terminal : {RESERVATION_STATUS_COMPLETED, RESERVATION_STATUS_CANCELLED, RESERVATION_STATUS_NO_SHOW}) {
    assert(reservation::model::IsTerminal(terminal));
    for (const auto& [to, _] : reservation::model::TransitionTable()) {
      assert(!CanTransition(terminal, to));
    }
  }
  assert(!reservation::model::IsTerminal(RESERVATION_STATUS_SEATED));
}

void TestOccupyingStatuses() {
  assert(reservation::model::IsOccupying(RESERVATION_STATUS_PENDING));
  assert(reservation::model::IsOccupying(RESERVATION_STATUS_CONFIRMED));
  assert(reservation::model::IsOccupying(RESERVATION_STATUS_SEATED));
  assert(!reservation::model::IsOccupying(RESERVATION_STATUS_COMPLETED));
  assert(!reservation::model::IsOccupying(RESERVATION_STATUS_CANCELLED));
  assert(!reservation::model::IsOccupying(RESERVATION_STATUS_NO_SHOW));
  assert(reservation::model::OccupyingStatuses().size() == 3);
}

void TestWireNames() {
  assert(reservation::model::ToString(RESERVATION_STATUS_NO_SHOW) == "no-show");
  assert(reservation::model::ParseStatus("no-show") == RESERVATION_STATUS_NO_SHOW);
  assert(!reservation::model::ParseStatus("noshow").has_value());

  assert(reservation::model::ToString(SEATING_TYPE_BALCONY) == "balcony");
  assert(reservation::model::ParseSeatingType("indoor") == SEATING_TYPE_INDOOR);
  assert(!reservation::model::ParseSeatingType("terrace").has_value());

  const reservation::model::SlotKey key{"2030-06-01", "19:00", SEATING_TYPE_BALCONY};
  assert(key.ToString() == "2030-06-01_19:00_balcony");
}

} // namespace

int main() {
  TestLegalTransitions();
  TestIllegalTransitions();
  TestOccupyingStatuses();
  TestWireNames();

  std::cout << "reservation_engine_unit_state_machine: pass\n";
  return 0;
}
