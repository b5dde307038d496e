#include "availability_service.hpp"

#include "internal/core/availability_calculator.hpp"
#include "internal/core/daily_availability.hpp"
#include "internal/service/observe_rpc.hpp"

namespace reservation::service {

using namespace reservation::engine::v1;

AvailabilityService::AvailabilityService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SlotAvailabilityResponse AvailabilityService::GetSlotAvailability(const SlotAvailabilityRequest& req) {
  return ObserveRpc("AvailabilityService.GetSlotAvailability", req.date(), [&] {
    SlotAvailabilityResponse resp;
    *resp.mutable_availability() = ctx_.calculator->ComputeSlotAvailability(req.date(), req.time(), req.seating_type());
    resp.set_can_accommodate(req.party_size() > 0 && resp.availability().remaining_capacity() >= req.party_size());
    return resp;
  });
}

DailyAvailabilityResponse AvailabilityService::GetDailyAvailability(const DailyAvailabilityRequest& req) {
  return ObserveRpc("AvailabilityService.GetDailyAvailability", req.date(), [&] {
    DailyAvailabilityResponse resp;
    *resp.mutable_availability() = ctx_.daily->GetDailyAvailability(req.date());
    return resp;
  });
}

AvailableSlotsResponse AvailabilityService::ListAvailableSlots(const AvailableSlotsRequest& req) {
  return ObserveRpc("AvailabilityService.ListAvailableSlots", req.date(), [&] {
    const auto slots = ctx_.daily->ListAvailableSlotsForParty(req.date(), req.party_size(), req.preferred_seating_type());

    AvailableSlotsResponse resp;
    resp.mutable_indoor()->Add(slots.indoor.begin(), slots.indoor.end());
    resp.mutable_balcony()->Add(slots.balcony.begin(), slots.balcony.end());
    resp.set_preferred_seating_type(slots.preferred);
    return resp;
  });
}

HasAvailabilityResponse AvailabilityService::HasAvailability(const HasAvailabilityRequest& req) {
  return ObserveRpc("AvailabilityService.HasAvailability", req.date(), [&] {
    HasAvailabilityResponse resp;
    resp.set_available(ctx_.daily->HasAnyAvailability(req.date()));
    return resp;
  });
}

}
