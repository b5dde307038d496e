#pragma once

#include "reservation/engine/v1.hpp"
#include "service_context.hpp"

namespace reservation::service {

class AvailabilityService {
public:
  explicit AvailabilityService(ServiceContext ctx);

  reservation::engine::v1::SlotAvailabilityResponse
  GetSlotAvailability(const reservation::engine::v1::SlotAvailabilityRequest& req);

  reservation::engine::v1::DailyAvailabilityResponse
  GetDailyAvailability(const reservation::engine::v1::DailyAvailabilityRequest& req);

  reservation::engine::v1::AvailableSlotsResponse
  ListAvailableSlots(const reservation::engine::v1::AvailableSlotsRequest& req);

  reservation::engine::v1::HasAvailabilityResponse
  HasAvailability(const reservation::engine::v1::HasAvailabilityRequest& req);

private:
  ServiceContext ctx_;
};

}
