#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "reservation/engine/v1/availability_service.grpc.pb.h"
#include "internal/service/availability_service.hpp"

namespace reservation::grpc {

class AvailabilityServer final : public reservation::engine::v1::AvailabilityService::Service {
public:
  explicit AvailabilityServer(std::shared_ptr<reservation::service::AvailabilityService> svc);

  ::grpc::Status GetSlotAvailability(::grpc::ServerContext*,
                                     const reservation::engine::v1::SlotAvailabilityRequest*,
                                     reservation::engine::v1::SlotAvailabilityResponse*) override;

  ::grpc::Status GetDailyAvailability(::grpc::ServerContext*,
                                      const reservation::engine::v1::DailyAvailabilityRequest*,
                                      reservation::engine::v1::DailyAvailabilityResponse*) override;

  ::grpc::Status ListAvailableSlots(::grpc::ServerContext*,
                                    const reservation::engine::v1::AvailableSlotsRequest*,
                                    reservation::engine::v1::AvailableSlotsResponse*) override;

  ::grpc::Status HasAvailability(::grpc::ServerContext*,
                                 const reservation::engine::v1::HasAvailabilityRequest*,
                                 reservation::engine::v1::HasAvailabilityResponse*) override;

private:
  std::shared_ptr<reservation::service::AvailabilityService> service_;
};

}
