#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "reservation/engine/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace reservation::grpc {

class AdminServer final : public reservation::engine::v1::ReservationAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<reservation::service::AdminService> svc);

  ::grpc::Status BlockDate(::grpc::ServerContext*,
                           const reservation::engine::v1::BlockDateRequest*,
                           reservation::engine::v1::BlockDateResponse*) override;

  ::grpc::Status UnblockDate(::grpc::ServerContext*,
                             const reservation::engine::v1::UnblockDateRequest*,
                             google::protobuf::Empty*) override;

  ::grpc::Status ListBlockedDates(::grpc::ServerContext*,
                                  const reservation::engine::v1::ListBlockedDatesRequest*,
                                  reservation::engine::v1::ListBlockedDatesResponse*) override;

  ::grpc::Status TodayReservations(::grpc::ServerContext*,
                                   const reservation::engine::v1::TodayReservationsRequest*,
                                   reservation::engine::v1::TodayReservationsResponse*) override;

  ::grpc::Status DailyStats(::grpc::ServerContext*,
                            const reservation::engine::v1::DailyStatsRequest*,
                            reservation::engine::v1::DailyStatsResponse*) override;

  ::grpc::Status GetSettings(::grpc::ServerContext*,
                             const reservation::engine::v1::GetSettingsRequest*,
                             reservation::engine::v1::GetSettingsResponse*) override;

  ::grpc::Status UpdateSettings(::grpc::ServerContext*,
                                const reservation::engine::v1::UpdateSettingsRequest*,
                                reservation::engine::v1::UpdateSettingsResponse*) override;

private:
  std::shared_ptr<reservation::service::AdminService> service_;
};

}
