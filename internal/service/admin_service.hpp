#pragma once

#include "reservation/engine/v1.hpp"
#include "service_context.hpp"

namespace reservation::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  reservation::engine::v1::BlockDateResponse
  BlockDate(const reservation::engine::v1::BlockDateRequest& req);

  void UnblockDate(const reservation::engine::v1::UnblockDateRequest& req);

  reservation::engine::v1::ListBlockedDatesResponse
  ListBlockedDates(const reservation::engine::v1::ListBlockedDatesRequest& req);

  reservation::engine::v1::TodayReservationsResponse
  TodayReservations(const reservation::engine::v1::TodayReservationsRequest& req);

  reservation::engine::v1::DailyStatsResponse
  DailyStats(const reservation::engine::v1::DailyStatsRequest& req);

  reservation::engine::v1::GetSettingsResponse
  GetSettings(const reservation::engine::v1::GetSettingsRequest& req);

  reservation::engine::v1::UpdateSettingsResponse
  UpdateSettings(const reservation::engine::v1::UpdateSettingsRequest& req);

private:
  ServiceContext ctx_;
};

}
