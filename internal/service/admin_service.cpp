#include "admin_service.hpp"

#include "internal/core/blocked_date_registry.hpp"
#include "internal/core/reservation_lifecycle.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/settings/settings_provider.hpp"

namespace reservation::service {

using namespace reservation::engine::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

BlockDateResponse AdminService::BlockDate(const BlockDateRequest& req) {
  return ObserveRpc("AdminService.BlockDate", req.date(), [&] {
    BlockDateResponse resp;
    *resp.mutable_blocked_date() = ctx_.blocked_dates->Block(req.date(), req.reason());
    return resp;
  });
}

void AdminService::UnblockDate(const UnblockDateRequest& req) {
  ObserveRpc("AdminService.UnblockDate", req.date(), [&] { ctx_.blocked_dates->Unblock(req.date()); });
}

ListBlockedDatesResponse AdminService::ListBlockedDates(const ListBlockedDatesRequest&) {
  return ObserveRpc("AdminService.ListBlockedDates", "", [&] {
    ListBlockedDatesResponse resp;
    for (auto& blocked : ctx_.blocked_dates->List()) {
      *resp.add_blocked_dates() = std::move(blocked);
    }
    return resp;
  });
}

TodayReservationsResponse AdminService::TodayReservations(const TodayReservationsRequest&) {
  return ObserveRpc("AdminService.TodayReservations", "", [&] {
    TodayReservationsResponse resp;
    resp.set_date(ctx_.lifecycle->TodayKey());
    for (auto& reservation : ctx_.lifecycle->TodayReservations()) {
      *resp.add_reservations() = std::move(reservation);
    }
    return resp;
  });
}

DailyStatsResponse AdminService::DailyStats(const DailyStatsRequest& req) {
  return ObserveRpc("AdminService.DailyStats", req.date(), [&] {
    const auto stats = ctx_.lifecycle->Stats(req.date());

    DailyStatsResponse resp;
    resp.set_date(stats.date);
    resp.set_reservations(stats.reservations);
    resp.set_guests(stats.guests);
    return resp;
  });
}

GetSettingsResponse AdminService::GetSettings(const GetSettingsRequest&) {
  return ObserveRpc("AdminService.GetSettings", "", [&] {
    GetSettingsResponse resp;
    *resp.mutable_settings() = ctx_.settings->Snapshot()->Proto();
    return resp;
  });
}

UpdateSettingsResponse AdminService::UpdateSettings(const UpdateSettingsRequest& req) {
  return ObserveRpc("AdminService.UpdateSettings", "", [&] {
    UpdateSettingsResponse resp;
    *resp.mutable_settings() = ctx_.settings->Update(req.settings())->Proto();
    return resp;
  });
}

}
