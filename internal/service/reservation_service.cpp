#include "reservation_service.hpp"

#include <optional>
#include <string>

#include "internal/core/reservation_lifecycle.hpp"
#include "internal/service/observe_rpc.hpp"

namespace reservation::service {

using namespace reservation::engine::v1;

ReservationService::ReservationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateReservationResponse ReservationService::Create(const CreateReservationRequest& req) {
  return ObserveRpc("ReservationService.Create", req.date() + " " + req.time(), [&] {
    CreateReservationResponse resp;
    *resp.mutable_reservation() = ctx_.lifecycle->Create(req);
    return resp;
  });
}

GetReservationResponse ReservationService::Get(const GetReservationRequest& req) {
  return ObserveRpc("ReservationService.Get", req.id(), [&] {
    GetReservationResponse resp;
    *resp.mutable_reservation() = ctx_.lifecycle->Get(req.id());
    return resp;
  });
}

CancelReservationResponse ReservationService::Cancel(const CancelReservationRequest& req) {
  return ObserveRpc("ReservationService.Cancel", req.id(), [&] {
    const auto reason = req.has_reason() ? std::optional<std::string>(req.reason()) : std::nullopt;

    CancelReservationResponse resp;
    *resp.mutable_reservation() = ctx_.lifecycle->Cancel(req.id(), reason);
    return resp;
  });
}

UpdateReservationStatusResponse ReservationService::UpdateStatus(const UpdateReservationStatusRequest& req) {
  return ObserveRpc("ReservationService.UpdateStatus", req.id(), [&] {
    const auto reason = req.has_reason() ? std::optional<std::string>(req.reason()) : std::nullopt;

    UpdateReservationStatusResponse resp;
    *resp.mutable_reservation() = ctx_.lifecycle->UpdateStatus(req.id(), req.status(), reason);
    return resp;
  });
}

ListReservationsResponse ReservationService::List(const ListReservationsRequest& req) {
  return ObserveRpc("ReservationService.List", req.date(), [&] { return ctx_.lifecycle->List(req); });
}

void ReservationService::Delete(const DeleteReservationRequest& req) {
  ObserveRpc("ReservationService.Delete", req.id(), [&] { ctx_.lifecycle->Delete(req.id()); });
}

}
