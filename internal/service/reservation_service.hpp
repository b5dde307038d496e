#pragma once

#include "reservation/engine/v1.hpp"
#include "service_context.hpp"

namespace reservation::service {

class ReservationService {
public:
  explicit ReservationService(ServiceContext ctx);

  reservation::engine::v1::CreateReservationResponse
  Create(const reservation::engine::v1::CreateReservationRequest& req);

  reservation::engine::v1::GetReservationResponse
  Get(const reservation::engine::v1::GetReservationRequest& req);

  reservation::engine::v1::CancelReservationResponse
  Cancel(const reservation::engine::v1::CancelReservationRequest& req);

  reservation::engine::v1::UpdateReservationStatusResponse
  UpdateStatus(const reservation::engine::v1::UpdateReservationStatusRequest& req);

  reservation::engine::v1::ListReservationsResponse
  List(const reservation::engine::v1::ListReservationsRequest& req);

  void Delete(const reservation::engine::v1::DeleteReservationRequest& req);

private:
  ServiceContext ctx_;
};

}
