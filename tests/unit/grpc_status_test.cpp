#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/bootstrap.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/availability_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/reservation_server.hpp"
#include "internal/settings/booking_settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using namespace reservation::engine::v1;

// 2030-06-01T12:00:00Z
const reservation::util::TimePoint kNow = sys_days{year{2030} / 6 / 1} + hours(12);

reservation::service::ServiceContext BuildServiceContext() {
  reservation::runtime::config::RuntimeConfig config;
  *config.mutable_booking() = reservation::settings::BookingSettings::Defaults();
  config.mutable_booking()->set_balcony_capacity(4);
  auto* seed = config.add_blocked_dates();
  seed->set_date("2030-06-24");
  seed->set_reason("Closed");
  return reservation::bootstrap::BuildServiceContext(config, std::make_shared<reservation::db::memory::MemoryRepository>(),
                                                     [] { return kNow; });
}

CreateReservationRequest Request(const std::string& date, uint32_t party_size) {
  CreateReservationRequest req;
  req.set_guest_name("Katherine Johnson");
  req.set_email("kj@example.com");
  req.set_phone("757-555-0199");
  req.set_party_size(party_size);
  req.set_date(date);
  req.set_time("18:00");
  req.set_seating_type(SEATING_TYPE_BALCONY);
  return req;
}

void TestExceptionMapping() {
  using reservation::grpc::ToStatus;

  assert(ToStatus(reservation::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(reservation::util::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(reservation::util::CapacityExhausted("full", 2)).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(reservation::util::PreconditionFailed("late", 24, 3)).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(reservation::util::TransientConflict("busy")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(reservation::util::NotFound("Reservation not found: abc"));
  assert(status.error_message() == "Reservation not found: abc");
}

void TestReservationServerStatuses() {
  auto ctx = BuildServiceContext();
  reservation::grpc::ReservationServer server(std::make_shared<reservation::service::ReservationService>(ctx));

  {
    auto                      req = Request("2030-06-24", 2);
    CreateReservationResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    assert(server.CreateReservation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  std::string booked_id;
  {
    auto                      req = Request("2030-06-02", 3);
    CreateReservationResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    assert(server.CreateReservation(&grpc_ctx, &req, &resp).ok());
    booked_id = resp.reservation().id();
  }

  {
    auto                      req = Request("2030-06-02", 2);
    CreateReservationResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    const auto                status = server.CreateReservation(&grpc_ctx, &req, &resp);
    assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
    assert(status.error_message() == "Only 1 balcony seats available for 2030-06-02 18:00");
  }

  {
    GetReservationRequest  req;
    GetReservationResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    req.set_id("missing");
    assert(server.GetReservation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  {
    // 2030-06-02 18:00 is 30 hours out; a same-day booking is inside the window.
    auto                      create = Request("2030-06-01", 2);
    CreateReservationResponse created;
    ::grpc::ServerContext     create_ctx;
    assert(server.CreateReservation(&create_ctx, &create, &created).ok());

    CancelReservationRequest  req;
    CancelReservationResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    req.set_id(created.reservation().id());
    assert(server.CancelReservation(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

    req.set_id(booked_id);
    ::grpc::ServerContext ok_ctx;
    assert(server.CancelReservation(&ok_ctx, &req, &resp).ok());
    assert(resp.reservation().status() == RESERVATION_STATUS_CANCELLED);
  }

  {
    UpdateReservationStatusRequest  req;
    UpdateReservationStatusResponse resp;
    ::grpc::ServerContext           grpc_ctx;
    req.set_id(booked_id);
    req.set_status(RESERVATION_STATUS_SEATED);
    assert(server.UpdateReservationStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

void TestAvailabilityAndAdminServerStatuses() {
  auto ctx = BuildServiceContext();
  reservation::grpc::AvailabilityServer availability(std::make_shared<reservation::service::AvailabilityService>(ctx));
  reservation::grpc::AdminServer        admin(std::make_shared<reservation::service::AdminService>(ctx));

  {
    AvailableSlotsRequest  req;
    AvailableSlotsResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    req.set_date("2030-06-02");
    req.set_party_size(0);
    assert(availability.ListAvailableSlots(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  {
    DailyAvailabilityRequest  req;
    DailyAvailabilityResponse resp;
    ::grpc::ServerContext     grpc_ctx;
    req.set_date("2030-06-24");
    assert(availability.GetDailyAvailability(&grpc_ctx, &req, &resp).ok());
    assert(resp.availability().is_blocked());
  }

  {
    UnblockDateRequest     req;
    google::protobuf::Empty resp;
    ::grpc::ServerContext  grpc_ctx;
    req.set_date("2030-06-25");
    assert(admin.UnblockDate(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  {
    UpdateSettingsRequest  req;
    UpdateSettingsResponse resp;
    ::grpc::ServerContext  grpc_ctx;
    *req.mutable_settings() = reservation::settings::BookingSettings::Defaults();
    req.mutable_settings()->clear_time_slots();
    assert(admin.UpdateSettings(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestReservationServerStatuses();
  TestAvailabilityAndAdminServerStatuses();

  std::cout << "reservation_engine_unit_grpc_status: pass\n";
  return 0;
}
