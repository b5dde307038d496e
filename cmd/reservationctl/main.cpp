#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/names.hpp"
#include "reservation/engine/v1.hpp"
#include "reservation/engine/v1/admin_service.grpc.pb.h"
#include "reservation/engine/v1/availability_service.grpc.pb.h"
#include "reservation/engine/v1/reservation_service.grpc.pb.h"

using namespace reservation::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  reservationctl <addr> availability <date> <time> <indoor|balcony> [party_size]\n"
            << "  reservationctl <addr> daily <date>\n"
            << "  reservationctl <addr> slots <date> <party_size> [indoor|balcony]\n"
            << "  reservationctl <addr> create <name> <email> <phone> <party_size> <date> <time> <indoor|balcony> [requests]\n"
            << "  reservationctl <addr> get <id>\n"
            << "  reservationctl <addr> cancel <id> [reason]\n"
            << "  reservationctl <addr> status <id> <status> [reason]\n"
            << "  reservationctl <addr> list [status=..] [date=..] [email=..] [seating=..] [limit=..] [offset=..]\n"
            << "  reservationctl <addr> delete <id>\n"
            << "  reservationctl <addr> block <date> <reason>\n"
            << "  reservationctl <addr> unblock <date>\n"
            << "  reservationctl <addr> blocked\n"
            << "  reservationctl <addr> today\n"
            << "  reservationctl <addr> stats [date]\n"
            << "  reservationctl <addr> settings\n";
}

static SeatingType RequireSeating(const std::string& value) {
  auto parsed = reservation::model::ParseSeatingType(value);
  if (!parsed) {
    std::cerr << "unsupported seating type: " << value << "\n";
    std::exit(1);
  }
  return *parsed;
}

static ReservationStatus RequireStatus(const std::string& value) {
  auto parsed = reservation::model::ParseStatus(value);
  if (!parsed) {
    std::cerr << "unsupported status: " << value << "\n";
    std::exit(1);
  }
  return *parsed;
}

static uint32_t RequireCount(const std::string& value) {
  try {
    return static_cast<uint32_t>(std::stoul(value));
  } catch (const std::exception&) {
    std::cerr << "invalid number: " << value << "\n";
    std::exit(1);
  }
}

static void Print(const Reservation& r) {
  std::cout << r.id() << " " << r.date() << " " << r.time() << " " << reservation::model::ToString(r.seating_type())
            << " party=" << r.party_size() << " status=" << reservation::model::ToString(r.status()) << " guest=\"" << r.guest_name()
            << "\" email=" << r.email() << "\n";
}

static int Fail(const grpc::Status& status, const grpc::ClientContext& ctx) {
  std::cerr << status.error_message() << "\n";
  for (const auto& [key, value] : ctx.GetServerTrailingMetadata()) {
    std::cerr << "  " << std::string(key.data(), key.size()) << "=" << std::string(value.data(), value.size()) << "\n";
  }
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto reservation_stub  = ReservationService::NewStub(channel);
  auto availability_stub = AvailabilityService::NewStub(channel);
  auto admin_stub        = ReservationAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "availability") {
    if (argc < 6) return 1;

    SlotAvailabilityRequest req;
    req.set_date(argv[3]);
    req.set_time(argv[4]);
    req.set_seating_type(RequireSeating(argv[5]));
    if (argc >= 7) req.set_party_size(RequireCount(argv[6]));

    SlotAvailabilityResponse resp;
    auto status = availability_stub->GetSlotAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    const auto& a = resp.availability();
    std::cout << "total=" << a.total_capacity() << " booked=" << a.booked_count() << " remaining=" << a.remaining_capacity()
              << " available=" << (a.available() ? "true" : "false");
    if (req.party_size() > 0) std::cout << " can_accommodate=" << (resp.can_accommodate() ? "true" : "false");
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "daily") {
    if (argc < 4) return 1;

    DailyAvailabilityRequest req;
    req.set_date(argv[3]);

    DailyAvailabilityResponse resp;
    auto status = availability_stub->GetDailyAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    const auto& day = resp.availability();
    if (day.is_blocked()) {
      std::cout << day.date() << " blocked: " << day.notes() << "\n";
      return 0;
    }
    for (const auto& slot : day.time_slots()) {
      std::cout << slot.time() << " indoor=" << slot.available_indoor() << " balcony=" << slot.available_balcony()
                << (slot.is_available() ? "" : " full") << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "slots") {
    if (argc < 5) return 1;

    AvailableSlotsRequest req;
    req.set_date(argv[3]);
    req.set_party_size(RequireCount(argv[4]));
    if (argc >= 6) req.set_preferred_seating_type(RequireSeating(argv[5]));

    AvailableSlotsResponse resp;
    auto status = availability_stub->ListAvailableSlots(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "indoor:";
    for (const auto& t : resp.indoor()) std::cout << " " << t;
    std::cout << "\nbalcony:";
    for (const auto& t : resp.balcony()) std::cout << " " << t;
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 10) return 1;

    CreateReservationRequest req;
    req.set_guest_name(argv[3]);
    req.set_email(argv[4]);
    req.set_phone(argv[5]);
    req.set_party_size(RequireCount(argv[6]));
    req.set_date(argv[7]);
    req.set_time(argv[8]);
    req.set_seating_type(RequireSeating(argv[9]));
    if (argc >= 11) req.set_special_requests(argv[10]);

    CreateReservationResponse resp;
    auto status = reservation_stub->CreateReservation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    Print(resp.reservation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetReservationRequest req;
    req.set_id(argv[3]);

    GetReservationResponse resp;
    auto status = reservation_stub->GetReservation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    Print(resp.reservation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelReservationRequest req;
    req.set_id(argv[3]);
    if (argc >= 5) req.set_reason(argv[4]);

    CancelReservationResponse resp;
    auto status = reservation_stub->CancelReservation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    Print(resp.reservation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 5) return 1;

    UpdateReservationStatusRequest req;
    req.set_id(argv[3]);
    req.set_status(RequireStatus(argv[4]));
    if (argc >= 6) req.set_reason(argv[5]);

    UpdateReservationStatusResponse resp;
    auto status = reservation_stub->UpdateReservationStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    Print(resp.reservation());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    ListReservationsRequest req;
    for (int i = 3; i < argc; ++i) {
      const std::string arg = argv[i];
      const auto        eq  = arg.find('=');
      if (eq == std::string::npos) {
        std::cerr << "expected key=value, got " << arg << "\n";
        return 1;
      }
      const auto key   = arg.substr(0, eq);
      const auto value = arg.substr(eq + 1);
      if (key == "status") {
        req.set_status(RequireStatus(value));
      } else if (key == "date") {
        req.set_date(value);
      } else if (key == "email") {
        req.set_email(value);
      } else if (key == "seating") {
        req.set_seating_type(RequireSeating(value));
      } else if (key == "limit") {
        req.set_limit(RequireCount(value));
      } else if (key == "offset") {
        req.set_offset(RequireCount(value));
      } else {
        std::cerr << "unknown filter: " << key << "\n";
        return 1;
      }
    }

    ListReservationsResponse resp;
    auto status = reservation_stub->ListReservations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    for (const auto& r : resp.reservations()) Print(r);
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteReservationRequest req;
    req.set_id(argv[3]);

    google::protobuf::Empty resp;
    auto status = reservation_stub->DeleteReservation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "block") {
    if (argc < 5) return 1;

    BlockDateRequest req;
    req.set_date(argv[3]);
    req.set_reason(argv[4]);

    BlockDateResponse resp;
    auto status = admin_stub->BlockDate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "blocked " << resp.blocked_date().date() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "unblock") {
    if (argc < 4) return 1;

    UnblockDateRequest req;
    req.set_date(argv[3]);

    google::protobuf::Empty resp;
    auto status = admin_stub->UnblockDate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "unblocked\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "blocked") {
    ListBlockedDatesRequest  req;
    ListBlockedDatesResponse resp;
    auto status = admin_stub->ListBlockedDates(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    for (const auto& b : resp.blocked_dates()) std::cout << b.date() << " " << b.reason() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "today") {
    TodayReservationsRequest  req;
    TodayReservationsResponse resp;
    auto status = admin_stub->TodayReservations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "date=" << resp.date() << "\n";
    for (const auto& r : resp.reservations()) Print(r);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    DailyStatsRequest req;
    if (argc >= 4) req.set_date(argv[3]);

    DailyStatsResponse resp;
    auto status = admin_stub->DailyStats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    std::cout << "date=" << resp.date() << " reservations=" << resp.reservations() << " guests=" << resp.guests() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "settings") {
    GetSettingsRequest  req;
    GetSettingsResponse resp;
    auto status = admin_stub->GetSettings(&ctx, req, &resp);
    if (!status.ok()) return Fail(status, ctx);

    const auto& s = resp.settings();
    std::cout << "indoor_capacity=" << s.indoor_capacity() << "\n"
              << "balcony_capacity=" << s.balcony_capacity() << "\n"
              << "time_slots=";
    for (int i = 0; i < s.time_slots_size(); ++i) std::cout << (i ? "," : "") << s.time_slots(i);
    std::cout << "\n"
              << "max_advance_booking_days=" << s.max_advance_booking_days() << "\n"
              << "cancellation_window_hours=" << s.cancellation_window_hours() << "\n"
              << "max_party_size=" << s.max_party_size() << "\n"
              << "utc_offset_minutes=" << s.utc_offset_minutes() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
