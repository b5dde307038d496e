#include "factory.hpp"

#include "internal/bootstrap.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/availability_server.hpp"
#include "internal/grpc/reservation_server.hpp"

namespace reservation::factory {

Application Build(const reservation::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto repository = bootstrap::BuildRepository(config);
  app.context     = bootstrap::BuildServiceContext(config, repository);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.reservation_service  = std::make_shared<service::ReservationService>(app.context);
  app.availability_service = std::make_shared<service::AvailabilityService>(app.context);
  app.admin_service        = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ReservationServer>(app.reservation_service));
  app.grpc_services.push_back(std::make_unique<grpc::AvailabilityServer>(app.availability_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.admin_service));

  return app;
}

} // namespace reservation::factory
