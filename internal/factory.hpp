#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/service/admin_service.hpp"
#include "internal/service/availability_service.hpp"
#include "internal/service/reservation_service.hpp"
#include "internal/service/service_context.hpp"

namespace reservation::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::shared_ptr<service::ReservationService>  reservation_service;
  std::shared_ptr<service::AvailabilityService> availability_service;
  std::shared_ptr<service::AdminService>        admin_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.
  This is the composition root of the application.
*/
Application Build(const reservation::runtime::config::RuntimeConfig& config);

}
