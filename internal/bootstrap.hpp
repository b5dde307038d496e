#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/time.hpp"

namespace reservation::bootstrap {

/*
  Backend selection + schema bootstrap.

  The ONLY place allowed to know concrete DB types. No database section
  selects the in-memory backend.
*/
std::shared_ptr<reservation::db::Repository> BuildRepository(const reservation::runtime::config::RuntimeConfig& config);

/*
  Wires settings, calculator, aggregator, slot reservation and lifecycle
  over `repository`, then seeds the configured blocked dates.
*/
reservation::service::ServiceContext BuildServiceContext(const reservation::runtime::config::RuntimeConfig& config,
                                                         std::shared_ptr<reservation::db::Repository>       repository,
                                                         reservation::util::NowFn                           now = reservation::util::Now);

} // namespace reservation::bootstrap
