#pragma once

#include "reservation/engine/v1/types.pb.h"

#include "reservation/engine/v1/admin_service.pb.h"
#include "reservation/engine/v1/availability_service.pb.h"
#include "reservation/engine/v1/reservation_service.pb.h"
