#pragma once

#include "dispatch/engine/core/v1/types.pb.h"
#include "dispatch/engine/core/v1/ride.pb.h"

#include "dispatch/engine/realtime/v1/events.pb.h"

#include "dispatch/engine/services/v1/ride_service.pb.h"
#include "dispatch/engine/services/v1/driver_service.pb.h"
#include "dispatch/engine/services/v1/realtime_service.pb.h"

#include "dispatch/engine/services/v1/ride_service.grpc.pb.h"
#include "dispatch/engine/services/v1/driver_service.grpc.pb.h"
#include "dispatch/engine/services/v1/realtime_service.grpc.pb.h"

namespace dispatch::engine::v1 {
using namespace ::dispatch::engine::core::v1;
using namespace ::dispatch::engine::realtime::v1;
using namespace ::dispatch::engine::services::v1;
}
