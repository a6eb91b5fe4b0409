#pragma once

#include "livetv/broker/core/v1/types.pb.h"

#include "livetv/broker/services/v1/broker_admin_service.pb.h"
#include "livetv/broker/services/v1/tuner_broker_service.pb.h"

#include "livetv/broker/services/v1/broker_admin_service.grpc.pb.h"
#include "livetv/broker/services/v1/tuner_broker_service.grpc.pb.h"

namespace livetv::broker::v1 {
using namespace ::livetv::broker::core::v1;
using namespace ::livetv::broker::services::v1;
}
