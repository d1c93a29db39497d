#pragma once

#include "dispatch/v1/types.pb.h"
#include "dispatch/v1/events.pb.h"

#include "dispatch/v1/dispatch_service.pb.h"
#include "dispatch/v1/dispatch_service.grpc.pb.h"
