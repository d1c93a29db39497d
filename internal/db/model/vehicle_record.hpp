#pragma once

#include <string>

#include "dispatch/v1/types.pb.h"

namespace dispatch::db::model {

struct VehicleRecord {
  std::string               id;
  std::string               rider_id;
  dispatch::v1::VehicleType vehicle_type = dispatch::v1::VEHICLE_TYPE_UNSPECIFIED;
  std::string               plate_number;
};

} // namespace dispatch::db::model
