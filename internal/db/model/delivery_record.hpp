#pragma once

#include <cstdint>
#include <string>

#include "dispatch/v1/types.pb.h"
#include "internal/geo/geo.hpp"

namespace dispatch::db::model {

/*
  Persistent delivery row.

  status only moves along pending -> assigned -> on_transit -> delivered,
  or to canceled from any non-terminal state. rider_id is empty until a
  rider accepts.
*/

struct DeliveryRecord {
  std::string id;
  std::string customer_id;
  std::string rider_id;

  dispatch::v1::DeliveryStatus status = dispatch::v1::DELIVERY_STATUS_PENDING;

  double      delivery_fee = 0.0;
  std::string delivery_ref_number;

  std::string      sender_name;
  std::string      sender_address;
  std::string      recipient_address;
  geo::Coordinates sender_location;
  geo::Coordinates recipient_location;

  std::string               estimated_delivery_time;
  dispatch::v1::VehicleType vehicle_type = dispatch::v1::VEHICLE_TYPE_UNSPECIFIED;

  uint64_t created_at_ms = 0;
};

} // namespace dispatch::db::model
