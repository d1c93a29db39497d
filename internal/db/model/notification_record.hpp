#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

// Rider availability answer for one delivery.
struct NotificationRecord {
  std::string id;
  std::string delivery_ref_number;
  std::string delivery_id;
  std::string rider_id;
  std::string customer_id;
  bool        rider_availability_status = false;
  uint64_t    created_at_ms             = 0;
};

} // namespace dispatch::db::model
