#pragma once

#include <cstdint>
#include <string>

namespace dispatch::db::model {

/*
  Platform share of one completed delivery.

  Append-only; delivery_ref_number is unique, so an existing row means the
  delivery has already been settled.
*/

struct AdminFeeRecord {
  std::string delivery_ref_number;
  std::string delivery_id;
  std::string rider_id;
  double      admin_fee     = 0.0;
  uint64_t    created_at_ms = 0;
};

} // namespace dispatch::db::model
