#pragma once

#include <string>

#include "dispatch/v1/types.pb.h"

namespace dispatch::db::model {

struct RiderRecord {
  std::string id;
  std::string first_name;
  std::string last_name;
  std::string phone;
  std::string email;
  std::string gender;

  dispatch::v1::RiderStatus status = dispatch::v1::RIDER_STATUS_OFFLINE;

  // account enabled by operators
  bool active = false;
  // on a delivery between start and end
  bool busy = false;
};

} // namespace dispatch::db::model
