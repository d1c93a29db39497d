#pragma once

#include <string>

namespace dispatch::db::model {

struct RiderWalletRecord {
  std::string rider_id;
  double      balance = 0.0;
};

} // namespace dispatch::db::model
