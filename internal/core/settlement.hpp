#pragma once

#include <memory>
#include <optional>

#include "internal/db/api/repository.hpp"

namespace dispatch::core {

struct FeeSplit {
  double admin_fee = 0.0;
  double rider_fee = 0.0;
};

// admin_fee = percent% of the fee; the rider gets the fee minus the rounded admin fee.
FeeSplit SplitDeliveryFee(double delivery_fee, double admin_charge_percent);

/*
  Splits a completed delivery's fee between rider and platform.

  Runs inside the caller's transaction so the wallet credit and the
  admin-fee record commit together with the status change. The admin-fee
  row is keyed by delivery_ref_number; if it already exists the delivery
  was settled before and nothing is written.
*/
class Settlement {
 public:
  Settlement(std::shared_ptr<db::Repository> repository, double admin_charge_percent);

  // Returns nullopt when the delivery was already settled.
  std::optional<FeeSplit> Settle(db::Transaction& tx, const db::model::DeliveryRecord& delivery);

  double AdminChargePercent() const {
    return admin_charge_percent_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  double                          admin_charge_percent_;
};

} // namespace dispatch::core
