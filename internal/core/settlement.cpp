#include "internal/core/settlement.hpp"

#include <cmath>

#include "internal/db/api/run_in_transaction.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace dispatch::core {

FeeSplit SplitDeliveryFee(double delivery_fee, double admin_charge_percent) {
  FeeSplit split;
  split.admin_fee = admin_charge_percent / 100.0 * delivery_fee;
  split.rider_fee = delivery_fee - std::round(split.admin_fee);
  return split;
}

Settlement::Settlement(std::shared_ptr<db::Repository> repository, double admin_charge_percent)
    : repository_(std::move(repository)), admin_charge_percent_(admin_charge_percent) {
}

std::optional<FeeSplit> Settlement::Settle(db::Transaction& tx, const db::model::DeliveryRecord& delivery) {
  if (delivery.delivery_ref_number.empty()) {
    throw util::InvalidState("settle " + delivery.id + ": delivery has no reference number");
  }
  if (delivery.rider_id.empty()) {
    throw util::InvalidState("settle " + delivery.id + ": delivery has no rider");
  }
  if (repository_->GetAdminFee(tx, delivery.delivery_ref_number)) {
    return std::nullopt;
  }

  const auto split = SplitDeliveryFee(delivery.delivery_fee, admin_charge_percent_);

  if (auto wallet = repository_->GetRiderWallet(tx, delivery.rider_id)) {
    wallet->balance += split.rider_fee;
    db::ThrowIfDbError(repository_->UpdateRiderWallet(tx, *wallet), "update rider wallet");
  } else {
    db::ThrowIfDbError(repository_->InsertRiderWallet(tx, {delivery.rider_id, split.rider_fee}), "create rider wallet");
  }

  db::model::AdminFeeRecord fee;
  fee.delivery_ref_number = delivery.delivery_ref_number;
  fee.delivery_id         = delivery.id;
  fee.rider_id            = delivery.rider_id;
  fee.admin_fee           = split.admin_fee;
  fee.created_at_ms       = util::NowMillis();
  db::ThrowIfDbError(repository_->InsertAdminFee(tx, fee), "record admin fee");

  return split;
}

} // namespace dispatch::core
