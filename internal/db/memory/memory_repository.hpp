#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace dispatch::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Every transaction works on a private copy of the committed state and
  swaps it in on Commit(). A commit whose snapshot is older than the
  committed state fails with util::Conflict.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertDelivery(Transaction&, const model::DeliveryRecord&) override;
  std::optional<model::DeliveryRecord> GetDelivery(Transaction&, const std::string&) override;
  std::vector<model::DeliveryRecord>   ListDeliveriesByCustomer(Transaction&, const std::string&) override;
  Result                               UpdateDelivery(Transaction&, const model::DeliveryRecord&) override;
  Result                               DeleteDelivery(Transaction&, const std::string&) override;

  Result                            UpsertRider(Transaction&, const model::RiderRecord&) override;
  std::optional<model::RiderRecord> GetRider(Transaction&, const std::string&) override;
  Result                            SetRiderBusy(Transaction&, const std::string&, bool) override;

  Result                                    UpsertRiderLocation(Transaction&, const model::RiderLocationRecord&) override;
  std::optional<model::RiderLocationRecord> GetRiderLocation(Transaction&, const std::string&) override;
  std::vector<model::RiderDistance>         FindRidersNear(Transaction&, const geo::Coordinates&, double) override;

  Result                              UpsertVehicle(Transaction&, const model::VehicleRecord&) override;
  std::optional<model::VehicleRecord> GetVehicleByRider(Transaction&, const std::string&) override;

  std::optional<model::RiderWalletRecord> GetRiderWallet(Transaction&, const std::string&) override;
  Result                                  InsertRiderWallet(Transaction&, const model::RiderWalletRecord&) override;
  Result                                  UpdateRiderWallet(Transaction&, const model::RiderWalletRecord&) override;

  Result                               InsertAdminFee(Transaction&, const model::AdminFeeRecord&) override;
  std::optional<model::AdminFeeRecord> GetAdminFee(Transaction&, const std::string&) override;

  Result                                 InsertNotification(Transaction&, const model::NotificationRecord&) override;
  std::vector<model::NotificationRecord> ListNotificationsByDelivery(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::DeliveryRecord>      deliveries;
    std::unordered_map<std::string, model::RiderRecord>         riders;
    std::map<std::string, model::RiderLocationRecord>           locations;
    std::unordered_map<std::string, model::VehicleRecord>       vehicles; // keyed by rider id
    std::unordered_map<std::string, model::RiderWalletRecord>   wallets;
    std::unordered_map<std::string, model::AdminFeeRecord>      admin_fees; // keyed by ref number
    std::vector<model::NotificationRecord>                      notifications;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace dispatch::db::memory
