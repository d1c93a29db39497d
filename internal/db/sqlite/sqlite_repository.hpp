#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dispatch::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

  // Applies the idempotent schema bootstrap.
  void EnsureSchema();

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace dispatch::db::sqlite
