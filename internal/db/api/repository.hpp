#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/admin_fee_record.hpp"
#include "internal/db/model/delivery_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/rider_location_record.hpp"
#include "internal/db/model/rider_record.hpp"
#include "internal/db/model/rider_wallet_record.hpp"
#include "internal/db/model/vehicle_record.hpp"

namespace dispatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Settlement writes (delivery status, wallet, admin fee) commit together

  The DB is the source of truth for:
    deliveries and their status
    riders, locations, vehicles
    wallets and admin fees
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Deliveries
  // ---------------------------------------------------------------------

  virtual Result InsertDelivery(Transaction&, const model::DeliveryRecord&) = 0;

  virtual std::optional<model::DeliveryRecord> GetDelivery(Transaction&, const std::string& id) = 0;

  // Oldest first (created_at_ms, then id).
  virtual std::vector<model::DeliveryRecord> ListDeliveriesByCustomer(Transaction&, const std::string& customer_id) = 0;

  virtual Result UpdateDelivery(Transaction&, const model::DeliveryRecord&) = 0;

  virtual Result DeleteDelivery(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Riders
  // ---------------------------------------------------------------------

  virtual Result UpsertRider(Transaction&, const model::RiderRecord&) = 0;

  virtual std::optional<model::RiderRecord> GetRider(Transaction&, const std::string& id) = 0;

  virtual Result SetRiderBusy(Transaction&, const std::string& id, bool busy) = 0;

  // ---------------------------------------------------------------------
  // Rider locations
  // ---------------------------------------------------------------------

  virtual Result UpsertRiderLocation(Transaction&, const model::RiderLocationRecord&) = 0;

  virtual std::optional<model::RiderLocationRecord> GetRiderLocation(Transaction&, const std::string& rider_id) = 0;

  // Riders within max_distance_m of origin, nearest first.
  virtual std::vector<model::RiderDistance> FindRidersNear(Transaction&, const geo::Coordinates& origin, double max_distance_m) = 0;

  // ---------------------------------------------------------------------
  // Vehicles
  // ---------------------------------------------------------------------

  virtual Result UpsertVehicle(Transaction&, const model::VehicleRecord&) = 0;

  virtual std::optional<model::VehicleRecord> GetVehicleByRider(Transaction&, const std::string& rider_id) = 0;

  // ---------------------------------------------------------------------
  // Wallets
  // ---------------------------------------------------------------------

  virtual std::optional<model::RiderWalletRecord> GetRiderWallet(Transaction&, const std::string& rider_id) = 0;

  virtual Result InsertRiderWallet(Transaction&, const model::RiderWalletRecord&) = 0;

  virtual Result UpdateRiderWallet(Transaction&, const model::RiderWalletRecord&) = 0;

  // ---------------------------------------------------------------------
  // Admin fees (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertAdminFee(Transaction&, const model::AdminFeeRecord&) = 0;

  virtual std::optional<model::AdminFeeRecord> GetAdminFee(Transaction&, const std::string& delivery_ref_number) = 0;

  // ---------------------------------------------------------------------
  // Notifications
  // ---------------------------------------------------------------------

  virtual Result InsertNotification(Transaction&, const model::NotificationRecord&) = 0;

  virtual std::vector<model::NotificationRecord> ListNotificationsByDelivery(Transaction&, const std::string& delivery_id) = 0;
};

} // namespace dispatch::db
