#include "memory_repository.hpp"

#include <algorithm>

#include "internal/db/api/proximity.hpp"
#include "memory_tx.hpp"

namespace dispatch::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

template <typename Map>
static auto Find(const Map& map, const std::string& key) -> std::optional<typename Map::mapped_type> {
  auto it = map.find(key);
  if (it == map.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result MemoryRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
  if (TX(t).View().deliveries.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "delivery " + r.id);
  TX(t).Mutable().deliveries[r.id] = r;
  return Result::Ok();
}

std::optional<model::DeliveryRecord> MemoryRepository::GetDelivery(Transaction& t, const std::string& id) {
  return Find(TX(t).View().deliveries, id);
}

std::vector<model::DeliveryRecord> MemoryRepository::ListDeliveriesByCustomer(Transaction& t, const std::string& customer_id) {
  std::vector<model::DeliveryRecord> out;
  for (const auto& [_, record] : TX(t).View().deliveries) {
    if (record.customer_id == customer_id) out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const model::DeliveryRecord& a, const model::DeliveryRecord& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  if (!TX(t).View().deliveries.contains(r.id)) return Result::Err(ErrorCode::NotFound, "delivery " + r.id);
  TX(t).Mutable().deliveries[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteDelivery(Transaction& t, const std::string& id) {
  TX(t).Mutable().deliveries.erase(id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Riders
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRider(Transaction& t, const model::RiderRecord& r) {
  TX(t).Mutable().riders[r.id] = r;
  return Result::Ok();
}

std::optional<model::RiderRecord> MemoryRepository::GetRider(Transaction& t, const std::string& id) {
  return Find(TX(t).View().riders, id);
}

Result MemoryRepository::SetRiderBusy(Transaction& t, const std::string& id, bool busy) {
  if (!TX(t).View().riders.contains(id)) return Result::Err(ErrorCode::NotFound, "rider " + id);
  TX(t).Mutable().riders[id].busy = busy;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Locations
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRiderLocation(Transaction& t, const model::RiderLocationRecord& r) {
  TX(t).Mutable().locations[r.rider_id] = r;
  return Result::Ok();
}

std::optional<model::RiderLocationRecord> MemoryRepository::GetRiderLocation(Transaction& t, const std::string& rider_id) {
  return Find(TX(t).View().locations, rider_id);
}

std::vector<model::RiderDistance> MemoryRepository::FindRidersNear(Transaction& t, const geo::Coordinates& origin, double max_distance_m) {
  std::vector<model::RiderLocationRecord> locations;
  for (const auto& [_, location] : TX(t).View().locations) {
    locations.push_back(location);
  }
  return RankByDistance(origin, max_distance_m, locations);
}

// ------------------------------------------------------------------
// Vehicles
// ------------------------------------------------------------------

Result MemoryRepository::UpsertVehicle(Transaction& t, const model::VehicleRecord& r) {
  TX(t).Mutable().vehicles[r.rider_id] = r;
  return Result::Ok();
}

std::optional<model::VehicleRecord> MemoryRepository::GetVehicleByRider(Transaction& t, const std::string& rider_id) {
  return Find(TX(t).View().vehicles, rider_id);
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

std::optional<model::RiderWalletRecord> MemoryRepository::GetRiderWallet(Transaction& t, const std::string& rider_id) {
  return Find(TX(t).View().wallets, rider_id);
}

Result MemoryRepository::InsertRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  if (TX(t).View().wallets.contains(r.rider_id)) return Result::Err(ErrorCode::AlreadyExists, "wallet " + r.rider_id);
  TX(t).Mutable().wallets[r.rider_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  if (!TX(t).View().wallets.contains(r.rider_id)) return Result::Err(ErrorCode::NotFound, "wallet " + r.rider_id);
  TX(t).Mutable().wallets[r.rider_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Admin fees
// ------------------------------------------------------------------

Result MemoryRepository::InsertAdminFee(Transaction& t, const model::AdminFeeRecord& r) {
  if (TX(t).View().admin_fees.contains(r.delivery_ref_number)) {
    return Result::Err(ErrorCode::AlreadyExists, "admin fee " + r.delivery_ref_number);
  }
  TX(t).Mutable().admin_fees[r.delivery_ref_number] = r;
  return Result::Ok();
}

std::optional<model::AdminFeeRecord> MemoryRepository::GetAdminFee(Transaction& t, const std::string& delivery_ref_number) {
  return Find(TX(t).View().admin_fees, delivery_ref_number);
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result MemoryRepository::InsertNotification(Transaction& t, const model::NotificationRecord& r) {
  TX(t).Mutable().notifications.push_back(r);
  return Result::Ok();
}

std::vector<model::NotificationRecord> MemoryRepository::ListNotificationsByDelivery(Transaction& t, const std::string& delivery_id) {
  std::vector<model::NotificationRecord> out;
  for (const auto& n : TX(t).View().notifications)
    if (n.delivery_id == delivery_id) out.push_back(n);
  return out;
}

} // namespace dispatch::db::memory
