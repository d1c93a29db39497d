#include "pg_repository.hpp"

#include "internal/db/api/proximity.hpp"
#include "internal/db/sql/schema.hpp"

namespace dispatch::db::postgres {

namespace {

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : f.as<std::string>();
}

model::DeliveryRecord ReadDelivery(const pqxx::row& row) {
  model::DeliveryRecord r;
  r.id                      = Text(row[0]);
  r.customer_id             = Text(row[1]);
  r.rider_id                = Text(row[2]);
  r.status                  = static_cast<dispatch::v1::DeliveryStatus>(row[3].as<int>());
  r.delivery_fee            = row[4].as<double>();
  r.delivery_ref_number     = Text(row[5]);
  r.sender_name             = Text(row[6]);
  r.sender_address          = Text(row[7]);
  r.recipient_address       = Text(row[8]);
  r.sender_location         = {row[9].as<double>(0.0), row[10].as<double>(0.0)};
  r.recipient_location      = {row[11].as<double>(0.0), row[12].as<double>(0.0)};
  r.estimated_delivery_time = Text(row[13]);
  r.vehicle_type            = static_cast<dispatch::v1::VehicleType>(row[14].as<int>());
  r.created_at_ms           = static_cast<uint64_t>(row[15].as<int64_t>());
  return r;
}

model::RiderLocationRecord ReadLocation(const pqxx::row& row) {
  model::RiderLocationRecord r;
  r.rider_id      = Text(row[0]);
  r.location      = {row[1].as<double>(), row[2].as<double>()};
  r.updated_at_ms = static_cast<uint64_t>(row[3].as<int64_t>());
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

void PgRepository::EnsureSchema() {
  auto tx = Begin();
  for (const char* statement : sql::kPostgresSchema) {
    TX(*tx).Work().exec(statement);
  }
  tx->Commit();
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result PgRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_delivery", r.id, r.customer_id, r.rider_id, static_cast<int>(r.status), r.delivery_fee,
                               r.delivery_ref_number, r.sender_name, r.sender_address, r.recipient_address, r.sender_location.latitude,
                               r.sender_location.longitude, r.recipient_location.latitude, r.recipient_location.longitude,
                               r.estimated_delivery_time, static_cast<int>(r.vehicle_type), static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeliveryRecord> PgRepository::GetDelivery(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_delivery", id);
  if (res.empty()) return std::nullopt;
  return ReadDelivery(res[0]);
}

std::vector<model::DeliveryRecord> PgRepository::ListDeliveriesByCustomer(Transaction& t, const std::string& customer_id) {
  auto res = TX(t).Work().exec_prepared("list_deliveries_by_customer", customer_id);

  std::vector<model::DeliveryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDelivery(row));
  return out;
}

Result PgRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_delivery", r.id, r.customer_id, r.rider_id, static_cast<int>(r.status), r.delivery_fee,
                                          r.delivery_ref_number, r.sender_name, r.sender_address, r.recipient_address,
                                          r.sender_location.latitude, r.sender_location.longitude, r.recipient_location.latitude,
                                          r.recipient_location.longitude, r.estimated_delivery_time, static_cast<int>(r.vehicle_type),
                                          static_cast<int64_t>(r.created_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "delivery " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteDelivery(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_delivery", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Riders
// ------------------------------------------------------------------

Result PgRepository::UpsertRider(Transaction& t, const model::RiderRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_rider", r.id, r.first_name, r.last_name, r.phone, r.email, r.gender, static_cast<int>(r.status),
                               r.active, r.busy);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RiderRecord> PgRepository::GetRider(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_rider", id);
  if (res.empty()) return std::nullopt;

  const auto&        row = res[0];
  model::RiderRecord r;
  r.id         = Text(row[0]);
  r.first_name = Text(row[1]);
  r.last_name  = Text(row[2]);
  r.phone      = Text(row[3]);
  r.email      = Text(row[4]);
  r.gender     = Text(row[5]);
  r.status     = static_cast<dispatch::v1::RiderStatus>(row[6].as<int>());
  r.active     = row[7].as<bool>();
  r.busy       = row[8].as<bool>();
  return r;
}

Result PgRepository::SetRiderBusy(Transaction& t, const std::string& id, bool busy) {
  try {
    auto res = TX(t).Work().exec_prepared("set_rider_busy", id, busy);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "rider " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Locations
// ------------------------------------------------------------------

Result PgRepository::UpsertRiderLocation(Transaction& t, const model::RiderLocationRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_rider_location", r.rider_id, r.location.latitude, r.location.longitude,
                               static_cast<int64_t>(r.updated_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RiderLocationRecord> PgRepository::GetRiderLocation(Transaction& t, const std::string& rider_id) {
  auto res = TX(t).Work().exec_prepared("get_rider_location", rider_id);
  if (res.empty()) return std::nullopt;
  return ReadLocation(res[0]);
}

std::vector<model::RiderDistance> PgRepository::FindRidersNear(Transaction& t, const geo::Coordinates& origin, double max_distance_m) {
  const double band = max_distance_m / kMetersPerDegreeLatitude;
  auto         res  = TX(t).Work().exec_prepared("rider_locations_in_band", origin.latitude - band, origin.latitude + band);

  std::vector<model::RiderLocationRecord> candidates;
  candidates.reserve(res.size());
  for (const auto& row : res) candidates.push_back(ReadLocation(row));
  return RankByDistance(origin, max_distance_m, candidates);
}

// ------------------------------------------------------------------
// Vehicles
// ------------------------------------------------------------------

Result PgRepository::UpsertVehicle(Transaction& t, const model::VehicleRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_vehicle", r.id, r.rider_id, static_cast<int>(r.vehicle_type), r.plate_number);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::VehicleRecord> PgRepository::GetVehicleByRider(Transaction& t, const std::string& rider_id) {
  auto res = TX(t).Work().exec_prepared("get_vehicle_by_rider", rider_id);
  if (res.empty()) return std::nullopt;

  model::VehicleRecord r;
  r.id           = Text(res[0][0]);
  r.rider_id     = Text(res[0][1]);
  r.vehicle_type = static_cast<dispatch::v1::VehicleType>(res[0][2].as<int>());
  r.plate_number = Text(res[0][3]);
  return r;
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

std::optional<model::RiderWalletRecord> PgRepository::GetRiderWallet(Transaction& t, const std::string& rider_id) {
  auto res = TX(t).Work().exec_prepared("get_rider_wallet", rider_id);
  if (res.empty()) return std::nullopt;
  return model::RiderWalletRecord{Text(res[0][0]), res[0][1].as<double>()};
}

Result PgRepository::InsertRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_rider_wallet", r.rider_id, r.balance);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_rider_wallet", r.rider_id, r.balance);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "wallet " + r.rider_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Admin fees
// ------------------------------------------------------------------

Result PgRepository::InsertAdminFee(Transaction& t, const model::AdminFeeRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_admin_fee", r.delivery_ref_number, r.delivery_id, r.rider_id, r.admin_fee,
                               static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AdminFeeRecord> PgRepository::GetAdminFee(Transaction& t, const std::string& delivery_ref_number) {
  auto res = TX(t).Work().exec_prepared("get_admin_fee", delivery_ref_number);
  if (res.empty()) return std::nullopt;

  model::AdminFeeRecord r;
  r.delivery_ref_number = Text(res[0][0]);
  r.delivery_id         = Text(res[0][1]);
  r.rider_id            = Text(res[0][2]);
  r.admin_fee           = res[0][3].as<double>();
  r.created_at_ms       = static_cast<uint64_t>(res[0][4].as<int64_t>());
  return r;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result PgRepository::InsertNotification(Transaction& t, const model::NotificationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_notification", r.id, r.delivery_ref_number, r.delivery_id, r.rider_id, r.customer_id,
                               r.rider_availability_status, static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::NotificationRecord> PgRepository::ListNotificationsByDelivery(Transaction& t, const std::string& delivery_id) {
  auto res = TX(t).Work().exec_prepared("list_notifications_by_delivery", delivery_id);

  std::vector<model::NotificationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::NotificationRecord r;
    r.id                        = Text(row[0]);
    r.delivery_ref_number       = Text(row[1]);
    r.delivery_id               = Text(row[2]);
    r.rider_id                  = Text(row[3]);
    r.customer_id               = Text(row[4]);
    r.rider_availability_status = row[5].as<bool>();
    r.created_at_ms             = static_cast<uint64_t>(row[6].as<int64_t>());
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace dispatch::db::postgres
