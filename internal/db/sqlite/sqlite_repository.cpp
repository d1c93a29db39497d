#include "sqlite_repository.hpp"

#include <stdexcept>

#include "internal/db/api/proximity.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/db/sql/sql_queries.hpp"

namespace dispatch::db::sqlite {

using dispatch::db::ErrorCode;
using dispatch::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Text(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Statement& Int(int idx, int64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
    return *this;
  }
  Statement& Real(int idx, double v) {
    sqlite3_bind_double(st_, idx, v);
    return *this;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  int64_t ColInt(int col) const {
    return sqlite3_column_int64(st_, col);
  }
  double ColReal(int col) const {
    return sqlite3_column_double(st_, col);
  }

  // Throws on anything other than a row or the end of the result set.
  bool Next() {
    const int rc = Step();
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindDelivery(Statement& st, const model::DeliveryRecord& r, int first) {
  st.Text(first + 0, r.customer_id)
      .Text(first + 1, r.rider_id)
      .Int(first + 2, static_cast<int>(r.status))
      .Real(first + 3, r.delivery_fee)
      .Text(first + 4, r.delivery_ref_number)
      .Text(first + 5, r.sender_name)
      .Text(first + 6, r.sender_address)
      .Text(first + 7, r.recipient_address)
      .Real(first + 8, r.sender_location.latitude)
      .Real(first + 9, r.sender_location.longitude)
      .Real(first + 10, r.recipient_location.latitude)
      .Real(first + 11, r.recipient_location.longitude)
      .Text(first + 12, r.estimated_delivery_time)
      .Int(first + 13, static_cast<int>(r.vehicle_type))
      .Int(first + 14, static_cast<int64_t>(r.created_at_ms));
}

model::DeliveryRecord ReadDelivery(const Statement& st) {
  model::DeliveryRecord r;
  r.id                      = st.ColText(0);
  r.customer_id             = st.ColText(1);
  r.rider_id                = st.ColText(2);
  r.status                  = static_cast<dispatch::v1::DeliveryStatus>(st.ColInt(3));
  r.delivery_fee            = st.ColReal(4);
  r.delivery_ref_number     = st.ColText(5);
  r.sender_name             = st.ColText(6);
  r.sender_address          = st.ColText(7);
  r.recipient_address       = st.ColText(8);
  r.sender_location         = {st.ColReal(9), st.ColReal(10)};
  r.recipient_location      = {st.ColReal(11), st.ColReal(12)};
  r.estimated_delivery_time = st.ColText(13);
  r.vehicle_type            = static_cast<dispatch::v1::VehicleType>(st.ColInt(14));
  r.created_at_ms           = static_cast<uint64_t>(st.ColInt(15));
  return r;
}

model::RiderLocationRecord ReadLocation(const Statement& st) {
  model::RiderLocationRecord r;
  r.rider_id      = st.ColText(0);
  r.location      = {st.ColReal(1), st.ColReal(2)};
  r.updated_at_ms = static_cast<uint64_t>(st.ColInt(3));
  return r;
}

model::NotificationRecord ReadNotification(const Statement& st) {
  model::NotificationRecord r;
  r.id                        = st.ColText(0);
  r.delivery_ref_number       = st.ColText(1);
  r.delivery_id               = st.ColText(2);
  r.rider_id                  = st.ColText(3);
  r.customer_id               = st.ColText(4);
  r.rider_availability_status = st.ColInt(5) != 0;
  r.created_at_ms             = static_cast<uint64_t>(st.ColInt(6));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::EnsureSchema() {
  for (const char* statement : sql::kSqliteSchema) {
    db_->Exec(statement);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Deliveries
// ------------------------------------------------------------------

Result SqliteRepository::InsertDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_DELIVERY);
  st.Text(1, r.id);
  BindDelivery(st, r, 2);

  const int rc = st.Step();
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "delivery " + r.id);
  return Translate(db, rc);
}

std::optional<model::DeliveryRecord> SqliteRepository::GetDelivery(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_DELIVERY);
  st.Text(1, id);
  if (!st.Next()) return std::nullopt;
  return ReadDelivery(st);
}

std::vector<model::DeliveryRecord> SqliteRepository::ListDeliveriesByCustomer(Transaction& t, const std::string& customer_id) {
  Statement st(TX(t).Handle(), sql::SELECT_DELIVERIES_BY_CUSTOMER);
  st.Text(1, customer_id);

  std::vector<model::DeliveryRecord> out;
  while (st.Next()) out.push_back(ReadDelivery(st));
  return out;
}

Result SqliteRepository::UpdateDelivery(Transaction& t, const model::DeliveryRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_DELIVERY);
  BindDelivery(st, r, 1);
  st.Text(16, r.id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "delivery " + r.id);
  return Result::Ok();
}

Result SqliteRepository::DeleteDelivery(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_DELIVERY);
  st.Text(1, id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Riders
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRider(Transaction& t, const model::RiderRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_RIDER);
  st.Text(1, r.id)
      .Text(2, r.first_name)
      .Text(3, r.last_name)
      .Text(4, r.phone)
      .Text(5, r.email)
      .Text(6, r.gender)
      .Int(7, static_cast<int>(r.status))
      .Int(8, r.active ? 1 : 0)
      .Int(9, r.busy ? 1 : 0);
  return Translate(db, st.Step());
}

std::optional<model::RiderRecord> SqliteRepository::GetRider(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_RIDER);
  st.Text(1, id);
  if (!st.Next()) return std::nullopt;

  model::RiderRecord r;
  r.id         = st.ColText(0);
  r.first_name = st.ColText(1);
  r.last_name  = st.ColText(2);
  r.phone      = st.ColText(3);
  r.email      = st.ColText(4);
  r.gender     = st.ColText(5);
  r.status     = static_cast<dispatch::v1::RiderStatus>(st.ColInt(6));
  r.active     = st.ColInt(7) != 0;
  r.busy       = st.ColInt(8) != 0;
  return r;
}

Result SqliteRepository::SetRiderBusy(Transaction& t, const std::string& id, bool busy) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_RIDER_BUSY);
  st.Int(1, busy ? 1 : 0).Text(2, id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "rider " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Locations
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRiderLocation(Transaction& t, const model::RiderLocationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_RIDER_LOCATION);
  st.Text(1, r.rider_id).Real(2, r.location.latitude).Real(3, r.location.longitude).Int(4, static_cast<int64_t>(r.updated_at_ms));
  return Translate(db, st.Step());
}

std::optional<model::RiderLocationRecord> SqliteRepository::GetRiderLocation(Transaction& t, const std::string& rider_id) {
  Statement st(TX(t).Handle(), sql::SELECT_RIDER_LOCATION);
  st.Text(1, rider_id);
  if (!st.Next()) return std::nullopt;
  return ReadLocation(st);
}

std::vector<model::RiderDistance> SqliteRepository::FindRidersNear(Transaction& t, const geo::Coordinates& origin, double max_distance_m) {
  const double band = max_distance_m / kMetersPerDegreeLatitude;

  Statement st(TX(t).Handle(), sql::SELECT_RIDER_LOCATIONS_IN_BAND);
  st.Real(1, origin.latitude - band).Real(2, origin.latitude + band);

  std::vector<model::RiderLocationRecord> candidates;
  while (st.Next()) candidates.push_back(ReadLocation(st));
  return RankByDistance(origin, max_distance_m, candidates);
}

// ------------------------------------------------------------------
// Vehicles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertVehicle(Transaction& t, const model::VehicleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_VEHICLE);
  st.Text(1, r.id).Text(2, r.rider_id).Int(3, static_cast<int>(r.vehicle_type)).Text(4, r.plate_number);
  return Translate(db, st.Step());
}

std::optional<model::VehicleRecord> SqliteRepository::GetVehicleByRider(Transaction& t, const std::string& rider_id) {
  Statement st(TX(t).Handle(), sql::SELECT_VEHICLE_BY_RIDER);
  st.Text(1, rider_id);
  if (!st.Next()) return std::nullopt;

  model::VehicleRecord r;
  r.id           = st.ColText(0);
  r.rider_id     = st.ColText(1);
  r.vehicle_type = static_cast<dispatch::v1::VehicleType>(st.ColInt(2));
  r.plate_number = st.ColText(3);
  return r;
}

// ------------------------------------------------------------------
// Wallets
// ------------------------------------------------------------------

std::optional<model::RiderWalletRecord> SqliteRepository::GetRiderWallet(Transaction& t, const std::string& rider_id) {
  Statement st(TX(t).Handle(), sql::SELECT_RIDER_WALLET);
  st.Text(1, rider_id);
  if (!st.Next()) return std::nullopt;
  return model::RiderWalletRecord{st.ColText(0), st.ColReal(1)};
}

Result SqliteRepository::InsertRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_RIDER_WALLET);
  st.Text(1, r.rider_id).Real(2, r.balance);

  const int rc = st.Step();
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "wallet " + r.rider_id);
  return Translate(db, rc);
}

Result SqliteRepository::UpdateRiderWallet(Transaction& t, const model::RiderWalletRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_RIDER_WALLET);
  st.Real(1, r.balance).Text(2, r.rider_id);

  const int rc = st.Step();
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "wallet " + r.rider_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Admin fees
// ------------------------------------------------------------------

Result SqliteRepository::InsertAdminFee(Transaction& t, const model::AdminFeeRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_ADMIN_FEE);
  st.Text(1, r.delivery_ref_number).Text(2, r.delivery_id).Text(3, r.rider_id).Real(4, r.admin_fee).Int(5, static_cast<int64_t>(r.created_at_ms));

  const int rc = st.Step();
  if (rc == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "admin fee " + r.delivery_ref_number);
  return Translate(db, rc);
}

std::optional<model::AdminFeeRecord> SqliteRepository::GetAdminFee(Transaction& t, const std::string& delivery_ref_number) {
  Statement st(TX(t).Handle(), sql::SELECT_ADMIN_FEE);
  st.Text(1, delivery_ref_number);
  if (!st.Next()) return std::nullopt;

  model::AdminFeeRecord r;
  r.delivery_ref_number = st.ColText(0);
  r.delivery_id         = st.ColText(1);
  r.rider_id            = st.ColText(2);
  r.admin_fee           = st.ColReal(3);
  r.created_at_ms       = static_cast<uint64_t>(st.ColInt(4));
  return r;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result SqliteRepository::InsertNotification(Transaction& t, const model::NotificationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_NOTIFICATION);
  st.Text(1, r.id)
      .Text(2, r.delivery_ref_number)
      .Text(3, r.delivery_id)
      .Text(4, r.rider_id)
      .Text(5, r.customer_id)
      .Int(6, r.rider_availability_status ? 1 : 0)
      .Int(7, static_cast<int64_t>(r.created_at_ms));
  return Translate(db, st.Step());
}

std::vector<model::NotificationRecord> SqliteRepository::ListNotificationsByDelivery(Transaction& t, const std::string& delivery_id) {
  Statement st(TX(t).Handle(), sql::SELECT_NOTIFICATIONS_BY_DELIVERY);
  st.Text(1, delivery_id);

  std::vector<model::NotificationRecord> out;
  while (st.Next()) out.push_back(ReadNotification(st));
  return out;
}

} // namespace dispatch::db::sqlite
