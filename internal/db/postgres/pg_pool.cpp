#include "pg_pool.hpp"

namespace dispatch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // deliveries
  conn.prepare("insert_delivery",
               "INSERT INTO delivery(id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,"
               "recipient_address,sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16)");

  conn.prepare("get_delivery",
               "SELECT id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
               "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms "
               "FROM delivery WHERE id=$1");

  conn.prepare("list_deliveries_by_customer",
               "SELECT id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
               "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms "
               "FROM delivery WHERE customer_id=$1 ORDER BY created_at_ms, id");

  conn.prepare("update_delivery",
               "UPDATE delivery SET customer_id=$2,rider_id=$3,status=$4,delivery_fee=$5,delivery_ref_number=$6,sender_name=$7,"
               "sender_address=$8,recipient_address=$9,sender_lat=$10,sender_lon=$11,recipient_lat=$12,recipient_lon=$13,"
               "estimated_delivery_time=$14,vehicle_type=$15,created_at_ms=$16 WHERE id=$1");

  conn.prepare("delete_delivery", "DELETE FROM delivery WHERE id=$1");

  // riders
  conn.prepare("upsert_rider",
               "INSERT INTO rider(id,first_name,last_name,phone,email,gender,status,active,busy) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) "
               "ON CONFLICT(id) DO UPDATE SET first_name=EXCLUDED.first_name,last_name=EXCLUDED.last_name,phone=EXCLUDED.phone,"
               "email=EXCLUDED.email,gender=EXCLUDED.gender,status=EXCLUDED.status,active=EXCLUDED.active,busy=EXCLUDED.busy");

  conn.prepare("get_rider", "SELECT id,first_name,last_name,phone,email,gender,status,active,busy FROM rider WHERE id=$1");

  conn.prepare("set_rider_busy", "UPDATE rider SET busy=$2 WHERE id=$1");

  // locations
  conn.prepare("upsert_rider_location",
               "INSERT INTO rider_location(rider_id,latitude,longitude,updated_at_ms) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(rider_id) DO UPDATE SET latitude=EXCLUDED.latitude,longitude=EXCLUDED.longitude,"
               "updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("get_rider_location", "SELECT rider_id,latitude,longitude,updated_at_ms FROM rider_location WHERE rider_id=$1");

  conn.prepare("rider_locations_in_band",
               "SELECT rider_id,latitude,longitude,updated_at_ms FROM rider_location WHERE latitude BETWEEN $1 AND $2");

  // vehicles
  conn.prepare("upsert_vehicle",
               "INSERT INTO vehicle(id,rider_id,vehicle_type,plate_number) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(rider_id) DO UPDATE SET id=EXCLUDED.id,vehicle_type=EXCLUDED.vehicle_type,plate_number=EXCLUDED.plate_number");

  conn.prepare("get_vehicle_by_rider", "SELECT id,rider_id,vehicle_type,plate_number FROM vehicle WHERE rider_id=$1");

  // wallets
  conn.prepare("get_rider_wallet", "SELECT rider_id,balance FROM rider_wallet WHERE rider_id=$1");
  conn.prepare("insert_rider_wallet", "INSERT INTO rider_wallet(rider_id,balance) VALUES($1,$2)");
  conn.prepare("update_rider_wallet", "UPDATE rider_wallet SET balance=$2 WHERE rider_id=$1");

  // admin fees
  conn.prepare("insert_admin_fee",
               "INSERT INTO admin_fee(delivery_ref_number,delivery_id,rider_id,admin_fee,created_at_ms) VALUES($1,$2,$3,$4,$5)");
  conn.prepare("get_admin_fee",
               "SELECT delivery_ref_number,delivery_id,rider_id,admin_fee,created_at_ms FROM admin_fee WHERE delivery_ref_number=$1");

  // notifications
  conn.prepare("insert_notification",
               "INSERT INTO notification(id,delivery_ref_number,delivery_id,rider_id,customer_id,rider_availability_status,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("list_notifications_by_delivery",
               "SELECT id,delivery_ref_number,delivery_id,rider_id,customer_id,rider_availability_status,created_at_ms "
               "FROM notification WHERE delivery_id=$1 ORDER BY created_at_ms, id");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace dispatch::db::postgres
