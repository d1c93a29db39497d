#pragma once

namespace dispatch::db::sql {

/*
  Canonical SQL for the SQLite backend.

  Column order here is the order the row readers expect; the postgres
  prepared statements keep the same order with $n placeholders.
*/

// deliveries

static constexpr const char* kDeliveryColumns =
    "id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
    "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms";

static constexpr const char* INSERT_DELIVERY =
    "INSERT INTO delivery(id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
    "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_DELIVERY =
    "SELECT id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
    "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms"
    " FROM delivery WHERE id=?;";

static constexpr const char* SELECT_DELIVERIES_BY_CUSTOMER =
    "SELECT id,customer_id,rider_id,status,delivery_fee,delivery_ref_number,sender_name,sender_address,recipient_address,"
    "sender_lat,sender_lon,recipient_lat,recipient_lon,estimated_delivery_time,vehicle_type,created_at_ms"
    " FROM delivery WHERE customer_id=? ORDER BY created_at_ms, id;";

static constexpr const char* UPDATE_DELIVERY =
    "UPDATE delivery SET customer_id=?,rider_id=?,status=?,delivery_fee=?,delivery_ref_number=?,sender_name=?,sender_address=?,"
    "recipient_address=?,sender_lat=?,sender_lon=?,recipient_lat=?,recipient_lon=?,estimated_delivery_time=?,vehicle_type=?,created_at_ms=?"
    " WHERE id=?;";

static constexpr const char* DELETE_DELIVERY = "DELETE FROM delivery WHERE id=?;";

// riders

static constexpr const char* UPSERT_RIDER =
    "INSERT INTO rider(id,first_name,last_name,phone,email,gender,status,active,busy) VALUES(?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET first_name=excluded.first_name,last_name=excluded.last_name,phone=excluded.phone,"
    "email=excluded.email,gender=excluded.gender,status=excluded.status,active=excluded.active,busy=excluded.busy;";

static constexpr const char* SELECT_RIDER =
    "SELECT id,first_name,last_name,phone,email,gender,status,active,busy FROM rider WHERE id=?;";

static constexpr const char* UPDATE_RIDER_BUSY = "UPDATE rider SET busy=? WHERE id=?;";

// locations

static constexpr const char* UPSERT_RIDER_LOCATION =
    "INSERT INTO rider_location(rider_id,latitude,longitude,updated_at_ms) VALUES(?,?,?,?)"
    " ON CONFLICT(rider_id) DO UPDATE SET latitude=excluded.latitude,longitude=excluded.longitude,updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RIDER_LOCATION =
    "SELECT rider_id,latitude,longitude,updated_at_ms FROM rider_location WHERE rider_id=?;";

// latitude band prefilter; exact distance is computed by the caller
static constexpr const char* SELECT_RIDER_LOCATIONS_IN_BAND =
    "SELECT rider_id,latitude,longitude,updated_at_ms FROM rider_location WHERE latitude BETWEEN ? AND ?;";

// vehicles

static constexpr const char* UPSERT_VEHICLE =
    "INSERT INTO vehicle(id,rider_id,vehicle_type,plate_number) VALUES(?,?,?,?)"
    " ON CONFLICT(rider_id) DO UPDATE SET id=excluded.id,vehicle_type=excluded.vehicle_type,plate_number=excluded.plate_number;";

static constexpr const char* SELECT_VEHICLE_BY_RIDER =
    "SELECT id,rider_id,vehicle_type,plate_number FROM vehicle WHERE rider_id=?;";

// wallets

static constexpr const char* SELECT_RIDER_WALLET = "SELECT rider_id,balance FROM rider_wallet WHERE rider_id=?;";

static constexpr const char* INSERT_RIDER_WALLET = "INSERT INTO rider_wallet(rider_id,balance) VALUES(?,?);";

static constexpr const char* UPDATE_RIDER_WALLET = "UPDATE rider_wallet SET balance=? WHERE rider_id=?;";

// admin fees

static constexpr const char* INSERT_ADMIN_FEE =
    "INSERT INTO admin_fee(delivery_ref_number,delivery_id,rider_id,admin_fee,created_at_ms) VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_ADMIN_FEE =
    "SELECT delivery_ref_number,delivery_id,rider_id,admin_fee,created_at_ms FROM admin_fee WHERE delivery_ref_number=?;";

// notifications

static constexpr const char* INSERT_NOTIFICATION =
    "INSERT INTO notification(id,delivery_ref_number,delivery_id,rider_id,customer_id,rider_availability_status,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_NOTIFICATIONS_BY_DELIVERY =
    "SELECT id,delivery_ref_number,delivery_id,rider_id,customer_id,rider_availability_status,created_at_ms"
    " FROM notification WHERE delivery_id=? ORDER BY created_at_ms, id;";

} // namespace dispatch::db::sql
