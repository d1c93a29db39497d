#pragma once

#include <array>

namespace dispatch::db::sql {

/*
  Idempotent schema bootstrap, applied at startup by the factory and by
  the integration tests.
*/

static constexpr std::array<const char*, 8> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS delivery (id TEXT PRIMARY KEY, customer_id TEXT NOT NULL, rider_id TEXT NOT NULL DEFAULT '', status INTEGER NOT NULL, "
    "delivery_fee REAL NOT NULL, delivery_ref_number TEXT NOT NULL, sender_name TEXT, sender_address TEXT, recipient_address TEXT, sender_lat REAL, "
    "sender_lon REAL, recipient_lat REAL, recipient_lon REAL, estimated_delivery_time TEXT, vehicle_type INTEGER NOT NULL DEFAULT 0, "
    "created_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS delivery_customer_idx ON delivery(customer_id, created_at_ms);",
    "CREATE TABLE IF NOT EXISTS rider (id TEXT PRIMARY KEY, first_name TEXT, last_name TEXT, phone TEXT, email TEXT, gender TEXT, status INTEGER NOT NULL, "
    "active INTEGER NOT NULL, busy INTEGER NOT NULL DEFAULT 0);",
    "CREATE TABLE IF NOT EXISTS rider_location (rider_id TEXT PRIMARY KEY, latitude REAL NOT NULL, longitude REAL NOT NULL, updated_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS vehicle (id TEXT NOT NULL, rider_id TEXT PRIMARY KEY, vehicle_type INTEGER NOT NULL, plate_number TEXT);",
    "CREATE TABLE IF NOT EXISTS rider_wallet (rider_id TEXT PRIMARY KEY, balance REAL NOT NULL);",
    "CREATE TABLE IF NOT EXISTS admin_fee (delivery_ref_number TEXT PRIMARY KEY, delivery_id TEXT NOT NULL, rider_id TEXT NOT NULL, admin_fee REAL NOT NULL, "
    "created_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS notification (id TEXT PRIMARY KEY, delivery_ref_number TEXT, delivery_id TEXT NOT NULL, rider_id TEXT NOT NULL, "
    "customer_id TEXT NOT NULL, rider_availability_status INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
};

static constexpr std::array<const char*, 8> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS delivery (id TEXT PRIMARY KEY, customer_id TEXT NOT NULL, rider_id TEXT NOT NULL DEFAULT '', status SMALLINT NOT NULL, "
    "delivery_fee DOUBLE PRECISION NOT NULL, delivery_ref_number TEXT NOT NULL, sender_name TEXT, sender_address TEXT, recipient_address TEXT, "
    "sender_lat DOUBLE PRECISION, sender_lon DOUBLE PRECISION, recipient_lat DOUBLE PRECISION, recipient_lon DOUBLE PRECISION, "
    "estimated_delivery_time TEXT, vehicle_type SMALLINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS delivery_customer_idx ON delivery(customer_id, created_at_ms);",
    "CREATE TABLE IF NOT EXISTS rider (id TEXT PRIMARY KEY, first_name TEXT, last_name TEXT, phone TEXT, email TEXT, gender TEXT, status SMALLINT NOT NULL, "
    "active BOOLEAN NOT NULL, busy BOOLEAN NOT NULL DEFAULT FALSE);",
    "CREATE TABLE IF NOT EXISTS rider_location (rider_id TEXT PRIMARY KEY, latitude DOUBLE PRECISION NOT NULL, longitude DOUBLE PRECISION NOT NULL, "
    "updated_at_ms BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS vehicle (id TEXT NOT NULL, rider_id TEXT PRIMARY KEY, vehicle_type SMALLINT NOT NULL, plate_number TEXT);",
    "CREATE TABLE IF NOT EXISTS rider_wallet (rider_id TEXT PRIMARY KEY, balance DOUBLE PRECISION NOT NULL);",
    "CREATE TABLE IF NOT EXISTS admin_fee (delivery_ref_number TEXT PRIMARY KEY, delivery_id TEXT NOT NULL, rider_id TEXT NOT NULL, "
    "admin_fee DOUBLE PRECISION NOT NULL, created_at_ms BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS notification (id TEXT PRIMARY KEY, delivery_ref_number TEXT, delivery_id TEXT NOT NULL, rider_id TEXT NOT NULL, "
    "customer_id TEXT NOT NULL, rider_availability_status BOOLEAN NOT NULL, created_at_ms BIGINT NOT NULL);",
};

} // namespace dispatch::db::sql
