#pragma once

#include <memory>
#include <string>

#include "internal/bus/bus_client.hpp"
#include "internal/bus/memory_broker.hpp"
#include "internal/cache/match_cache.hpp"
#include "internal/cache/memory_kv_cache.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/registry/connection_registry.hpp"

namespace dispatch::testing {

/*
  Collaborators shared by the core tests: in-memory repository, cache,
  registry and a connected bus.
*/
struct Collaborators {
  std::shared_ptr<db::memory::MemoryRepository>   repository  = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<cache::MemoryKeyValueCache>     kv          = std::make_shared<cache::MemoryKeyValueCache>();
  std::shared_ptr<cache::MatchCache>              matches     = std::make_shared<cache::MatchCache>(kv, std::chrono::seconds(3600), std::chrono::seconds(3600));
  std::shared_ptr<registry::ConnectionRegistry>   connections = std::make_shared<registry::ConnectionRegistry>();
  std::shared_ptr<bus::MemoryBroker>              broker      = std::make_shared<bus::MemoryBroker>();
  std::shared_ptr<bus::BusClient>                 bus         = std::make_shared<bus::BusClient>(broker);

  Collaborators() {
    bus->Connect();
  }

  ~Collaborators() {
    bus->Disconnect();
  }
};

inline db::model::RiderRecord MakeRider(const std::string& id, dispatch::v1::RiderStatus status = dispatch::v1::RIDER_STATUS_ONLINE,
                                        bool active = true) {
  db::model::RiderRecord rider;
  rider.id         = id;
  rider.first_name = "Rider";
  rider.last_name  = id;
  rider.phone      = "+2348000000000";
  rider.email      = id + "@riders.test";
  rider.gender     = "female";
  rider.status     = status;
  rider.active     = active;
  return rider;
}

inline db::model::DeliveryRecord MakeDelivery(const std::string& id, const std::string& customer_id, uint64_t created_at_ms = 1000) {
  db::model::DeliveryRecord delivery;
  delivery.id                      = id;
  delivery.customer_id             = customer_id;
  delivery.status                  = dispatch::v1::DELIVERY_STATUS_PENDING;
  delivery.delivery_fee            = 1000.0;
  delivery.delivery_ref_number     = "DLV-" + id;
  delivery.sender_name             = "Ada";
  delivery.sender_address          = "1 Marina Road";
  delivery.recipient_address       = "9 Allen Avenue";
  delivery.sender_location         = {6.4500, 3.4000};
  delivery.recipient_location      = {6.6000, 3.3500};
  delivery.estimated_delivery_time = "0hrs:35min";
  delivery.vehicle_type            = dispatch::v1::VEHICLE_TYPE_BIKE;
  delivery.created_at_ms           = created_at_ms;
  return delivery;
}

inline void SeedRider(db::Repository& repo, const db::model::RiderRecord& rider, const geo::Coordinates& location,
                      dispatch::v1::VehicleType vehicle_type = dispatch::v1::VEHICLE_TYPE_BIKE) {
  db::RunInTransaction(repo, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repo.UpsertRider(tx, rider), "seed rider");
    db::ThrowIfDbError(repo.UpsertRiderLocation(tx, {rider.id, location, 1}), "seed location");
    if (vehicle_type != dispatch::v1::VEHICLE_TYPE_UNSPECIFIED) {
      db::ThrowIfDbError(repo.UpsertVehicle(tx, {"vehicle-" + rider.id, rider.id, vehicle_type, "LAG-" + rider.id}), "seed vehicle");
    }
  });
}

inline void SeedDelivery(db::Repository& repo, const db::model::DeliveryRecord& delivery) {
  db::RunInTransaction(repo, [&](db::Transaction& tx) { db::ThrowIfDbError(repo.InsertDelivery(tx, delivery), "seed delivery"); });
}

inline db::model::DeliveryRecord LoadDelivery(db::Repository& repo, const std::string& id) {
  db::model::DeliveryRecord out;
  db::RunInTransaction(repo, [&](db::Transaction& tx) {
    auto found = repo.GetDelivery(tx, id);
    if (!found) throw std::runtime_error("missing delivery " + id);
    out = *found;
  });
  return out;
}

inline dispatch::v1::MatchRecord MakeMatch(const std::string& delivery_id, const std::string& rider_id, const std::string& customer_id,
                                           const std::string& match_id = "") {
  dispatch::v1::MatchRecord match;
  match.set_delivery_id(delivery_id);
  match.set_match_id(match_id);
  match.mutable_rider()->set_rider_id(rider_id);
  match.mutable_rider()->set_first_name("Rider");
  match.set_customer_id(customer_id);
  match.set_sender_name("Ada");
  match.set_sender_address("1 Marina Road");
  match.set_recipient_address("9 Allen Avenue");
  match.set_estimated_delivery_time("0hrs:35min");
  match.set_delivery_ref_number("DLV-" + delivery_id);
  match.set_arrival_minutes(7);
  match.set_delivery_fee(1000.0);
  return match;
}

} // namespace dispatch::testing
