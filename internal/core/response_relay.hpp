#pragma once

#include <memory>

#include "dispatch/v1/events.pb.h"

namespace dispatch::bus {
class BusClient;
}
namespace dispatch::cache {
class MatchCache;
}
namespace dispatch::db {
class Repository;
}
namespace dispatch::registry {
class ConnectionRegistry;
}

namespace dispatch::core {

/*
  Relays rider accept/decline decisions from driver_responses to the
  customer.

  Accept: customer gets rider_response, a notification record is stored
  and the delivery moves pending -> assigned with the matched rider.
  Decline: customer gets rider_declined, the match and its dispatch claims
  are dropped so the request can be submitted again.

  Every process sees its own copy of a response. Recording is claimed once
  per answered match attempt (delivery, rider, match id) by whichever
  process sees it first, and the claim is held for its ttl. A decline only
  drops the match it answers; a newer search for the same delivery is left
  alone. Only the process holding the customer's connection relays, and an
  accept is relayed only while the delivery is pending or assigned to that
  rider.
*/
class ResponseRelay {
 public:
  ResponseRelay(std::shared_ptr<db::Repository> repository, std::shared_ptr<bus::BusClient> bus, std::shared_ptr<cache::MatchCache> matches,
                std::shared_ptr<registry::ConnectionRegistry> connections);

  // Subscribes to driver_responses.
  void Start();

  // Publishes the rider's decision; validated before it reaches the bus.
  void SendDriverResponse(const dispatch::v1::DriverResponse& response);

  void HandleDriverResponse(const dispatch::v1::DriverResponse& response);

 private:
  void Accept(const dispatch::v1::DriverResponse& response);
  void Decline(const dispatch::v1::DriverResponse& response);
  void NotifyCustomer(const dispatch::v1::DriverResponse& response);
  bool AcceptStillValid(const dispatch::v1::DriverResponse& response);
  void RecordNotification(const dispatch::v1::DriverResponse& response, const std::string& delivery_ref_number);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<bus::BusClient>               bus_;
  std::shared_ptr<cache::MatchCache>            matches_;
  std::shared_ptr<registry::ConnectionRegistry> connections_;
};

} // namespace dispatch::core
