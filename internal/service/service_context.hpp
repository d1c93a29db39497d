#pragma once

#include <memory>

#include "internal/core/pricing.hpp"

namespace dispatch::bus {
class BusClient;
}
namespace dispatch::cache {
class MatchCache;
}
namespace dispatch::core {
class DeliveryLifecycle;
class DispatchEngine;
class ResponseRelay;
class RiderDiscovery;
} // namespace dispatch::core
namespace dispatch::db {
class Repository;
}
namespace dispatch::registry {
class ConnectionRegistry;
}

namespace dispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dispatch::db::Repository>               repository;
  std::shared_ptr<dispatch::registry::ConnectionRegistry> connections;
  std::shared_ptr<dispatch::cache::MatchCache>            matches;
  std::shared_ptr<dispatch::bus::BusClient>               bus;

  std::shared_ptr<dispatch::core::RiderDiscovery>    discovery;
  std::shared_ptr<dispatch::core::DispatchEngine>    dispatcher;
  std::shared_ptr<dispatch::core::ResponseRelay>     relay;
  std::shared_ptr<dispatch::core::DeliveryLifecycle> lifecycle;

  dispatch::core::PricingTable pricing;
};

} // namespace dispatch::service
