#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace dispatch::bus {
class BusClient;
class ZmqProxy;
} // namespace dispatch::bus

namespace dispatch::factory {

/*
  Application

  Everything the server process owns for its lifetime. The bus client
  holds the consumer threads and must be disconnected before the services
  it calls into are destroyed.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
  std::shared_ptr<bus::BusClient>               bus;
  // Set when this node runs the bus forwarder; stopped after the bus.
  std::shared_ptr<bus::ZmqProxy> forwarder;
};

/*
  Build

  Composition root. The only place that knows concrete repository,
  broker and cache types.
*/
Application Build(const dispatch::runtime::config::RuntimeConfig& config);

} // namespace dispatch::factory
