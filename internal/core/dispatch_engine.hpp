#pragma once

#include <chrono>
#include <memory>

#include "dispatch/v1/events.pb.h"

namespace dispatch::bus {
class BusClient;
}
namespace dispatch::cache {
class MatchCache;
}
namespace dispatch::registry {
class ConnectionRegistry;
}

namespace dispatch::core {

inline constexpr std::chrono::milliseconds kDefaultRequestExpiration{10000};

enum class SubmitOutcome {
  kDispatched,
  kAlreadySent,
};

/*
  Broadcasts package requests and hands them to the matched rider.

  Every process subscribed to package_request attempts the assignment for
  every request it sees, this one included. The rider notification and the
  assigned_package_requests publish are each guarded by a per-delivery
  claim, so only the first attempt has any effect. The notification claim
  is taken only by a process that holds the rider's connection.
*/
class DispatchEngine {
 public:
  DispatchEngine(std::shared_ptr<bus::BusClient> bus, std::shared_ptr<cache::MatchCache> matches,
                 std::shared_ptr<registry::ConnectionRegistry> connections, std::chrono::milliseconds request_expiration);

  // Subscribes to package_request.
  void Start();

  // Throws util::InvalidArgument when the request has no delivery id.
  SubmitOutcome SubmitPackageRequest(const dispatch::v1::PackageRequest& request);

  // Returns false when no rider is matched to the delivery (logged, not thrown).
  bool AssignPackageToDriver(const dispatch::v1::PackageRequest& request);

 private:
  std::shared_ptr<bus::BusClient>               bus_;
  std::shared_ptr<cache::MatchCache>            matches_;
  std::shared_ptr<registry::ConnectionRegistry> connections_;
  std::chrono::milliseconds                     request_expiration_;
};

} // namespace dispatch::core
