#pragma once

#include <memory>
#include <string>

#include "dispatch/v1/events.pb.h"
#include "internal/core/settlement.hpp"

namespace dispatch::cache {
class MatchCache;
}
namespace dispatch::registry {
class ConnectionRegistry;
}

namespace dispatch::core {

/*
  Start/end of delivery, driven by duplex events from the rider's app.

  Both transitions only run while the customer has a live connection.
  Context (rider, reference number, estimated time) comes from the match
  record, or from the delivery row once the match has expired. End of
  delivery writes the status, the rider's busy flag and the settlement in
  one transaction, then drops the match.
*/
class DeliveryLifecycle {
 public:
  DeliveryLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::MatchCache> matches,
                    std::shared_ptr<registry::ConnectionRegistry> connections, std::shared_ptr<Settlement> settlement);

  void Arrived(const dispatch::v1::ArrivalSignal& signal);

  // Return false when the customer is not connected; nothing is changed.
  bool StartDelivery(const dispatch::v1::DeliverySignal& signal);
  bool EndDelivery(const dispatch::v1::DeliverySignal& signal);

 private:
  struct Context {
    std::string delivery_id;
    std::string rider_id;
    std::string delivery_ref_number;
    std::string estimated_delivery_time;
  };

  Context ResolveContext(const dispatch::v1::DeliverySignal& signal);

  dispatch::v1::DeliveryNotification BuildNotification(const dispatch::v1::DeliverySignal& signal, const Context& context) const;

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<cache::MatchCache>            matches_;
  std::shared_ptr<registry::ConnectionRegistry> connections_;
  std::shared_ptr<Settlement>                   settlement_;
};

} // namespace dispatch::core
