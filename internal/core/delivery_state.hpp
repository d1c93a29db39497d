#pragma once

#include "dispatch/v1/types.pb.h"

namespace dispatch::core {

using dispatch::v1::DeliveryStatus;

constexpr bool IsTerminal(DeliveryStatus status) {
  return status == dispatch::v1::DELIVERY_STATUS_DELIVERED || status == dispatch::v1::DELIVERY_STATUS_CANCELED;
}

/*
  pending -> assigned -> on_transit -> delivered, one step at a time.
  Any non-terminal state may be canceled. Nothing leaves a terminal state
  and no state transitions to itself.
*/
constexpr bool CanTransition(DeliveryStatus from, DeliveryStatus to) {
  if (from == to || IsTerminal(from)) {
    return false;
  }
  if (to == dispatch::v1::DELIVERY_STATUS_CANCELED) {
    return from != dispatch::v1::DELIVERY_STATUS_UNSPECIFIED;
  }

  switch (from) {
    case dispatch::v1::DELIVERY_STATUS_PENDING:
      return to == dispatch::v1::DELIVERY_STATUS_ASSIGNED;
    case dispatch::v1::DELIVERY_STATUS_ASSIGNED:
      return to == dispatch::v1::DELIVERY_STATUS_ON_TRANSIT;
    case dispatch::v1::DELIVERY_STATUS_ON_TRANSIT:
      return to == dispatch::v1::DELIVERY_STATUS_DELIVERED;
    default:
      return false;
  }
}

} // namespace dispatch::core
