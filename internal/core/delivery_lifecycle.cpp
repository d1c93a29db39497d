#include "internal/core/delivery_lifecycle.hpp"

#include "internal/cache/match_cache.hpp"
#include "internal/core/delivery_state.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"

namespace dispatch::core {

using observability::CustomerField;
using observability::DeliveryField;
using observability::RiderField;
using observability::StringField;

namespace {

void RequireTransition(const db::model::DeliveryRecord& delivery, dispatch::v1::DeliveryStatus to) {
  if (!CanTransition(delivery.status, to)) {
    throw util::InvalidState("delivery " + delivery.id + " cannot move from " + dispatch::v1::DeliveryStatus_Name(delivery.status) + " to " +
                             dispatch::v1::DeliveryStatus_Name(to));
  }
}

} // namespace

DeliveryLifecycle::DeliveryLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<cache::MatchCache> matches,
                                     std::shared_ptr<registry::ConnectionRegistry> connections, std::shared_ptr<Settlement> settlement)
    : repository_(std::move(repository)),
      matches_(std::move(matches)),
      connections_(std::move(connections)),
      settlement_(std::move(settlement)) {
}

void DeliveryLifecycle::Arrived(const dispatch::v1::ArrivalSignal& signal) {
  if (signal.customer_id().empty()) {
    throw util::InvalidArgument("arrived: customer_id is required");
  }

  dispatch::v1::ServerEvent event;
  event.set_rider_arrival_notification(signal.rider_arrived());
  connections_->Send(signal.customer_id(), event);
}

DeliveryLifecycle::Context DeliveryLifecycle::ResolveContext(const dispatch::v1::DeliverySignal& signal) {
  Context context;
  context.delivery_id = signal.delivery_id();

  if (context.delivery_id.empty()) {
    auto tx         = repository_->Begin();
    auto deliveries = repository_->ListDeliveriesByCustomer(*tx, signal.customer_id());
    tx->Commit();
    if (deliveries.empty()) {
      throw util::NotFound("no delivery for customer " + signal.customer_id());
    }
    context.delivery_id = deliveries.back().id;
  }

  if (auto match = matches_->Get(context.delivery_id)) {
    context.rider_id                = match->rider().rider_id();
    context.delivery_ref_number     = match->delivery_ref_number();
    context.estimated_delivery_time = match->estimated_delivery_time();
  }
  if (context.rider_id.empty()) context.rider_id = signal.rider_id();
  return context;
}

dispatch::v1::DeliveryNotification DeliveryLifecycle::BuildNotification(const dispatch::v1::DeliverySignal& signal, const Context& context) const {
  dispatch::v1::DeliveryNotification notification;
  *notification.mutable_signal() = signal;
  notification.set_delivery_ref_number(context.delivery_ref_number);
  notification.set_estimated_delivery_time(context.estimated_delivery_time);
  notification.set_delivery_id(context.delivery_id);
  notification.set_rider_id(context.rider_id);
  return notification;
}

// ------------------------------------------------------------------
// Start
// ------------------------------------------------------------------

bool DeliveryLifecycle::StartDelivery(const dispatch::v1::DeliverySignal& signal) {
  if (!connections_->Lookup(signal.customer_id())) {
    DISPATCH_LOG_DEBUG("Start of delivery ignored, customer not connected", {CustomerField(signal.customer_id())});
    return false;
  }

  auto context = ResolveContext(signal);

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto delivery = repository_->GetDelivery(tx, context.delivery_id);
    if (!delivery) {
      throw util::NotFound("start delivery: no delivery " + context.delivery_id);
    }
    RequireTransition(*delivery, dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);

    if (delivery->rider_id.empty()) delivery->rider_id = context.rider_id;
    if (delivery->rider_id.empty()) {
      throw util::InvalidState("start delivery: delivery " + delivery->id + " has no rider");
    }
    delivery->status = dispatch::v1::DELIVERY_STATUS_ON_TRANSIT;
    db::ThrowIfDbError(repository_->UpdateDelivery(tx, *delivery), "start delivery");
    db::ThrowIfDbError(repository_->SetRiderBusy(tx, delivery->rider_id, true), "mark rider busy");

    context.rider_id = delivery->rider_id;
    if (context.delivery_ref_number.empty()) context.delivery_ref_number = delivery->delivery_ref_number;
    if (context.estimated_delivery_time.empty()) context.estimated_delivery_time = delivery->estimated_delivery_time;
  });

  dispatch::v1::ServerEvent event;
  *event.mutable_start_delivery_notification() = BuildNotification(signal, context);
  connections_->Send(signal.customer_id(), event);

  DISPATCH_LOG_INFO("Delivery started", {DeliveryField(context.delivery_id), RiderField(context.rider_id)});
  return true;
}

// ------------------------------------------------------------------
// End
// ------------------------------------------------------------------

bool DeliveryLifecycle::EndDelivery(const dispatch::v1::DeliverySignal& signal) {
  if (!connections_->Lookup(signal.customer_id())) {
    DISPATCH_LOG_DEBUG("End of delivery ignored, customer not connected", {CustomerField(signal.customer_id())});
    return false;
  }

  auto                    context = ResolveContext(signal);
  std::optional<FeeSplit> split;

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto delivery = repository_->GetDelivery(tx, context.delivery_id);
    if (!delivery) {
      throw util::NotFound("end delivery: no delivery " + context.delivery_id);
    }
    RequireTransition(*delivery, dispatch::v1::DELIVERY_STATUS_DELIVERED);

    delivery->status = dispatch::v1::DELIVERY_STATUS_DELIVERED;
    db::ThrowIfDbError(repository_->UpdateDelivery(tx, *delivery), "end delivery");
    db::ThrowIfDbError(repository_->SetRiderBusy(tx, delivery->rider_id, false), "release rider");
    split = settlement_->Settle(tx, *delivery);

    context.rider_id = delivery->rider_id;
    if (context.delivery_ref_number.empty()) context.delivery_ref_number = delivery->delivery_ref_number;
    if (context.estimated_delivery_time.empty()) context.estimated_delivery_time = delivery->estimated_delivery_time;
  });

  dispatch::v1::ServerEvent event;
  *event.mutable_end_delivery_notification() = BuildNotification(signal, context);
  connections_->Send(signal.customer_id(), event);

  matches_->Delete(context.delivery_id);

  if (split) {
    observability::Metrics::Instance().ObserveSettlementAmount("rider", split->rider_fee);
    observability::Metrics::Instance().ObserveSettlementAmount("admin", split->admin_fee);
    DISPATCH_LOG_INFO("Delivery settled", {DeliveryField(context.delivery_id), RiderField(context.rider_id),
                                           observability::DoubleField("rider_fee", split->rider_fee),
                                           observability::DoubleField("admin_fee", split->admin_fee)});
  } else {
    DISPATCH_LOG_WARN("Delivery already settled", {StringField("delivery_ref_number", context.delivery_ref_number)});
  }
  return true;
}

} // namespace dispatch::core
