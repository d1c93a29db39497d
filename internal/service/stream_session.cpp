#include "stream_session.hpp"

#include "internal/core/delivery_lifecycle.hpp"
#include "internal/core/dispatch_engine.hpp"
#include "internal/core/response_relay.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

StreamSession::StreamSession(ServiceContext ctx, std::shared_ptr<registry::Connection> connection)
    : ctx_(std::move(ctx)), connection_(std::move(connection)) {
}

bool StreamSession::Handle(const ClientEvent& event) {
  try {
    Dispatch(event);
    return true;
  } catch (const std::exception&) {
    // already logged by ObserveRpc; the session stays open
    return false;
  }
}

void StreamSession::Dispatch(const ClientEvent& event) {
  switch (event.event_case()) {
    case ClientEvent::kRiderId:
      ObserveRpc("stream.rider_id", event.rider_id(), [&] { Register(event.rider_id(), "rider"); });
      return;

    case ClientEvent::kCustomerId:
      ObserveRpc("stream.customer_id", event.customer_id(), [&] { Register(event.customer_id(), "customer"); });
      return;

    case ClientEvent::kPackageRequest:
      ObserveRpc("stream.package_request", event.package_request().delivery_id(),
                 [&] { SubmitPackageRequest(event.package_request()); });
      return;

    case ClientEvent::kArrived:
      ObserveRpc("stream.arrived", event.arrived().customer_id(), [&] { ctx_.lifecycle->Arrived(event.arrived()); });
      return;

    case ClientEvent::kStartDelivery:
      ObserveRpc("stream.start_delivery", event.start_delivery().customer_id(), [&] {
        if (!ctx_.lifecycle->StartDelivery(event.start_delivery())) {
          DISPATCH_LOG_WARN("Customer not connected, start of delivery ignored",
                            {observability::CustomerField(event.start_delivery().customer_id())});
        }
      });
      return;

    case ClientEvent::kEndDelivery:
      ObserveRpc("stream.end_delivery", event.end_delivery().customer_id(), [&] {
        if (!ctx_.lifecycle->EndDelivery(event.end_delivery())) {
          DISPATCH_LOG_WARN("Customer not connected, end of delivery ignored",
                            {observability::CustomerField(event.end_delivery().customer_id())});
        }
      });
      return;

    case ClientEvent::kNotificationAck:
      DISPATCH_LOG_DEBUG("Notification acknowledged", {observability::StringField("id", event.notification_ack().id()),
                                                       observability::StringField("connection", connection_->Id())});
      return;

    case ClientEvent::kRiderResponseNotificationAck:
      DISPATCH_LOG_DEBUG("Rider response acknowledged", {observability::StringField("id", event.rider_response_notification_ack().id()),
                                                         observability::StringField("connection", connection_->Id())});
      return;

    case ClientEvent::kDriverResponse:
      ObserveRpc("stream.driver_response", event.driver_response().delivery_id(),
                 [&] { ctx_.relay->SendDriverResponse(event.driver_response()); });
      return;

    case ClientEvent::EVENT_NOT_SET:
      break;
  }

  DISPATCH_LOG_WARN("Empty client event ignored", {observability::StringField("connection", connection_->Id())});
}

void StreamSession::Register(const std::string& identity, const char* role) {
  if (identity.empty()) {
    throw util::InvalidArgument(std::string(role) + " id is required");
  }
  ctx_.connections->Register(identity, connection_);
  DISPATCH_LOG_INFO("Participant registered", {observability::StringField("identity", identity), observability::StringField("role", role),
                                               observability::StringField("connection", connection_->Id())});
}

void StreamSession::SubmitPackageRequest(const PackageRequest& request) {
  if (ctx_.dispatcher->SubmitPackageRequest(request) == core::SubmitOutcome::kDispatched) {
    return;
  }

  ServerEvent event;
  event.set_request_already_sent("Request has already been sent.");
  if (!connection_->Send(event)) {
    DISPATCH_LOG_WARN("Could not notify sender of duplicate request", {observability::DeliveryField(request.delivery_id())});
  }
}

void StreamSession::Close() {
  const auto removed = ctx_.connections->Unregister(*connection_);
  DISPATCH_LOG_INFO("Connection closed", {observability::StringField("connection", connection_->Id()),
                                          observability::IntField("identities_removed", static_cast<std::int64_t>(removed))});
}

} // namespace dispatch::service
