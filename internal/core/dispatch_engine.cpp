#include "internal/core/dispatch_engine.hpp"

#include "internal/bus/bus_client.hpp"
#include "internal/bus/exchanges.hpp"
#include "internal/cache/match_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"

namespace dispatch::core {

using observability::DeliveryField;
using observability::RiderField;

DispatchEngine::DispatchEngine(std::shared_ptr<bus::BusClient> bus, std::shared_ptr<cache::MatchCache> matches,
                               std::shared_ptr<registry::ConnectionRegistry> connections, std::chrono::milliseconds request_expiration)
    : bus_(std::move(bus)),
      matches_(std::move(matches)),
      connections_(std::move(connections)),
      request_expiration_(request_expiration.count() > 0 ? request_expiration : kDefaultRequestExpiration) {
}

void DispatchEngine::Start() {
  bus_->Subscribe(bus::kPackageRequest, [this](const std::string& payload) {
    dispatch::v1::PackageRequest request;
    util::FromJson(payload, &request);
    AssignPackageToDriver(request);
  });
}

SubmitOutcome DispatchEngine::SubmitPackageRequest(const dispatch::v1::PackageRequest& request) {
  if (request.delivery_id().empty()) {
    throw util::InvalidArgument("submit package request: delivery_id is required");
  }

  if (!matches_->Claim(cache::kClaimSubmit, request.delivery_id())) {
    DISPATCH_LOG_INFO("Package request already sent", {DeliveryField(request.delivery_id())});
    return SubmitOutcome::kAlreadySent;
  }

  try {
    bus_->PublishMessage(bus::kPackageRequest, request, request_expiration_);
  } catch (const std::exception&) {
    matches_->Release(cache::kClaimSubmit, request.delivery_id());
    throw;
  }

  AssignPackageToDriver(request);
  return SubmitOutcome::kDispatched;
}

bool DispatchEngine::AssignPackageToDriver(const dispatch::v1::PackageRequest& request) {
  const auto match = matches_->Get(request.delivery_id());
  if (!match || match->rider().rider_id().empty()) {
    DISPATCH_LOG_WARN("No rider matched to package request", {DeliveryField(request.delivery_id())});
    return false;
  }
  const auto& rider_id = match->rider().rider_id();

  // only a process holding the rider's connection competes for the notification
  bool notified = false;
  auto rider    = connections_->Lookup(rider_id);
  if (rider && matches_->Claim(cache::kClaimNotify, request.delivery_id())) {
    dispatch::v1::ServerEvent event;
    auto*                     notification = event.mutable_notification();
    notification->set_title("New Delivery Request");
    notification->set_body("You have been assigned a new delivery request from " + request.sender_name() + ".");
    notification->set_sender_address(request.sender_address());
    notification->set_recipient_address(request.recipient_address());
    notification->set_customer_id(request.customer_id());
    notification->set_delivery_id(request.delivery_id());
    notification->set_match_id(match->match_id());

    notified = rider->Send(event);
    if (!notified) matches_->Release(cache::kClaimNotify, request.delivery_id());
    DISPATCH_LOG_INFO("Rider notified of package request", {DeliveryField(request.delivery_id()), RiderField(rider_id),
                                                            observability::BoolField("delivered", notified)});
  }

  if (matches_->Claim(cache::kClaimAssigned, request.delivery_id())) {
    dispatch::v1::AssignedPackage assigned;
    *assigned.mutable_request() = request;
    assigned.set_assigned_to(rider_id);
    bus_->PublishMessage(bus::kAssignedPackageRequests, assigned);
  }

  return notified;
}

} // namespace dispatch::core
