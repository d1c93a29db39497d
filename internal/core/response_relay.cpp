#include "internal/core/response_relay.hpp"

#include "internal/bus/bus_client.hpp"
#include "internal/bus/exchanges.hpp"
#include "internal/cache/match_cache.hpp"
#include "internal/core/delivery_state.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/proto_json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace dispatch::core {

using observability::DeliveryField;
using observability::RiderField;
using observability::StringField;

namespace {

// One claim per answered attempt. Responses without a match id fall back
// to one claim per rider and delivery for the claim ttl.
std::string ResponseClaimId(const dispatch::v1::DriverResponse& response) {
  auto id = response.delivery_id() + ":" + response.rider_id();
  if (!response.match_id().empty()) id += ":" + response.match_id();
  return id;
}

bool AnswersMatch(const dispatch::v1::MatchRecord& match, const dispatch::v1::DriverResponse& response) {
  if (match.rider().rider_id() != response.rider_id()) return false;
  return response.match_id().empty() || match.match_id() == response.match_id();
}

} // namespace

ResponseRelay::ResponseRelay(std::shared_ptr<db::Repository> repository, std::shared_ptr<bus::BusClient> bus,
                             std::shared_ptr<cache::MatchCache> matches, std::shared_ptr<registry::ConnectionRegistry> connections)
    : repository_(std::move(repository)), bus_(std::move(bus)), matches_(std::move(matches)), connections_(std::move(connections)) {
}

void ResponseRelay::Start() {
  bus_->Subscribe(bus::kDriverResponses, [this](const std::string& payload) {
    dispatch::v1::DriverResponse response;
    util::FromJson(payload, &response);
    HandleDriverResponse(response);
  });
}

void ResponseRelay::SendDriverResponse(const dispatch::v1::DriverResponse& response) {
  if (response.delivery_id().empty() || response.rider_id().empty() || response.customer_id().empty()) {
    throw util::InvalidArgument("driver response: delivery_id, rider_id and customer_id are required");
  }
  bus_->PublishMessage(bus::kDriverResponses, response);
}

void ResponseRelay::HandleDriverResponse(const dispatch::v1::DriverResponse& response) {
  if (response.delivery_id().empty()) {
    throw util::InvalidArgument("driver response: delivery_id is required");
  }

  if (matches_->Claim(cache::kClaimResponse, ResponseClaimId(response))) {
    if (response.availability()) {
      Accept(response);
    } else {
      Decline(response);
    }
  } else {
    DISPATCH_LOG_DEBUG("Driver response already recorded",
                       {DeliveryField(response.delivery_id()), RiderField(response.rider_id())});
  }

  NotifyCustomer(response);
}

void ResponseRelay::Accept(const dispatch::v1::DriverResponse& response) {
  const auto match = matches_->Get(response.delivery_id());
  if (match && !AnswersMatch(*match, response)) {
    throw util::InvalidState("driver response: rider " + response.rider_id() + " does not hold the current match for delivery " +
                             response.delivery_id());
  }
  const auto& rider_id = response.rider_id();

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto delivery = repository_->GetDelivery(tx, response.delivery_id());
    if (!delivery) {
      throw util::NotFound("driver response: no delivery " + response.delivery_id());
    }

    db::model::NotificationRecord record;
    record.id                        = util::NewId();
    record.delivery_ref_number       = delivery->delivery_ref_number;
    record.delivery_id               = delivery->id;
    record.rider_id                  = response.rider_id();
    record.customer_id               = response.customer_id();
    record.rider_availability_status = true;
    record.created_at_ms             = util::NowMillis();
    db::ThrowIfDbError(repository_->InsertNotification(tx, record), "record rider notification");

    if (!CanTransition(delivery->status, dispatch::v1::DELIVERY_STATUS_ASSIGNED)) {
      throw util::InvalidState("driver response: delivery " + delivery->id + " is " + dispatch::v1::DeliveryStatus_Name(delivery->status));
    }
    delivery->status   = dispatch::v1::DELIVERY_STATUS_ASSIGNED;
    delivery->rider_id = rider_id;
    db::ThrowIfDbError(repository_->UpdateDelivery(tx, *delivery), "assign delivery");
  });

  DISPATCH_LOG_INFO("Rider accepted delivery", {DeliveryField(response.delivery_id()), RiderField(rider_id)});
}

void ResponseRelay::Decline(const dispatch::v1::DriverResponse& response) {
  const auto match = matches_->Get(response.delivery_id());

  // a newer search may already own the delivery's match and dispatch claims
  if (match && AnswersMatch(*match, response)) {
    matches_->Delete(response.delivery_id());
    matches_->Release(cache::kClaimSubmit, response.delivery_id());
    matches_->Release(cache::kClaimNotify, response.delivery_id());
    matches_->Release(cache::kClaimAssigned, response.delivery_id());
  } else {
    DISPATCH_LOG_DEBUG("Decline does not answer the current match", {DeliveryField(response.delivery_id()),
                                                                    RiderField(response.rider_id()),
                                                                    StringField("match_id", response.match_id())});
  }

  RecordNotification(response, match ? match->delivery_ref_number() : std::string());

  DISPATCH_LOG_INFO("Rider declined delivery", {DeliveryField(response.delivery_id()), RiderField(response.rider_id())});
}

bool ResponseRelay::AcceptStillValid(const dispatch::v1::DriverResponse& response) {
  bool valid = false;
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    const auto delivery = repository_->GetDelivery(tx, response.delivery_id());
    if (!delivery) return;
    valid = delivery->status == dispatch::v1::DELIVERY_STATUS_PENDING ||
            (delivery->status == dispatch::v1::DELIVERY_STATUS_ASSIGNED && delivery->rider_id == response.rider_id());
  });
  return valid;
}

void ResponseRelay::NotifyCustomer(const dispatch::v1::DriverResponse& response) {
  // the process holding the customer's connection relays; others only record
  if (!connections_->Lookup(response.customer_id())) {
    return;
  }

  dispatch::v1::ServerEvent event;
  if (!response.availability()) {
    event.set_rider_declined("Rider declined your request");
    connections_->Send(response.customer_id(), event);
    return;
  }

  if (!AcceptStillValid(response)) {
    DISPATCH_LOG_WARN("Stale rider acceptance not relayed",
                      {DeliveryField(response.delivery_id()), RiderField(response.rider_id())});
    return;
  }
  if (!matches_->Claim(cache::kClaimRelay, ResponseClaimId(response))) {
    return;
  }

  auto* relayed = event.mutable_rider_response();
  relayed->set_title("Rider response");
  relayed->set_rider_id(response.rider_id());
  relayed->set_arrival_time(response.arrival_time());
  relayed->set_delivery_id(response.delivery_id());
  if (const auto match = matches_->Get(response.delivery_id())) *relayed->mutable_rider() = match->rider();

  if (!connections_->Send(response.customer_id(), event)) {
    matches_->Release(cache::kClaimRelay, ResponseClaimId(response));
  }
}

void ResponseRelay::RecordNotification(const dispatch::v1::DriverResponse& response, const std::string& delivery_ref_number) {
  db::model::NotificationRecord record;
  record.id                        = util::NewId();
  record.delivery_ref_number       = delivery_ref_number;
  record.delivery_id               = response.delivery_id();
  record.rider_id                  = response.rider_id();
  record.customer_id               = response.customer_id();
  record.rider_availability_status = response.availability();
  record.created_at_ms             = util::NowMillis();

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->InsertNotification(tx, record), "record rider notification");
  });
}

} // namespace dispatch::core
