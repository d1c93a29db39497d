#include "dispatch_service.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/core/response_relay.hpp"
#include "internal/core/rider_discovery.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe_rpc.hpp"

namespace dispatch::service {

using namespace dispatch::v1;

namespace {

geo::Coordinates ToCoordinates(const GeoPoint& point) {
  return {point.latitude(), point.longitude()};
}

void ToGeoPoint(const geo::Coordinates& c, GeoPoint* point) {
  point->set_latitude(c.latitude);
  point->set_longitude(c.longitude);
}

geo::Coordinates RequireCoordinates(const GeoPoint& point, const char* field) {
  const auto c = ToCoordinates(point);
  if (!geo::IsValid(c)) {
    throw util::InvalidArgument(std::string(field) + " is out of range");
  }
  return c;
}

void RequireNonEmpty(const std::string& value, const char* field) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(field) + " is required");
  }
}

void ToProto(const db::model::DeliveryRecord& r, Delivery* out) {
  out->set_delivery_id(r.id);
  out->set_customer_id(r.customer_id);
  out->set_rider_id(r.rider_id);
  out->set_status(r.status);
  out->set_delivery_fee(r.delivery_fee);
  out->set_delivery_ref_number(r.delivery_ref_number);
  out->set_sender_name(r.sender_name);
  out->set_sender_address(r.sender_address);
  out->set_recipient_address(r.recipient_address);
  ToGeoPoint(r.sender_location, out->mutable_sender_location());
  ToGeoPoint(r.recipient_location, out->mutable_recipient_location());
  out->set_estimated_delivery_time(r.estimated_delivery_time);
  out->set_vehicle_type(r.vehicle_type);
  out->set_created_at_ms(static_cast<int64_t>(r.created_at_ms));
}

db::model::RiderRecord FromProto(const Rider& rider) {
  db::model::RiderRecord r;
  r.id         = rider.rider_id();
  r.first_name = rider.first_name();
  r.last_name  = rider.last_name();
  r.phone      = rider.phone();
  r.email      = rider.email();
  r.gender     = rider.gender();
  r.status     = rider.status() == RIDER_STATUS_UNSPECIFIED ? RIDER_STATUS_OFFLINE : rider.status();
  r.active     = rider.active();
  r.busy       = rider.busy();
  return r;
}

} // namespace

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

FindRiderResponse DispatchService::FindRider(const FindRiderRequest& req) {
  return ObserveRpc("dispatch.FindRider", req.customer_id(), [&] {
    RequireNonEmpty(req.customer_id(), "customer_id");

    const auto match = ctx_.discovery->FindRider(req.customer_id());

    FindRiderResponse resp;
    *resp.mutable_rider() = match.rider();
    resp.set_arrival_minutes(match.arrival_minutes());
    resp.set_message("Rider found");
    resp.set_delivery_id(match.delivery_id());
    return resp;
  });
}

SubmitPackageRequestResponse DispatchService::SubmitPackageRequest(const PackageRequest& req) {
  return ObserveRpc("dispatch.SubmitPackageRequest", req.delivery_id(), [&] {
    SubmitPackageRequestResponse resp;
    const auto                   outcome = ctx_.dispatcher->SubmitPackageRequest(req);
    resp.set_outcome(outcome == core::SubmitOutcome::kDispatched ? SUBMIT_OUTCOME_DISPATCHED : SUBMIT_OUTCOME_ALREADY_SENT);
    return resp;
  });
}

void DispatchService::SendDriverResponse(const DriverResponse& req) {
  ObserveRpc("dispatch.SendDriverResponse", req.delivery_id(), [&] { ctx_.relay->SendDriverResponse(req); });
}

QuoteDeliveryResponse DispatchService::QuoteDelivery(const QuoteDeliveryRequest& req) {
  return ObserveRpc("dispatch.QuoteDelivery", {}, [&] {
    const auto quote = core::QuoteTrip(ctx_.pricing, RequireCoordinates(req.origin(), "origin"),
                                       RequireCoordinates(req.destination(), "destination"), req.vehicle_type());

    QuoteDeliveryResponse resp;
    resp.set_distance_km(quote.distance_km);
    resp.set_delivery_fee(quote.delivery_fee);
    resp.set_estimated_delivery_time(quote.estimated_delivery_time);
    return resp;
  });
}

CreateDeliveryResponse DispatchService::CreateDelivery(const CreateDeliveryRequest& req) {
  return ObserveRpc("dispatch.CreateDelivery", req.customer_id(), [&] {
    RequireNonEmpty(req.customer_id(), "customer_id");

    db::model::DeliveryRecord record;
    record.customer_id        = req.customer_id();
    record.sender_name        = req.sender_name();
    record.sender_address     = req.sender_address();
    record.recipient_address  = req.recipient_address();
    record.sender_location    = RequireCoordinates(req.sender_location(), "sender_location");
    record.recipient_location = RequireCoordinates(req.recipient_location(), "recipient_location");
    record.vehicle_type       = req.vehicle_type();

    const auto quote = core::QuoteTrip(ctx_.pricing, record.sender_location, record.recipient_location, record.vehicle_type);
    record.delivery_fee            = quote.delivery_fee;
    record.estimated_delivery_time = quote.estimated_delivery_time;

    record.id                  = util::NewId();
    record.delivery_ref_number = util::NewDeliveryRefNumber();
    record.status              = DELIVERY_STATUS_PENDING;
    record.created_at_ms       = util::NowMillis();

    db::RunInTransaction(*ctx_.repository,
                         [&](db::Transaction& tx) { db::ThrowIfDbError(ctx_.repository->InsertDelivery(tx, record), "insert delivery"); });

    DISPATCH_LOG_INFO("Delivery created", {observability::DeliveryField(record.id),
                                           observability::CustomerField(record.customer_id),
                                           observability::DoubleField("delivery_fee", record.delivery_fee)});

    CreateDeliveryResponse resp;
    ToProto(record, resp.mutable_delivery());
    return resp;
  });
}

GetDeliveryResponse DispatchService::GetDelivery(const GetDeliveryRequest& req) {
  return ObserveRpc("dispatch.GetDelivery", req.delivery_id(), [&] {
    RequireNonEmpty(req.delivery_id(), "delivery_id");

    GetDeliveryResponse resp;
    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto record = ctx_.repository->GetDelivery(tx, req.delivery_id());
      if (!record) throw util::NotFound("delivery " + req.delivery_id());
      ToProto(*record, resp.mutable_delivery());
    });
    return resp;
  });
}

void DispatchService::UpdateRiderLocation(const UpdateRiderLocationRequest& req) {
  ObserveRpc("dispatch.UpdateRiderLocation", req.rider_id(), [&] {
    RequireNonEmpty(req.rider_id(), "rider_id");

    db::model::RiderLocationRecord location;
    location.rider_id      = req.rider_id();
    location.location      = RequireCoordinates(req.location(), "location");
    location.updated_at_ms = util::NowMillis();

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      if (!ctx_.repository->GetRider(tx, req.rider_id())) throw util::NotFound("rider " + req.rider_id());
      db::ThrowIfDbError(ctx_.repository->UpsertRiderLocation(tx, location), "upsert rider location");
    });
  });
}

void DispatchService::UpsertRider(const UpsertRiderRequest& req) {
  ObserveRpc("dispatch.UpsertRider", req.rider().rider_id(), [&] {
    RequireNonEmpty(req.rider().rider_id(), "rider.rider_id");

    const auto record = FromProto(req.rider());
    db::RunInTransaction(*ctx_.repository,
                         [&](db::Transaction& tx) { db::ThrowIfDbError(ctx_.repository->UpsertRider(tx, record), "upsert rider"); });
  });
}

void DispatchService::UpsertVehicle(const UpsertVehicleRequest& req) {
  ObserveRpc("dispatch.UpsertVehicle", req.vehicle().rider_id(), [&] {
    RequireNonEmpty(req.vehicle().rider_id(), "vehicle.rider_id");

    db::model::VehicleRecord record;
    record.id           = req.vehicle().vehicle_id().empty() ? util::NewId() : req.vehicle().vehicle_id();
    record.rider_id     = req.vehicle().rider_id();
    record.vehicle_type = req.vehicle().vehicle_type();
    record.plate_number = req.vehicle().plate_number();

    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      if (!ctx_.repository->GetRider(tx, record.rider_id)) throw util::NotFound("rider " + record.rider_id);
      db::ThrowIfDbError(ctx_.repository->UpsertVehicle(tx, record), "upsert vehicle");
    });
  });
}

GetRiderWalletResponse DispatchService::GetRiderWallet(const GetRiderWalletRequest& req) {
  return ObserveRpc("dispatch.GetRiderWallet", req.rider_id(), [&] {
    RequireNonEmpty(req.rider_id(), "rider_id");

    GetRiderWalletResponse resp;
    db::RunInTransaction(*ctx_.repository, [&](db::Transaction& tx) {
      auto wallet = ctx_.repository->GetRiderWallet(tx, req.rider_id());
      if (!wallet) throw util::NotFound("wallet for rider " + req.rider_id());
      resp.mutable_wallet()->set_rider_id(wallet->rider_id);
      resp.mutable_wallet()->set_balance(wallet->balance);
    });
    return resp;
  });
}

} // namespace dispatch::service
