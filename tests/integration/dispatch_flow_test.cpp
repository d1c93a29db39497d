#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/core/delivery_lifecycle.hpp"
#include "internal/core/dispatch_engine.hpp"
#include "internal/core/response_relay.hpp"
#include "internal/core/rider_discovery.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/stream_session.hpp"
#include "support/fixtures.hpp"
#include "support/recording_connection.hpp"

namespace {

using dispatch::testing::Eventually;
using dispatch::testing::RecordingConnection;
using dispatch::v1::ClientEvent;
using dispatch::v1::ServerEvent;

constexpr double kAdminChargePercent = 10.0;

// Backing services every node talks to.
struct Shared {
  std::shared_ptr<dispatch::db::memory::MemoryRepository> repository = std::make_shared<dispatch::db::memory::MemoryRepository>();
  std::shared_ptr<dispatch::cache::MemoryKeyValueCache>   kv         = std::make_shared<dispatch::cache::MemoryKeyValueCache>();
  std::shared_ptr<dispatch::bus::MemoryBroker>            broker     = std::make_shared<dispatch::bus::MemoryBroker>();
};

// One server process, wired the way the composition root wires it.
struct Node {
  dispatch::service::ServiceContext                   ctx;
  std::shared_ptr<dispatch::service::DispatchService> service;

  explicit Node(Shared& shared) {
    ctx.repository  = shared.repository;
    ctx.connections = std::make_shared<dispatch::registry::ConnectionRegistry>();
    ctx.matches     = std::make_shared<dispatch::cache::MatchCache>(shared.kv, std::chrono::seconds(3600), std::chrono::seconds(3600));
    ctx.bus         = std::make_shared<dispatch::bus::BusClient>(shared.broker);
    ctx.bus->Connect();

    ctx.discovery  = std::make_shared<dispatch::core::RiderDiscovery>(ctx.repository, ctx.matches, ctx.pricing,
                                                                      dispatch::runtime::config::DiscoveryConfig{});
    ctx.dispatcher = std::make_shared<dispatch::core::DispatchEngine>(ctx.bus, ctx.matches, ctx.connections, std::chrono::milliseconds(0));
    ctx.relay      = std::make_shared<dispatch::core::ResponseRelay>(ctx.repository, ctx.bus, ctx.matches, ctx.connections);
    ctx.lifecycle  = std::make_shared<dispatch::core::DeliveryLifecycle>(
        ctx.repository, ctx.matches, ctx.connections, std::make_shared<dispatch::core::Settlement>(ctx.repository, kAdminChargePercent));

    ctx.dispatcher->Start();
    ctx.relay->Start();
    service = std::make_shared<dispatch::service::DispatchService>(ctx);
  }

  ~Node() {
    ctx.bus->Disconnect();
  }

  dispatch::service::StreamSession Connect(const std::shared_ptr<RecordingConnection>& connection) {
    return dispatch::service::StreamSession(ctx, connection);
  }
};

void OnboardRider(dispatch::service::DispatchService& service, const std::string& rider_id) {
  dispatch::v1::UpsertRiderRequest rider;
  rider.mutable_rider()->set_rider_id(rider_id);
  rider.mutable_rider()->set_first_name("Tunde");
  rider.mutable_rider()->set_last_name("Bello");
  rider.mutable_rider()->set_status(dispatch::v1::RIDER_STATUS_ONLINE);
  rider.mutable_rider()->set_active(true);
  service.UpsertRider(rider);

  dispatch::v1::UpsertVehicleRequest vehicle;
  vehicle.mutable_vehicle()->set_rider_id(rider_id);
  vehicle.mutable_vehicle()->set_vehicle_type(dispatch::v1::VEHICLE_TYPE_BIKE);
  vehicle.mutable_vehicle()->set_plate_number("LAG-123");
  service.UpsertVehicle(vehicle);

  dispatch::v1::UpdateRiderLocationRequest location;
  location.set_rider_id(rider_id);
  location.mutable_location()->set_latitude(6.46);
  location.mutable_location()->set_longitude(3.40);
  service.UpdateRiderLocation(location);
}

dispatch::v1::Delivery CreateDelivery(dispatch::service::DispatchService& service, const std::string& customer_id) {
  dispatch::v1::CreateDeliveryRequest req;
  req.set_customer_id(customer_id);
  req.set_sender_name("Ada");
  req.set_sender_address("1 Marina Road");
  req.set_recipient_address("9 Allen Avenue");
  req.mutable_sender_location()->set_latitude(6.45);
  req.mutable_sender_location()->set_longitude(3.40);
  req.mutable_recipient_location()->set_latitude(6.60);
  req.mutable_recipient_location()->set_longitude(3.35);
  req.set_vehicle_type(dispatch::v1::VEHICLE_TYPE_BIKE);
  return service.CreateDelivery(req).delivery();
}

dispatch::v1::FindRiderResponse FindRider(dispatch::service::DispatchService& service, const std::string& customer_id) {
  dispatch::v1::FindRiderRequest req;
  req.set_customer_id(customer_id);
  return service.FindRider(req);
}

dispatch::v1::DeliveryStatus StatusOf(dispatch::service::DispatchService& service, const std::string& delivery_id) {
  dispatch::v1::GetDeliveryRequest req;
  req.set_delivery_id(delivery_id);
  return service.GetDelivery(req).delivery().status();
}

ClientEvent Hello(bool rider, const std::string& id) {
  ClientEvent event;
  if (rider) {
    event.set_rider_id(id);
  } else {
    event.set_customer_id(id);
  }
  return event;
}

ClientEvent PackageRequest(const dispatch::v1::Delivery& delivery) {
  ClientEvent event;
  auto*       request = event.mutable_package_request();
  request->set_delivery_id(delivery.delivery_id());
  request->set_customer_id(delivery.customer_id());
  request->set_sender_name(delivery.sender_name());
  request->set_sender_address(delivery.sender_address());
  request->set_recipient_address(delivery.recipient_address());
  return event;
}

// The rider answers the latest request it was notified of.
std::string LatestMatchId(const RecordingConnection& rider) {
  std::string match_id;
  for (const auto& e : rider.Events()) {
    if (e.event_case() == ServerEvent::kNotification) match_id = e.notification().match_id();
  }
  return match_id;
}

ClientEvent Response(const dispatch::v1::Delivery& delivery, const std::string& rider_id, bool accept, const std::string& match_id) {
  ClientEvent event;
  auto*       response = event.mutable_driver_response();
  response->set_match_id(match_id);
  response->set_delivery_id(delivery.delivery_id());
  response->set_customer_id(delivery.customer_id());
  response->set_rider_id(rider_id);
  response->set_availability(accept);
  response->set_arrival_time("7 minutes");
  return event;
}

ClientEvent Signal(const dispatch::v1::Delivery& delivery, const std::string& rider_id, bool start) {
  ClientEvent                   event;
  dispatch::v1::DeliverySignal* signal = start ? event.mutable_start_delivery() : event.mutable_end_delivery();
  signal->set_customer_id(delivery.customer_id());
  signal->set_rider_id(rider_id);
  signal->set_delivery_id(delivery.delivery_id());
  return event;
}

void Settle() {
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
}

void TestDeliveryFromRequestToPayout() {
  Shared shared;
  Node   node(shared);

  OnboardRider(*node.service, "rider-1");
  const auto delivery = CreateDelivery(*node.service, "customer-1");
  assert(delivery.status() == dispatch::v1::DELIVERY_STATUS_PENDING);
  assert(delivery.delivery_fee() > 0.0);

  auto rider_conn    = std::make_shared<RecordingConnection>("rider-conn");
  auto customer_conn = std::make_shared<RecordingConnection>("customer-conn");
  auto rider         = node.Connect(rider_conn);
  auto customer      = node.Connect(customer_conn);
  assert(rider.Handle(Hello(true, "rider-1")));
  assert(customer.Handle(Hello(false, "customer-1")));

  const auto found = FindRider(*node.service, "customer-1");
  assert(found.rider().rider_id() == "rider-1");
  assert(found.delivery_id() == delivery.delivery_id());
  assert(found.message() == "Rider found");

  assert(customer.Handle(PackageRequest(delivery)));
  assert(rider_conn->WaitFor(ServerEvent::kNotification));
  Settle();
  assert(rider_conn->Count(ServerEvent::kNotification) == 1);

  assert(rider.Handle(Response(delivery, "rider-1", true, LatestMatchId(*rider_conn))));
  assert(customer_conn->WaitFor(ServerEvent::kRiderResponse));
  assert(Eventually([&] { return StatusOf(*node.service, delivery.delivery_id()) == dispatch::v1::DELIVERY_STATUS_ASSIGNED; }));

  assert(rider.Handle(Signal(delivery, "rider-1", true)));
  assert(StatusOf(*node.service, delivery.delivery_id()) == dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);

  assert(rider.Handle(Signal(delivery, "rider-1", false)));
  assert(StatusOf(*node.service, delivery.delivery_id()) == dispatch::v1::DELIVERY_STATUS_DELIVERED);

  const auto started = customer_conn->Events();
  std::size_t ends   = 0;
  for (const auto& e : started) {
    if (e.event_case() == ServerEvent::kStartDeliveryNotification) {
      assert(e.start_delivery_notification().delivery_ref_number() == delivery.delivery_ref_number());
      assert(e.start_delivery_notification().estimated_delivery_time() == delivery.estimated_delivery_time());
    }
    if (e.event_case() == ServerEvent::kEndDeliveryNotification) ++ends;
  }
  assert(ends == 1);

  dispatch::v1::GetRiderWalletRequest wallet_req;
  wallet_req.set_rider_id("rider-1");
  const auto wallet = node.service->GetRiderWallet(wallet_req).wallet();
  const auto fee    = delivery.delivery_fee();
  assert(wallet.balance() == fee - std::round(kAdminChargePercent / 100.0 * fee));

  rider.Close();
  customer.Close();
  assert(node.ctx.connections->Size() == 0);
}

void TestDeclineAllowsResubmission() {
  Shared shared;
  Node   node(shared);

  OnboardRider(*node.service, "rider-1");
  const auto delivery = CreateDelivery(*node.service, "customer-1");

  auto rider_conn    = std::make_shared<RecordingConnection>("rider-conn");
  auto customer_conn = std::make_shared<RecordingConnection>("customer-conn");
  auto rider         = node.Connect(rider_conn);
  auto customer      = node.Connect(customer_conn);
  assert(rider.Handle(Hello(true, "rider-1")));
  assert(customer.Handle(Hello(false, "customer-1")));

  FindRider(*node.service, "customer-1");
  assert(customer.Handle(PackageRequest(delivery)));
  assert(rider_conn->WaitFor(ServerEvent::kNotification));

  const auto first_attempt = LatestMatchId(*rider_conn);
  assert(!first_attempt.empty());
  assert(rider.Handle(Response(delivery, "rider-1", false, first_attempt)));
  assert(customer_conn->WaitFor(ServerEvent::kRiderDeclined));
  assert(Eventually([&] { return !node.ctx.matches->Get(delivery.delivery_id()).has_value(); }));
  assert(StatusOf(*node.service, delivery.delivery_id()) == dispatch::v1::DELIVERY_STATUS_PENDING);

  FindRider(*node.service, "customer-1");
  assert(customer.Handle(PackageRequest(delivery)));
  assert(rider_conn->WaitFor(ServerEvent::kNotification, 2));
  assert(customer_conn->Count(ServerEvent::kRequestAlreadySent) == 0);

  const auto second_attempt = LatestMatchId(*rider_conn);
  assert(!second_attempt.empty());
  assert(second_attempt != first_attempt);

  // the same rider may turn the new attempt down too
  assert(rider.Handle(Response(delivery, "rider-1", false, second_attempt)));
  assert(customer_conn->WaitFor(ServerEvent::kRiderDeclined, 2));
  assert(Eventually([&] { return !node.ctx.matches->Get(delivery.delivery_id()).has_value(); }));
}

void TestRiderAndCustomerOnDifferentNodes() {
  Shared shared;
  Node   customer_node(shared);
  Node   rider_node(shared);

  OnboardRider(*customer_node.service, "rider-1");
  const auto delivery = CreateDelivery(*customer_node.service, "customer-1");

  auto rider_conn    = std::make_shared<RecordingConnection>("rider-conn");
  auto customer_conn = std::make_shared<RecordingConnection>("customer-conn");
  auto rider         = rider_node.Connect(rider_conn);
  auto customer      = customer_node.Connect(customer_conn);
  assert(rider.Handle(Hello(true, "rider-1")));
  assert(customer.Handle(Hello(false, "customer-1")));

  FindRider(*customer_node.service, "customer-1");

  // the rider's node picks the request up from the bus
  assert(customer.Handle(PackageRequest(delivery)));
  assert(rider_conn->WaitFor(ServerEvent::kNotification));

  // a duplicate submit on the other node is rejected by the shared claim
  auto duplicate = rider_node.Connect(std::make_shared<RecordingConnection>("late-conn"));
  assert(duplicate.Handle(PackageRequest(delivery)));
  Settle();
  assert(rider_conn->Count(ServerEvent::kNotification) == 1);

  // the customer's node relays the acceptance, recorded once across both
  assert(rider.Handle(Response(delivery, "rider-1", true, LatestMatchId(*rider_conn))));
  assert(customer_conn->WaitFor(ServerEvent::kRiderResponse));
  Settle();
  assert(customer_conn->Count(ServerEvent::kRiderResponse) == 1);
  assert(Eventually([&] { return StatusOf(*customer_node.service, delivery.delivery_id()) == dispatch::v1::DELIVERY_STATUS_ASSIGNED; }));

  std::size_t recorded = 0;
  dispatch::db::RunInTransaction(*shared.repository, [&](dispatch::db::Transaction& tx) {
    recorded = shared.repository->ListNotificationsByDelivery(tx, delivery.delivery_id()).size();
  });
  assert(recorded == 1);
}

} // namespace

int main() {
  TestDeliveryFromRequestToPayout();
  TestDeclineAllowsResubmission();
  TestRiderAndCustomerOnDifferentNodes();

  std::cout << "dispatch_integration_dispatch_flow: pass\n";
  return 0;
}
