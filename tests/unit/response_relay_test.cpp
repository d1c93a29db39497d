#include <cassert>
#include <iostream>

#include "internal/core/response_relay.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"
#include "support/recording_connection.hpp"

namespace {

using namespace dispatch::testing;
using dispatch::core::ResponseRelay;
using dispatch::v1::ServerEvent;

dispatch::v1::DriverResponse MakeResponse(bool accept, const std::string& rider_id = "rider-1", const std::string& match_id = "") {
  dispatch::v1::DriverResponse response;
  response.set_match_id(match_id);
  response.set_delivery_id("d1");
  response.set_rider_id(rider_id);
  response.set_customer_id("customer-1");
  response.set_availability(accept);
  response.set_arrival_time("7 minutes");
  return response;
}

std::vector<dispatch::db::model::NotificationRecord> Notifications(Collaborators& c) {
  std::vector<dispatch::db::model::NotificationRecord> out;
  dispatch::db::RunInTransaction(*c.repository, [&](dispatch::db::Transaction& tx) { out = c.repository->ListNotificationsByDelivery(tx, "d1"); });
  return out;
}

struct Scenario {
  Collaborators                        c;
  std::shared_ptr<RecordingConnection> customer = std::make_shared<RecordingConnection>("customer-conn");
  ResponseRelay                        relay{c.repository, c.bus, c.matches, c.connections};

  Scenario() {
    SeedDelivery(*c.repository, MakeDelivery("d1", "customer-1"));
    c.matches->Put(MakeMatch("d1", "rider-1", "customer-1"));
    c.connections->Register("customer-1", customer);
  }

  // stop consumers before the relay they call into goes away
  ~Scenario() {
    c.bus->Disconnect();
  }
};

void TestAcceptAssignsDeliveryAndNotifiesCustomer() {
  Scenario s;
  s.relay.HandleDriverResponse(MakeResponse(true));

  const auto events = s.customer->Events();
  assert(events.size() == 1);
  const auto& relayed = events[0].rider_response();
  assert(relayed.title() == "Rider response");
  assert(relayed.rider_id() == "rider-1");
  assert(relayed.arrival_time() == "7 minutes");
  assert(relayed.delivery_id() == "d1");
  assert(relayed.rider().first_name() == "Rider");

  const auto delivery = LoadDelivery(*s.c.repository, "d1");
  assert(delivery.status == dispatch::v1::DELIVERY_STATUS_ASSIGNED);
  assert(delivery.rider_id == "rider-1");

  const auto records = Notifications(s.c);
  assert(records.size() == 1);
  assert(records[0].rider_availability_status);
  assert(records[0].delivery_ref_number == "DLV-d1");
  assert(records[0].customer_id == "customer-1");

  // the match stays for the lifecycle events that follow
  assert(s.c.matches->Get("d1").has_value());
}

void TestDuplicateAcceptIsIgnored() {
  Scenario s;
  s.relay.HandleDriverResponse(MakeResponse(true));
  s.relay.HandleDriverResponse(MakeResponse(true));

  assert(s.customer->Count(ServerEvent::kRiderResponse) == 1);
  assert(Notifications(s.c).size() == 1);
}

void TestDeclineDropsMatchAndReleasesClaims() {
  Scenario s;
  assert(s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));
  assert(s.c.matches->Claim(dispatch::cache::kClaimNotify, "d1"));

  s.relay.HandleDriverResponse(MakeResponse(false));

  const auto events = s.customer->Events();
  assert(events.size() == 1);
  assert(events[0].rider_declined() == "Rider declined your request");

  assert(!s.c.matches->Get("d1").has_value());
  assert(s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));
  assert(s.c.matches->Claim(dispatch::cache::kClaimNotify, "d1"));

  const auto delivery = LoadDelivery(*s.c.repository, "d1");
  assert(delivery.status == dispatch::v1::DELIVERY_STATUS_PENDING);
  assert(delivery.rider_id.empty());

  const auto records = Notifications(s.c);
  assert(records.size() == 1);
  assert(!records[0].rider_availability_status);
  assert(records[0].delivery_ref_number == "DLV-d1");
}

void TestAcceptOnAssignedDeliveryIsRejected() {
  Scenario s;
  s.relay.HandleDriverResponse(MakeResponse(true));

  bool threw = false;
  try {
    s.relay.HandleDriverResponse(MakeResponse(true, "rider-2"));
  } catch (const dispatch::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(LoadDelivery(*s.c.repository, "d1").rider_id == "rider-1");
  assert(Notifications(s.c).size() == 1);
}

void TestSendDriverResponseValidates() {
  Scenario s;
  auto     response = MakeResponse(true);
  response.clear_customer_id();

  bool threw = false;
  try {
    s.relay.SendDriverResponse(response);
  } catch (const dispatch::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestResponseTravelsOverBus() {
  Scenario s;
  s.relay.Start();
  s.relay.SendDriverResponse(MakeResponse(true));

  assert(s.customer->WaitFor(ServerEvent::kRiderResponse));
  assert(Eventually([&] { return LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_ASSIGNED; }));
}

void TestCustomerElsewhereIsRecordedNotRelayed() {
  Scenario s;
  s.c.connections->Unregister(*s.customer);

  s.relay.HandleDriverResponse(MakeResponse(true));
  assert(s.customer->Events().empty());
  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_ASSIGNED);
  assert(Notifications(s.c).size() == 1);

  // the customer's own process sees the same message and relays it
  s.c.connections->Register("customer-1", s.customer);
  s.relay.HandleDriverResponse(MakeResponse(true));
  assert(s.customer->Count(ServerEvent::kRiderResponse) == 1);
  assert(Notifications(s.c).size() == 1);
}

// Another process sharing the cache and database but not the customer.
struct OtherNode {
  std::shared_ptr<dispatch::registry::ConnectionRegistry> connections = std::make_shared<dispatch::registry::ConnectionRegistry>();
  ResponseRelay                                           relay;

  explicit OtherNode(Collaborators& c) : relay(c.repository, c.bus, c.matches, connections) {
  }
};

void TestLateDeclineCopyLeavesNewSearchAlone() {
  Scenario  s;
  OtherNode other(s.c);
  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1", "m1"));

  s.relay.HandleDriverResponse(MakeResponse(false, "rider-1", "m1"));
  assert(!s.c.matches->Get("d1").has_value());

  // the customer searches again and resubmits before the other copy lands
  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1", "m2"));
  assert(s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));

  other.relay.HandleDriverResponse(MakeResponse(false, "rider-1", "m1"));

  const auto current = s.c.matches->Get("d1");
  assert(current.has_value());
  assert(current->match_id() == "m2");
  assert(!s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));
  assert(Notifications(s.c).size() == 1);
}

void TestLateDeclineCopyWithoutMatchIdIsRecordedOnce() {
  Scenario  s;
  OtherNode other(s.c);

  s.relay.HandleDriverResponse(MakeResponse(false));
  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1"));
  other.relay.HandleDriverResponse(MakeResponse(false));

  assert(s.c.matches->Get("d1").has_value());
  assert(Notifications(s.c).size() == 1);
}

void TestSameRiderDeclinesNewSearch() {
  Scenario s;
  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1", "m1"));
  s.relay.HandleDriverResponse(MakeResponse(false, "rider-1", "m1"));

  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1", "m2"));
  assert(s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));
  s.relay.HandleDriverResponse(MakeResponse(false, "rider-1", "m2"));

  assert(!s.c.matches->Get("d1").has_value());
  assert(s.c.matches->Claim(dispatch::cache::kClaimSubmit, "d1"));
  assert(Notifications(s.c).size() == 2);
  assert(s.customer->Count(ServerEvent::kRiderDeclined) == 2);
}

void TestAcceptForReplacedMatchIsRejected() {
  Scenario s;
  s.c.matches->Put(MakeMatch("d1", "rider-1", "customer-1", "m2"));

  bool threw = false;
  try {
    s.relay.HandleDriverResponse(MakeResponse(true, "rider-1", "m1"));
  } catch (const dispatch::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_PENDING);
  assert(Notifications(s.c).empty());
  assert(s.customer->Events().empty());
}

} // namespace

int main() {
  TestAcceptAssignsDeliveryAndNotifiesCustomer();
  TestDuplicateAcceptIsIgnored();
  TestDeclineDropsMatchAndReleasesClaims();
  TestAcceptOnAssignedDeliveryIsRejected();
  TestSendDriverResponseValidates();
  TestResponseTravelsOverBus();
  TestCustomerElsewhereIsRecordedNotRelayed();
  TestLateDeclineCopyLeavesNewSearchAlone();
  TestLateDeclineCopyWithoutMatchIdIsRecordedOnce();
  TestSameRiderDeclinesNewSearch();
  TestAcceptForReplacedMatchIsRejected();

  std::cout << "dispatch_unit_response_relay: pass\n";
  return 0;
}
