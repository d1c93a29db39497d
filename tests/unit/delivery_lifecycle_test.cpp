#include <cassert>
#include <iostream>

#include "internal/core/delivery_lifecycle.hpp"
#include "internal/core/settlement.hpp"
#include "internal/util/errors.hpp"
#include "support/fixtures.hpp"
#include "support/recording_connection.hpp"

namespace {

using namespace dispatch::testing;
using dispatch::core::DeliveryLifecycle;
using dispatch::core::Settlement;
using dispatch::v1::ServerEvent;

struct Scenario {
  Collaborators                        c;
  std::shared_ptr<Settlement>          settlement = std::make_shared<Settlement>(c.repository, 10.0);
  std::shared_ptr<RecordingConnection> customer   = std::make_shared<RecordingConnection>("customer-conn");
  DeliveryLifecycle                    lifecycle{c.repository, c.matches, c.connections, settlement};

  explicit Scenario(dispatch::v1::DeliveryStatus status = dispatch::v1::DELIVERY_STATUS_ASSIGNED) {
    auto delivery = MakeDelivery("d1", "customer-1");
    delivery.status = status;
    if (status != dispatch::v1::DELIVERY_STATUS_PENDING) delivery.rider_id = "rider-1";
    SeedDelivery(*c.repository, delivery);
    SeedRider(*c.repository, MakeRider("rider-1"), {6.46, 3.40});
    c.matches->Put(MakeMatch("d1", "rider-1", "customer-1"));
    c.connections->Register("customer-1", customer);
  }

  bool RiderBusy() {
    bool busy = false;
    dispatch::db::RunInTransaction(*c.repository, [&](dispatch::db::Transaction& tx) { busy = c.repository->GetRider(tx, "rider-1")->busy; });
    return busy;
  }

  std::optional<double> WalletBalance() {
    std::optional<double> balance;
    dispatch::db::RunInTransaction(*c.repository, [&](dispatch::db::Transaction& tx) {
      if (auto wallet = c.repository->GetRiderWallet(tx, "rider-1")) balance = wallet->balance;
    });
    return balance;
  }

  std::optional<dispatch::db::model::AdminFeeRecord> AdminFee() {
    std::optional<dispatch::db::model::AdminFeeRecord> fee;
    dispatch::db::RunInTransaction(*c.repository, [&](dispatch::db::Transaction& tx) { fee = c.repository->GetAdminFee(tx, "DLV-d1"); });
    return fee;
  }
};

dispatch::v1::DeliverySignal Signal(const std::string& delivery_id = "d1") {
  dispatch::v1::DeliverySignal signal;
  signal.set_customer_id("customer-1");
  signal.set_rider_id("rider-1");
  signal.set_delivery_id(delivery_id);
  (*signal.mutable_attributes())["package"] = "documents";
  return signal;
}

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestStartMovesToTransitAndNotifies() {
  Scenario s;
  assert(s.lifecycle.StartDelivery(Signal()));

  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);
  assert(s.RiderBusy());

  const auto events = s.customer->Events();
  assert(events.size() == 1);
  const auto& n = events[0].start_delivery_notification();
  assert(n.delivery_ref_number() == "DLV-d1");
  assert(n.estimated_delivery_time() == "0hrs:35min");
  assert(n.delivery_id() == "d1");
  assert(n.rider_id() == "rider-1");
  assert(n.signal().attributes().at("package") == "documents");
}

void TestEndSettlesInOneStep() {
  Scenario s;
  assert(s.lifecycle.StartDelivery(Signal()));
  assert(s.lifecycle.EndDelivery(Signal()));

  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_DELIVERED);
  assert(!s.RiderBusy());
  assert(s.WalletBalance() == std::optional<double>(900.0));

  const auto fee = s.AdminFee();
  assert(fee.has_value());
  assert(fee->admin_fee == 100.0);
  assert(fee->rider_id == "rider-1");
  assert(fee->delivery_id == "d1");

  assert(s.customer->Count(ServerEvent::kEndDeliveryNotification) == 1);
  assert(!s.c.matches->Get("d1").has_value());
}

void TestExistingWalletIsCredited() {
  Scenario s(dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);
  dispatch::db::RunInTransaction(*s.c.repository, [&](dispatch::db::Transaction& tx) {
    dispatch::db::ThrowIfDbError(s.c.repository->InsertRiderWallet(tx, {"rider-1", 50.0}), "seed wallet");
  });

  assert(s.lifecycle.EndDelivery(Signal()));
  assert(s.WalletBalance() == std::optional<double>(950.0));
}

void TestSecondEndIsRejectedAndNotPaidTwice() {
  Scenario s(dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);
  assert(s.lifecycle.EndDelivery(Signal()));

  assert(Throws<dispatch::util::InvalidState>([&] { s.lifecycle.EndDelivery(Signal()); }));
  assert(s.WalletBalance() == std::optional<double>(900.0));
  assert(s.customer->Count(ServerEvent::kEndDeliveryNotification) == 1);
}

void TestSettlementIsIdempotentByReference() {
  Scenario s(dispatch::v1::DELIVERY_STATUS_ON_TRANSIT);
  auto     delivery = LoadDelivery(*s.c.repository, "d1");

  std::optional<dispatch::core::FeeSplit> first;
  std::optional<dispatch::core::FeeSplit> second;
  dispatch::db::RunInTransaction(*s.c.repository, [&](dispatch::db::Transaction& tx) { first = s.settlement->Settle(tx, delivery); });
  dispatch::db::RunInTransaction(*s.c.repository, [&](dispatch::db::Transaction& tx) { second = s.settlement->Settle(tx, delivery); });

  assert(first.has_value());
  assert(!second.has_value());
  assert(s.WalletBalance() == std::optional<double>(900.0));
}

void TestCustomerNotConnectedChangesNothing() {
  Scenario s;
  s.c.connections->Unregister(*s.customer);

  assert(!s.lifecycle.StartDelivery(Signal()));
  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_ASSIGNED);
  assert(!s.RiderBusy());
}

void TestStartOnPendingDeliveryIsInvalid() {
  Scenario s(dispatch::v1::DELIVERY_STATUS_PENDING);

  assert(Throws<dispatch::util::InvalidState>([&] { s.lifecycle.StartDelivery(Signal()); }));
  assert(LoadDelivery(*s.c.repository, "d1").status == dispatch::v1::DELIVERY_STATUS_PENDING);
  assert(s.customer->Events().empty());
}

void TestExpiredMatchFallsBackToDeliveryRow() {
  Scenario s;
  s.c.matches->Delete("d1");

  // empty delivery id resolves to the customer's latest delivery
  assert(s.lifecycle.StartDelivery(Signal("")));

  const auto events = s.customer->Events();
  assert(events.size() == 1);
  const auto& n = events[0].start_delivery_notification();
  assert(n.delivery_id() == "d1");
  assert(n.delivery_ref_number() == "DLV-d1");
  assert(n.estimated_delivery_time() == "0hrs:35min");
  assert(n.rider_id() == "rider-1");
}

void TestArrivalIsRelayed() {
  Scenario s;

  dispatch::v1::ArrivalSignal arrived;
  arrived.set_customer_id("customer-1");
  arrived.set_rider_id("rider-1");
  arrived.set_rider_arrived(true);
  s.lifecycle.Arrived(arrived);

  const auto events = s.customer->Events();
  assert(events.size() == 1);
  assert(events[0].event_case() == ServerEvent::kRiderArrivalNotification);
  assert(events[0].rider_arrival_notification());

  arrived.clear_customer_id();
  assert(Throws<dispatch::util::InvalidArgument>([&] { s.lifecycle.Arrived(arrived); }));
}

} // namespace

int main() {
  TestStartMovesToTransitAndNotifies();
  TestEndSettlesInOneStep();
  TestExistingWalletIsCredited();
  TestSecondEndIsRejectedAndNotPaidTwice();
  TestSettlementIsIdempotentByReference();
  TestCustomerNotConnectedChangesNothing();
  TestStartOnPendingDeliveryIsInvalid();
  TestExpiredMatchFallsBackToDeliveryRow();
  TestArrivalIsRelayed();

  std::cout << "dispatch_unit_delivery_lifecycle: pass\n";
  return 0;
}
