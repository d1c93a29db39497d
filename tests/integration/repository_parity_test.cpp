#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/run_in_transaction.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

#if DISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if DISPATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using dispatch::db::Repository;
using dispatch::db::memory::MemoryRepository;
using dispatch::db::model::AdminFeeRecord;
using dispatch::db::model::DeliveryRecord;
using dispatch::db::model::NotificationRecord;
using dispatch::db::model::RiderRecord;
using dispatch::db::model::RiderWalletRecord;
using dispatch::db::model::VehicleRecord;

enum class ParallelWrites {
  kConflict,      // second commit of a stale snapshot throws util::Conflict
  kSerialized,    // a second Begin() while one is open fails
  kLastWriterWins,
};

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  ParallelWrites                                    parallel_writes = ParallelWrites::kConflict;
};

DeliveryRecord MakeDelivery(const std::string& id, const std::string& customer_id, uint64_t created_at_ms) {
  DeliveryRecord d;
  d.id                      = id;
  d.customer_id             = customer_id;
  d.status                  = dispatch::v1::DELIVERY_STATUS_PENDING;
  d.delivery_fee            = 1234.5;
  d.delivery_ref_number     = "REF-" + id;
  d.sender_name             = "Ada";
  d.sender_address          = "1 Marina Road";
  d.recipient_address       = "9 Allen Avenue";
  d.sender_location         = {6.45, 3.40};
  d.recipient_location      = {6.60, 3.35};
  d.estimated_delivery_time = "0hrs:35min";
  d.vehicle_type            = dispatch::v1::VEHICLE_TYPE_CAR;
  d.created_at_ms           = created_at_ms;
  return d;
}

RiderRecord MakeRider(const std::string& id) {
  RiderRecord r;
  r.id         = id;
  r.first_name = "Tunde";
  r.last_name  = "Bello";
  r.phone      = "+2348000000001";
  r.email      = id + "@riders.test";
  r.gender     = "male";
  r.status     = dispatch::v1::RIDER_STATUS_ONLINE;
  r.active     = true;
  return r;
}

void VerifyDeliveryLifecycle(Repository& repo, const std::string& prefix) {
  const auto customer = prefix + "-customer";
  auto       later    = MakeDelivery(prefix + "-d2", customer, 2000);
  auto       earlier  = MakeDelivery(prefix + "-d1", customer, 1000);

  {
    auto tx = repo.Begin();
    assert(repo.InsertDelivery(*tx, later));
    assert(repo.InsertDelivery(*tx, earlier));

    auto read = repo.GetDelivery(*tx, earlier.id);
    assert(read.has_value());
    assert(read->customer_id == customer);
    assert(read->delivery_fee == 1234.5);
    assert(read->delivery_ref_number == "REF-" + earlier.id);
    assert(read->sender_location.latitude == 6.45);
    assert(read->recipient_location.longitude == 3.35);
    assert(read->estimated_delivery_time == "0hrs:35min");
    assert(read->vehicle_type == dispatch::v1::VEHICLE_TYPE_CAR);
    assert(read->status == dispatch::v1::DELIVERY_STATUS_PENDING);
    assert(read->rider_id.empty());
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto list = repo.ListDeliveriesByCustomer(*tx, customer);
    assert(list.size() == 2);
    assert(list[0].id == earlier.id);
    assert(list[1].id == later.id);
    assert(repo.ListDeliveriesByCustomer(*tx, prefix + "-nobody").empty());

    earlier.status   = dispatch::v1::DELIVERY_STATUS_ASSIGNED;
    earlier.rider_id = prefix + "-rider";
    assert(repo.UpdateDelivery(*tx, earlier));
    auto updated = repo.GetDelivery(*tx, earlier.id);
    assert(updated->status == dispatch::v1::DELIVERY_STATUS_ASSIGNED);
    assert(updated->rider_id == earlier.rider_id);

    assert(!repo.UpdateDelivery(*tx, MakeDelivery(prefix + "-ghost", customer, 1)));

    assert(repo.DeleteDelivery(*tx, later.id));
    assert(!repo.GetDelivery(*tx, later.id).has_value());
    tx->Commit();
  }

  // a failed statement may poison the transaction, so check duplicates last
  auto tx = repo.Begin();
  assert(!repo.InsertDelivery(*tx, earlier));
  tx->Rollback();
}

void VerifyRidersAndVehicles(Repository& repo, const std::string& prefix) {
  auto tx    = repo.Begin();
  auto rider = MakeRider(prefix + "-rider");
  assert(repo.UpsertRider(*tx, rider));

  auto read = repo.GetRider(*tx, rider.id);
  assert(read.has_value());
  assert(read->first_name == "Tunde");
  assert(read->status == dispatch::v1::RIDER_STATUS_ONLINE);
  assert(read->active);
  assert(!read->busy);

  rider.status = dispatch::v1::RIDER_STATUS_OFFLINE;
  assert(repo.UpsertRider(*tx, rider));
  assert(repo.GetRider(*tx, rider.id)->status == dispatch::v1::RIDER_STATUS_OFFLINE);

  assert(repo.SetRiderBusy(*tx, rider.id, true));
  assert(repo.GetRider(*tx, rider.id)->busy);
  assert(!repo.SetRiderBusy(*tx, prefix + "-ghost", true));

  VehicleRecord vehicle{prefix + "-vehicle", rider.id, dispatch::v1::VEHICLE_TYPE_BUS, "LAG-001"};
  assert(repo.UpsertVehicle(*tx, vehicle));
  vehicle.plate_number = "LAG-002";
  assert(repo.UpsertVehicle(*tx, vehicle));

  auto v = repo.GetVehicleByRider(*tx, rider.id);
  assert(v.has_value());
  assert(v->vehicle_type == dispatch::v1::VEHICLE_TYPE_BUS);
  assert(v->plate_number == "LAG-002");
  assert(!repo.GetVehicleByRider(*tx, prefix + "-ghost").has_value());

  tx->Commit();
}

void VerifyProximitySearch(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  // north of the origin by 0.001, 0.01 and 0.05 degrees
  const std::vector<std::pair<std::string, double>> seeds = {{"-far", 6.50}, {"-near", 6.451}, {"-mid", 6.46}};
  for (const auto& [suffix, latitude] : seeds) {
    auto rider = MakeRider(prefix + suffix);
    assert(repo.UpsertRider(*tx, rider));
    assert(repo.UpsertRiderLocation(*tx, {rider.id, {latitude, 3.40}, 1}));
  }
  assert(repo.UpsertRiderLocation(*tx, {prefix + "-far", {6.50, 3.40}, 2}));

  auto loc = repo.GetRiderLocation(*tx, prefix + "-far");
  assert(loc.has_value());
  assert(loc->updated_at_ms == 2);

  std::vector<std::string> found;
  for (const auto& hit : repo.FindRidersNear(*tx, {6.45, 3.40}, 2000.0)) {
    if (hit.rider_id.rfind(prefix, 0) == 0) found.push_back(hit.rider_id);
  }
  assert(found.size() == 2);
  assert(found[0] == prefix + "-near");
  assert(found[1] == prefix + "-mid");

  const auto all = repo.FindRidersNear(*tx, {6.45, 3.40}, 10000.0);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].distance_m <= all[i].distance_m);
  }

  tx->Commit();
}

void VerifyWalletAndAdminFees(Repository& repo, const std::string& prefix) {
  const auto rider = prefix + "-earner";

  {
    auto tx = repo.Begin();
    assert(!repo.GetRiderWallet(*tx, rider).has_value());
    assert(!repo.UpdateRiderWallet(*tx, {rider, 1.0}));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.InsertRiderWallet(*tx, {rider, 900.0}));
    auto wallet = repo.GetRiderWallet(*tx, rider);
    assert(wallet.has_value());
    wallet->balance += 450.0;
    assert(repo.UpdateRiderWallet(*tx, *wallet));
    assert(repo.GetRiderWallet(*tx, rider)->balance == 1350.0);

    AdminFeeRecord fee{prefix + "-REF", prefix + "-d1", rider, 100.0, dispatch::util::NowMillis()};
    assert(repo.InsertAdminFee(*tx, fee));
    auto read = repo.GetAdminFee(*tx, fee.delivery_ref_number);
    assert(read.has_value());
    assert(read->admin_fee == 100.0);
    assert(read->rider_id == rider);
    assert(!repo.GetAdminFee(*tx, prefix + "-OTHER").has_value());
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(!repo.InsertAdminFee(*tx, {prefix + "-REF", prefix + "-d1", rider, 100.0, 0}));
  tx->Rollback();
}

void VerifyNotifications(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  NotificationRecord declined{prefix + "-n1", "REF-1", prefix + "-d1", "rider-a", "customer-1", false, 1};
  NotificationRecord accepted{prefix + "-n2", "REF-1", prefix + "-d1", "rider-b", "customer-1", true, 2};
  NotificationRecord other{prefix + "-n3", "REF-2", prefix + "-d2", "rider-a", "customer-2", true, 3};
  assert(repo.InsertNotification(*tx, declined));
  assert(repo.InsertNotification(*tx, accepted));
  assert(repo.InsertNotification(*tx, other));

  auto list = repo.ListNotificationsByDelivery(*tx, prefix + "-d1");
  assert(list.size() == 2);
  std::size_t accepted_count = 0;
  for (const auto& n : list) {
    if (n.rider_availability_status) ++accepted_count;
  }
  assert(accepted_count == 1);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertDelivery(*tx, MakeDelivery(prefix + "-rolled-back", prefix, 1)));
    assert(repo.InsertRiderWallet(*tx, {prefix + "-rolled-back", 10.0}));
    tx->Rollback();
  }

  {
    // destructor rolls back an abandoned transaction
    auto tx = repo.Begin();
    assert(repo.InsertDelivery(*tx, MakeDelivery(prefix + "-abandoned", prefix, 1)));
  }

  auto check = repo.Begin();
  assert(!repo.GetDelivery(*check, prefix + "-rolled-back").has_value());
  assert(!repo.GetRiderWallet(*check, prefix + "-rolled-back").has_value());
  assert(!repo.GetDelivery(*check, prefix + "-abandoned").has_value());
  check->Commit();
}

void VerifyRunInTransaction(Repository& repo, const std::string& prefix) {
  bool threw = false;
  try {
    dispatch::db::RunInTransaction(repo, [&](dispatch::db::Transaction& tx) {
      dispatch::db::ThrowIfDbError(repo.InsertRiderWallet(tx, {prefix + "-atomic", 5.0}), "insert wallet");
      dispatch::db::ThrowIfDbError(repo.UpdateRiderWallet(tx, {prefix + "-missing", 5.0}), "update wallet");
    });
  } catch (const dispatch::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  dispatch::db::RunInTransaction(repo, [&](dispatch::db::Transaction& tx) {
    assert(!repo.GetRiderWallet(tx, prefix + "-atomic").has_value());
  });
}

void VerifyConcurrentUpdates(Repository& repo, const std::string& prefix, ParallelWrites mode) {
  const auto rider = prefix + "-contended";
  dispatch::db::RunInTransaction(repo, [&](dispatch::db::Transaction& tx) {
    dispatch::db::ThrowIfDbError(repo.InsertRiderWallet(tx, {rider, 0.0}), "seed wallet");
  });

  auto tx1 = repo.Begin();
  if (mode == ParallelWrites::kSerialized) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  auto w1  = repo.GetRiderWallet(*tx1, rider);
  auto w2  = repo.GetRiderWallet(*tx2, rider);
  assert(w1.has_value() && w2.has_value());

  w1->balance += 900.0;
  w2->balance += 450.0;
  assert(repo.UpdateRiderWallet(*tx1, *w1));
  tx1->Commit();

  assert(repo.UpdateRiderWallet(*tx2, *w2));
  if (mode == ParallelWrites::kConflict) {
    bool conflicted = false;
    try {
      tx2->Commit();
    } catch (const dispatch::util::Conflict&) {
      conflicted = true;
    }
    assert(conflicted);
  } else {
    tx2->Commit();
  }

  // retried increments both land
  dispatch::db::RunInTransaction(repo, [&](dispatch::db::Transaction& tx) {
    auto wallet = repo.GetRiderWallet(tx, rider);
    wallet->balance += 100.0;
    dispatch::db::ThrowIfDbError(repo.UpdateRiderWallet(tx, *wallet), "credit wallet");
  });

  auto verify = repo.Begin();
  auto final  = repo.GetRiderWallet(*verify, rider);
  assert(final.has_value());
  assert(final->balance == (mode == ParallelWrites::kConflict ? 1000.0 : 550.0));
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertDelivery(*tx, MakeDelivery(prefix + "-durable", prefix, 42)));
    assert(repo->UpsertRider(*tx, MakeRider(prefix + "-rider")));
    assert(repo->InsertRiderWallet(*tx, {prefix + "-rider", 77.5}));
    assert(repo->InsertAdminFee(*tx, {prefix + "-REF", prefix + "-durable", prefix + "-rider", 8.5, 42}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto d  = repo->GetDelivery(*tx, prefix + "-durable");
  assert(d.has_value());
  assert(d->created_at_ms == 42);
  assert(repo->GetRider(*tx, prefix + "-rider").has_value());
  assert(repo->GetRiderWallet(*tx, prefix + "-rider")->balance == 77.5);
  assert(repo->GetAdminFee(*tx, prefix + "-REF").has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .parallel_writes  = ParallelWrites::kConflict,
  };
}

#if DISPATCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("rider_dispatch_integration_sqlite_" + std::to_string(dispatch::util::NowMillis()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto repo = std::make_shared<dispatch::db::sqlite::SqliteRepository>(std::make_shared<dispatch::db::sqlite::SqliteDB>(db_path));
    repo->EnsureSchema();
    return repo;
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
      .parallel_writes  = ParallelWrites::kSerialized,
  };
}
#endif

#if DISPATCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DISPATCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DISPATCH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto repo = std::make_shared<dispatch::db::postgres::PgRepository>(std::make_shared<dispatch::db::postgres::PgPool>(conninfo));
    repo->EnsureSchema();
    return repo;
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .parallel_writes  = ParallelWrites::kLastWriterWins,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(dispatch::util::NowMillis());

  VerifyDeliveryLifecycle(*repo, prefix + "-delivery");
  VerifyRidersAndVehicles(*repo, prefix + "-riders");
  VerifyProximitySearch(*repo, prefix + "-near");
  VerifyWalletAndAdminFees(*repo, prefix + "-wallet");
  VerifyNotifications(*repo, prefix + "-notify");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyRunInTransaction(*repo, prefix + "-atomic");
  VerifyConcurrentUpdates(*repo, prefix + "-concurrency", backend.parallel_writes);

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DISPATCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DISPATCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "dispatch_integration_repository_parity: pass\n";
  return 0;
}
