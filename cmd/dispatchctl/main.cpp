#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "dispatch/v1.hpp"

using namespace dispatch::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> rider <rider_id> <first_name> <last_name> [online|offline]\n"
            << "  dispatchctl <addr> vehicle <rider_id> <bike|car|bus> [plate_number]\n"
            << "  dispatchctl <addr> locate <rider_id> <lat> <lon>\n"
            << "  dispatchctl <addr> quote <from_lat> <from_lon> <to_lat> <to_lon> [bike|car|bus]\n"
            << "  dispatchctl <addr> create <customer_id> <sender_name> <from_lat> <from_lon> <to_lat> <to_lon> [bike|car|bus]\n"
            << "  dispatchctl <addr> delivery <delivery_id>\n"
            << "  dispatchctl <addr> find <customer_id>\n"
            << "  dispatchctl <addr> submit <delivery_id> <customer_id>\n"
            << "  dispatchctl <addr> respond <delivery_id> <rider_id> <customer_id> <accept|decline> [arrival_time] [match_id]\n"
            << "  dispatchctl <addr> wallet <rider_id>\n";
}

static std::optional<VehicleType> ParseVehicleType(const std::string& value) {
  if (value == "bike") {
    return VEHICLE_TYPE_BIKE;
  }
  if (value == "car") {
    return VEHICLE_TYPE_CAR;
  }
  if (value == "bus") {
    return VEHICLE_TYPE_BUS;
  }
  return std::nullopt;
}

static double ParseDouble(const char* value) {
  char*        end    = nullptr;
  const double parsed = std::strtod(value, &end);
  if (end == value || *end != '\0') {
    std::cerr << "invalid number: " << value << "\n";
    std::exit(1);
  }
  return parsed;
}

static void SetPoint(GeoPoint* point, const char* lat, const char* lon) {
  point->set_latitude(ParseDouble(lat));
  point->set_longitude(ParseDouble(lon));
}

static VehicleType VehicleArg(int argc, char** argv, int index) {
  if (argc <= index) {
    return VEHICLE_TYPE_UNSPECIFIED;
  }
  auto parsed = ParseVehicleType(argv[index]);
  if (!parsed.has_value()) {
    std::cerr << "unsupported vehicle type: " << argv[index] << "\n";
    std::exit(1);
  }
  return parsed.value();
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DispatchService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  if (cmd == "rider") {
    if (argc < 6) return 1;

    UpsertRiderRequest req;
    auto*              rider = req.mutable_rider();
    rider->set_rider_id(argv[3]);
    rider->set_first_name(argv[4]);
    rider->set_last_name(argv[5]);
    rider->set_active(true);
    rider->set_status(argc >= 7 && std::string(argv[6]) == "offline" ? RIDER_STATUS_OFFLINE : RIDER_STATUS_ONLINE);

    UpsertRiderResponse resp;
    auto                status = stub->UpsertRider(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rider=" << argv[3] << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "vehicle") {
    if (argc < 5) return 1;

    UpsertVehicleRequest req;
    req.mutable_vehicle()->set_rider_id(argv[3]);
    req.mutable_vehicle()->set_vehicle_type(VehicleArg(argc, argv, 4));
    if (argc >= 6) req.mutable_vehicle()->set_plate_number(argv[5]);

    UpsertVehicleResponse resp;
    auto                  status = stub->UpsertVehicle(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "vehicle updated\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "locate") {
    if (argc < 6) return 1;

    UpdateRiderLocationRequest req;
    req.set_rider_id(argv[3]);
    SetPoint(req.mutable_location(), argv[4], argv[5]);

    UpdateRiderLocationResponse resp;
    auto                        status = stub->UpdateRiderLocation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "location updated\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "quote") {
    if (argc < 7) return 1;

    QuoteDeliveryRequest req;
    SetPoint(req.mutable_origin(), argv[3], argv[4]);
    SetPoint(req.mutable_destination(), argv[5], argv[6]);
    req.set_vehicle_type(VehicleArg(argc, argv, 7));

    QuoteDeliveryResponse resp;
    auto                  status = stub->QuoteDelivery(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "distance_km=" << resp.distance_km() << " fee=" << resp.delivery_fee() << " eta=" << resp.estimated_delivery_time()
              << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "create") {
    if (argc < 9) return 1;

    CreateDeliveryRequest req;
    req.set_customer_id(argv[3]);
    req.set_sender_name(argv[4]);
    SetPoint(req.mutable_sender_location(), argv[5], argv[6]);
    SetPoint(req.mutable_recipient_location(), argv[7], argv[8]);
    req.set_vehicle_type(VehicleArg(argc, argv, 9));

    CreateDeliveryResponse resp;
    auto                   status = stub->CreateDelivery(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "delivery=" << resp.delivery().delivery_id() << " ref=" << resp.delivery().delivery_ref_number()
              << " fee=" << resp.delivery().delivery_fee() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "delivery") {
    if (argc < 4) return 1;

    GetDeliveryRequest req;
    req.set_delivery_id(argv[3]);

    GetDeliveryResponse resp;
    auto                status = stub->GetDelivery(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << DeliveryStatus_Name(resp.delivery().status()) << " rider=" << resp.delivery().rider_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "find") {
    if (argc < 4) return 1;

    FindRiderRequest req;
    req.set_customer_id(argv[3]);

    FindRiderResponse resp;
    auto              status = stub->FindRider(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "rider=" << resp.rider().rider_id() << " arrival_minutes=" << resp.arrival_minutes()
              << " delivery=" << resp.delivery_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "submit") {
    if (argc < 5) return 1;

    PackageRequest req;
    req.set_delivery_id(argv[3]);
    req.set_customer_id(argv[4]);

    SubmitPackageRequestResponse resp;
    auto                         status = stub->SubmitPackageRequest(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "outcome=" << SubmitOutcome_Name(resp.outcome()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "respond") {
    if (argc < 7) return 1;

    const std::string decision = argv[6];
    if (decision != "accept" && decision != "decline") {
      std::cerr << "decision must be accept or decline\n";
      return 1;
    }

    DriverResponse req;
    req.set_delivery_id(argv[3]);
    req.set_rider_id(argv[4]);
    req.set_customer_id(argv[5]);
    req.set_availability(decision == "accept");
    if (argc >= 8) req.set_arrival_time(argv[7]);
    if (argc >= 9) req.set_match_id(argv[8]);

    SendDriverResponseResponse resp;
    auto                       status = stub->SendDriverResponse(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "response sent\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "wallet") {
    if (argc < 4) return 1;

    GetRiderWalletRequest req;
    req.set_rider_id(argv[3]);

    GetRiderWalletResponse resp;
    auto                   status = stub->GetRiderWallet(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "balance=" << resp.wallet().balance() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
