#pragma once

#include "dispatch/v1.hpp"
#include "service_context.hpp"

namespace dispatch::service {

/*
  Unary entry points of the dispatch service.

  Each call is observed (span, request metrics, failure log) and reports
  errors as util exceptions; the gRPC adapter maps them to status codes.
*/
class DispatchService {
 public:
  explicit DispatchService(ServiceContext ctx);

  dispatch::v1::FindRiderResponse FindRider(const dispatch::v1::FindRiderRequest& req);

  dispatch::v1::SubmitPackageRequestResponse SubmitPackageRequest(const dispatch::v1::PackageRequest& req);

  void SendDriverResponse(const dispatch::v1::DriverResponse& req);

  dispatch::v1::QuoteDeliveryResponse QuoteDelivery(const dispatch::v1::QuoteDeliveryRequest& req);

  dispatch::v1::CreateDeliveryResponse CreateDelivery(const dispatch::v1::CreateDeliveryRequest& req);

  dispatch::v1::GetDeliveryResponse GetDelivery(const dispatch::v1::GetDeliveryRequest& req);

  void UpdateRiderLocation(const dispatch::v1::UpdateRiderLocationRequest& req);

  void UpsertRider(const dispatch::v1::UpsertRiderRequest& req);

  void UpsertVehicle(const dispatch::v1::UpsertVehicleRequest& req);

  dispatch::v1::GetRiderWalletResponse GetRiderWallet(const dispatch::v1::GetRiderWalletRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatch::service
