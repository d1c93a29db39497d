#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatch/v1.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/service_context.hpp"

namespace dispatch::grpc {

class DispatchServer final : public dispatch::v1::DispatchService::Service {
 public:
  DispatchServer(std::shared_ptr<dispatch::service::DispatchService> svc, dispatch::service::ServiceContext ctx);

  ::grpc::Status Connect(::grpc::ServerContext* ctx,
                         ::grpc::ServerReaderWriter<dispatch::v1::ServerEvent, dispatch::v1::ClientEvent>* stream) override;

  ::grpc::Status FindRider(::grpc::ServerContext* ctx, const dispatch::v1::FindRiderRequest* req,
                           dispatch::v1::FindRiderResponse* resp) override;

  ::grpc::Status SubmitPackageRequest(::grpc::ServerContext* ctx, const dispatch::v1::PackageRequest* req,
                                      dispatch::v1::SubmitPackageRequestResponse* resp) override;

  ::grpc::Status SendDriverResponse(::grpc::ServerContext* ctx, const dispatch::v1::DriverResponse* req,
                                    dispatch::v1::SendDriverResponseResponse* resp) override;

  ::grpc::Status QuoteDelivery(::grpc::ServerContext* ctx, const dispatch::v1::QuoteDeliveryRequest* req,
                               dispatch::v1::QuoteDeliveryResponse* resp) override;

  ::grpc::Status CreateDelivery(::grpc::ServerContext* ctx, const dispatch::v1::CreateDeliveryRequest* req,
                                dispatch::v1::CreateDeliveryResponse* resp) override;

  ::grpc::Status GetDelivery(::grpc::ServerContext* ctx, const dispatch::v1::GetDeliveryRequest* req,
                             dispatch::v1::GetDeliveryResponse* resp) override;

  ::grpc::Status UpdateRiderLocation(::grpc::ServerContext* ctx, const dispatch::v1::UpdateRiderLocationRequest* req,
                                     dispatch::v1::UpdateRiderLocationResponse* resp) override;

  ::grpc::Status UpsertRider(::grpc::ServerContext* ctx, const dispatch::v1::UpsertRiderRequest* req,
                             dispatch::v1::UpsertRiderResponse* resp) override;

  ::grpc::Status UpsertVehicle(::grpc::ServerContext* ctx, const dispatch::v1::UpsertVehicleRequest* req,
                               dispatch::v1::UpsertVehicleResponse* resp) override;

  ::grpc::Status GetRiderWallet(::grpc::ServerContext* ctx, const dispatch::v1::GetRiderWalletRequest* req,
                                dispatch::v1::GetRiderWalletResponse* resp) override;

 private:
  std::shared_ptr<dispatch::service::DispatchService> service_;
  dispatch::service::ServiceContext                   ctx_;
};

} // namespace dispatch::grpc
