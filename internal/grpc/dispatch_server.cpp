#include "dispatch_server.hpp"

#include "grpc_error.hpp"
#include "internal/service/stream_session.hpp"
#include "stream_connection.hpp"

namespace dispatch::grpc {

using namespace dispatch::v1;

DispatchServer::DispatchServer(std::shared_ptr<dispatch::service::DispatchService> svc, dispatch::service::ServiceContext ctx)
    : service_(std::move(svc)), ctx_(std::move(ctx)) {
}

::grpc::Status DispatchServer::Connect(::grpc::ServerContext*, ::grpc::ServerReaderWriter<ServerEvent, ClientEvent>* stream) {
  auto                             connection = std::make_shared<StreamConnection>(stream);
  dispatch::service::StreamSession session(ctx_, connection);

  ClientEvent event;
  while (stream->Read(&event)) {
    session.Handle(event);
  }

  connection->Close();
  session.Close();
  return ::grpc::Status::OK;
}

::grpc::Status DispatchServer::FindRider(::grpc::ServerContext*, const FindRiderRequest* req, FindRiderResponse* resp) {
  try {
    *resp = service_->FindRider(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::SubmitPackageRequest(::grpc::ServerContext*, const PackageRequest* req,
                                                    SubmitPackageRequestResponse* resp) {
  try {
    *resp = service_->SubmitPackageRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::SendDriverResponse(::grpc::ServerContext*, const DriverResponse* req, SendDriverResponseResponse*) {
  try {
    service_->SendDriverResponse(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::QuoteDelivery(::grpc::ServerContext*, const QuoteDeliveryRequest* req, QuoteDeliveryResponse* resp) {
  try {
    *resp = service_->QuoteDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::CreateDelivery(::grpc::ServerContext*, const CreateDeliveryRequest* req, CreateDeliveryResponse* resp) {
  try {
    *resp = service_->CreateDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::GetDelivery(::grpc::ServerContext*, const GetDeliveryRequest* req, GetDeliveryResponse* resp) {
  try {
    *resp = service_->GetDelivery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::UpdateRiderLocation(::grpc::ServerContext*, const UpdateRiderLocationRequest* req,
                                                   UpdateRiderLocationResponse*) {
  try {
    service_->UpdateRiderLocation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::UpsertRider(::grpc::ServerContext*, const UpsertRiderRequest* req, UpsertRiderResponse*) {
  try {
    service_->UpsertRider(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::UpsertVehicle(::grpc::ServerContext*, const UpsertVehicleRequest* req, UpsertVehicleResponse*) {
  try {
    service_->UpsertVehicle(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::GetRiderWallet(::grpc::ServerContext*, const GetRiderWalletRequest* req, GetRiderWalletResponse* resp) {
  try {
    *resp = service_->GetRiderWallet(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatch::grpc
