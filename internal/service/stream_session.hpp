#pragma once

#include <memory>

#include "dispatch/v1.hpp"
#include "internal/registry/connection.hpp"
#include "service_context.hpp"

namespace dispatch::service {

/*
  Server side of one duplex Connect stream.

  Routes each inbound ClientEvent to the core component that owns it.
  Handler failures are observed and logged; they never end the session.
  Close() is the disconnect event and drops every identity still bound
  to this connection.
*/
class StreamSession {
 public:
  StreamSession(ServiceContext ctx, std::shared_ptr<registry::Connection> connection);

  // Returns false when the event handler failed.
  bool Handle(const dispatch::v1::ClientEvent& event);

  void Close();

 private:
  void Dispatch(const dispatch::v1::ClientEvent& event);
  void Register(const std::string& identity, const char* role);
  void SubmitPackageRequest(const dispatch::v1::PackageRequest& request);

  ServiceContext                        ctx_;
  std::shared_ptr<registry::Connection> connection_;
};

} // namespace dispatch::service
