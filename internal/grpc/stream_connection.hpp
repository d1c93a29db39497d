#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>

#include "dispatch/v1.hpp"
#include "internal/registry/connection.hpp"

namespace dispatch::grpc {

using ConnectStream = ::grpc::ServerReaderWriter<dispatch::v1::ServerEvent, dispatch::v1::ClientEvent>;

/*
  Registry handle for one Connect stream.

  Writes from bus consumer threads and the stream's own reader are
  serialized; gRPC allows only one outstanding write per stream. After
  Close() every Send() fails without touching the stream, which is owned
  by the RPC handler and dies with it.
*/
class StreamConnection final : public registry::Connection {
 public:
  explicit StreamConnection(ConnectStream* stream);

  const std::string& Id() const override {
    return id_;
  }

  bool Send(const dispatch::v1::ServerEvent& event) override;

  void Close();

 private:
  std::string       id_;
  std::mutex        write_mutex_;
  ConnectStream*    stream_;
  std::atomic<bool> closed_{false};
};

} // namespace dispatch::grpc
