#include "stream_connection.hpp"

#include "internal/util/uuid.hpp"

namespace dispatch::grpc {

StreamConnection::StreamConnection(ConnectStream* stream) : id_(util::NewId()), stream_(stream) {
}

bool StreamConnection::Send(const dispatch::v1::ServerEvent& event) {
  std::lock_guard lock(write_mutex_);
  if (closed_) {
    return false;
  }
  return stream_->Write(event);
}

void StreamConnection::Close() {
  std::lock_guard lock(write_mutex_);
  closed_ = true;
}

} // namespace dispatch::grpc
