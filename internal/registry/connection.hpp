#pragma once

#include <string>

#include "dispatch/v1/events.pb.h"

namespace dispatch::registry {

/*
  One live duplex session.

  Send() must be safe to call from any thread; it returns false once the
  underlying transport is gone.
*/
class Connection {
 public:
  virtual ~Connection() = default;

  virtual const std::string& Id() const = 0;

  virtual bool Send(const dispatch::v1::ServerEvent& event) = 0;
};

} // namespace dispatch::registry
