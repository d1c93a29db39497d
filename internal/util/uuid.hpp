#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace dispatch::util {

/*
  UUID helpers

  Identifiers for deliveries, vehicles, queues and nodes are RFC4122 v4
  UUIDs in their canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

std::string NewId();

// "DLV-" followed by 8 upper-case hex characters.
std::string NewDeliveryRefNumber();

} // namespace dispatch::util
