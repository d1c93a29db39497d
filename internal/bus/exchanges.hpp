#pragma once

namespace dispatch::bus {

// Fanout exchanges. All are non-durable; only package_request carries an expiration.
inline constexpr const char* kPackageRequest          = "package_request";
inline constexpr const char* kDriverResponses         = "driver_responses";
inline constexpr const char* kAssignedPackageRequests = "assigned_package_requests";

} // namespace dispatch::bus
