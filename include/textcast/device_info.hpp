#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace textcast {

// Address of the local interface that routes to `device_host`; this is the
// address the device must use to reach the display server. Returns an empty
// string when no route can be found.
std::string detect_local_address(const std::string& device_host, uint16_t device_port);

// Friendly name reported by the device's setup endpoint
// (http://<host>:8008/setup/eureka_info). Empty on any failure.
std::string probe_friendly_name(const std::string& device_host, std::chrono::milliseconds timeout);

} // namespace textcast
