#pragma once
#include "textcast/types.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <string>

namespace Json { class Value; }

namespace textcast {

using Millis = std::chrono::milliseconds;

struct ReceiverConfig {
    std::string app_id{"5CB45E5A"};                         // DashCast
    std::string payload_namespace{"urn:x-cast:es.offd.dashcast"};
};

struct Timeouts {
    Millis connect{10000};
    Millis launch{8000};
    Millis send{5000};
    Millis restore{3000};
    Millis query{2000};
    Millis heartbeat{5000};
    unsigned missed_heartbeats{3};
};

struct DisplayConfig {
    uint16_t port{5001};
    std::string local_address;  // empty = detect from the route to the device
};

struct CaptureConfig {
    bool enabled{true};
    std::string interface;      // empty = first capture-capable interface
    std::string file;           // replay a capture file instead of a live interface
    Millis read_timeout{250};
    std::size_t stream_capacity{4096};
};

struct AggregatorConfig {
    std::size_t recent_capacity{20};
    std::size_t batch_size{16};
    Millis batch_interval{500};
};

struct Config {
    DeviceTarget device;
    ReceiverConfig receiver;
    Timeouts timeouts;
    DisplayConfig display;
    CaptureConfig capture;
    AggregatorConfig aggregator;
    std::size_t publisher_queue_capacity{1024};
    std::string log_level{"info"};
};

// Applies a parsed JSON document over `config`. Keys that are absent keep
// their current value.
void apply_json(const Json::Value& root, Config& config, boost::system::error_code& ec);

// Environment overrides: TEXTCAST_DEVICE_HOST, TEXTCAST_DEVICE_NAME,
// TEXTCAST_LOG_LEVEL, TEXTCAST_CAPTURE_INTERFACE.
void apply_environment(Config& config);

// Defaults, then the file (if `path` is non-empty), then the environment.
// Fails with invalid_config when the file cannot be parsed or no device host
// is set.
Config load_config(const std::string& path, boost::system::error_code& ec);

} // namespace textcast
