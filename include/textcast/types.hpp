#pragma once
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace textcast {

using SystemClock = std::chrono::system_clock;

struct DeviceTarget {
    std::string host;
    std::string name;
    uint16_t port{8009};
};

enum class SessionState {
    Idle,
    Connecting,
    Active,
    Disconnecting,
    Failed
};

const char* to_string(SessionState state);

struct Session {
    uint64_t id{0};
    DeviceTarget target;
    SessionState state{SessionState::Idle};
    std::optional<std::string> prior_app_id;
    std::optional<std::string> receiver_token;
    SystemClock::time_point started_at{};
    std::optional<SystemClock::time_point> ended_at;
};

struct SessionStatus {
    bool online{false};
    std::string device_name;
    std::string device_address;
    SessionState state{SessionState::Idle};
    uint64_t session_id{0};
    std::optional<std::string> prior_app_id;
};

struct SendResult {
    bool delivered{false};
    std::chrono::steady_clock::duration latency{};
    boost::system::error_code error;

    double latency_ms() const {
        return std::chrono::duration<double, std::milli>(latency).count();
    }
};

struct PacketRecord {
    std::string protocol;
    std::string source;
    std::string destination;
    uint32_t size_bytes{0};
    SystemClock::time_point captured_at{};
};

struct PacketStatsSnapshot {
    uint64_t total_packets{0};
    uint64_t total_bytes{0};
    std::map<std::string, uint64_t> protocol_counts;
    std::vector<PacketRecord> recent;
    uint64_t session_id{0};
    uint64_t publish_failures{0};
    uint64_t stream_drops{0};

    // Per-protocol counts add up to the packet total.
    bool consistent() const;
};

} // namespace textcast
