#include "textcast/types.hpp"

namespace textcast {

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Idle:          return "idle";
    case SessionState::Connecting:    return "connecting";
    case SessionState::Active:        return "active";
    case SessionState::Disconnecting: return "disconnecting";
    case SessionState::Failed:        return "failed";
    }
    return "unknown";
}

bool PacketStatsSnapshot::consistent() const {
    uint64_t sum = 0;
    for (const auto& kv : protocol_counts) sum += kv.second;
    return sum == total_packets;
}

} // namespace textcast
