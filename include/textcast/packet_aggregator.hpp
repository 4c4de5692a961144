#pragma once
#include "textcast/event_publisher.hpp"
#include "textcast/packet_stream.hpp"
#include "textcast/ring_buffer.hpp"
#include "textcast/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace textcast {

struct AggregatorOptions {
    std::size_t recent_capacity{20};
    std::size_t batch_size{16};
    std::chrono::milliseconds batch_interval{500};
};

// Rolling packet statistics. ingest() has a single writer (the aggregation
// thread started by start(), or the caller when driven directly); flush() and
// snapshot() may be called from anywhere.
class PacketAggregator {
public:
    PacketAggregator(AggregatorOptions options, EventPublisher& publisher);
    ~PacketAggregator();

    PacketAggregator(const PacketAggregator&) = delete;
    PacketAggregator& operator=(const PacketAggregator&) = delete;

    void ingest(PacketRecord record);
    // Publishes the pending batch now. Publisher failures are counted, not raised.
    void flush();

    // Consumes `stream` on a dedicated thread until it is closed and drained.
    void start(std::shared_ptr<PacketStream> stream);
    void stop();
    bool running() const { return running_.load(); }

    // Records are tagged with this session id until it changes.
    void set_session(uint64_t session_id);

    PacketStatsSnapshot snapshot() const;

private:
    void run(std::shared_ptr<PacketStream> stream);
    bool flush_due();

    const AggregatorOptions options_;
    EventPublisher& publisher_;

    mutable std::mutex mutex_;
    uint64_t total_packets_{0};
    uint64_t total_bytes_{0};
    std::map<std::string, uint64_t> protocol_counts_;
    RingBuffer<PacketRecord> recent_;
    uint64_t publish_failures_{0};
    uint64_t stream_drops_{0};

    std::mutex batch_mutex_;
    std::vector<PacketRecord> pending_;
    std::chrono::steady_clock::time_point last_flush_;

    std::atomic<uint64_t> session_id_{0};
    std::atomic<bool> running_{false};
    std::shared_ptr<PacketStream> stream_;
    std::thread thread_;
};

} // namespace textcast
