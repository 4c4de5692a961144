#pragma once
#include "textcast/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace textcast {

// Bounded, ordered hand-off between the capture thread and the aggregator.
// push() never blocks: a full stream drops the new record and counts it.
class PacketStream {
public:
    explicit PacketStream(std::size_t capacity);

    PacketStream(const PacketStream&) = delete;
    PacketStream& operator=(const PacketStream&) = delete;

    bool push(PacketRecord record);

    // Next record in capture order; nullopt on timeout or once closed and empty.
    std::optional<PacketRecord> pop_for(std::chrono::milliseconds timeout);

    void close();
    // Closed and nothing left to pop.
    bool finished() const;

    uint64_t dropped() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PacketRecord> queue_;
    bool closed_{false};
    uint64_t dropped_{0};
};

} // namespace textcast
