#include "textcast/packet_stream.hpp"

namespace textcast {

PacketStream::PacketStream(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool PacketStream::push(PacketRecord record) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_) return false;
        if (queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push_back(std::move(record));
    }
    cv_.notify_one();
    return true;
}

std::optional<PacketRecord> PacketStream::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait_for(lk, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    PacketRecord record = std::move(queue_.front());
    queue_.pop_front();
    return record;
}

void PacketStream::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PacketStream::finished() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_ && queue_.empty();
}

uint64_t PacketStream::dropped() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dropped_;
}

} // namespace textcast
