#include "textcast/packet_aggregator.hpp"
#include "textcast/log.hpp"

#include <algorithm>

namespace textcast {

namespace {

const std::string& normalize_protocol(const std::string& tag) {
    static const std::string tcp = "TCP", udp = "UDP", icmp = "ICMP", other = "OTHER";
    if (tag == tcp) return tcp;
    if (tag == udp) return udp;
    if (tag == icmp) return icmp;
    return other;
}

} // namespace

PacketAggregator::PacketAggregator(AggregatorOptions options, EventPublisher& publisher)
    : options_(options),
      publisher_(publisher),
      recent_(options.recent_capacity),
      last_flush_(std::chrono::steady_clock::now()) {}

PacketAggregator::~PacketAggregator() {
    stop();
}

void PacketAggregator::set_session(uint64_t session_id) {
    session_id_ = session_id;
}

void PacketAggregator::ingest(PacketRecord record) {
    record.protocol = normalize_protocol(record.protocol);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ++total_packets_;
        total_bytes_ += record.size_bytes;
        ++protocol_counts_[record.protocol];
        recent_.push(record);
    }
    bool full;
    {
        std::lock_guard<std::mutex> lk(batch_mutex_);
        pending_.push_back(std::move(record));
        full = pending_.size() >= std::max<std::size_t>(options_.batch_size, 1);
    }
    if (full) flush();
}

bool PacketAggregator::flush_due() {
    std::lock_guard<std::mutex> lk(batch_mutex_);
    return std::chrono::steady_clock::now() - last_flush_ >= options_.batch_interval;
}

void PacketAggregator::flush() {
    PacketBatchEvent event;
    {
        std::lock_guard<std::mutex> lk(batch_mutex_);
        last_flush_ = std::chrono::steady_clock::now();
        if (pending_.empty()) return;
        event.packets.swap(pending_);
    }
    event.session_id = session_id_;
    try {
        publisher_.on_packet_batch(event);
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lk(mutex_);
        ++publish_failures_;
        log::debug("Aggregator") << "Dropped batch of " << event.packets.size() << ": " << e.what();
    }
}

PacketStatsSnapshot PacketAggregator::snapshot() const {
    PacketStatsSnapshot snap;
    std::lock_guard<std::mutex> lk(mutex_);
    snap.total_packets = total_packets_;
    snap.total_bytes = total_bytes_;
    snap.protocol_counts = protocol_counts_;
    snap.recent = recent_.to_vector();
    snap.session_id = session_id_;
    snap.publish_failures = publish_failures_;
    snap.stream_drops = stream_drops_;
    return snap;
}

void PacketAggregator::start(std::shared_ptr<PacketStream> stream) {
    stop();
    if (!stream) return;
    running_ = true;
    stream_ = stream;
    thread_ = std::thread(&PacketAggregator::run, this, std::move(stream));
}

void PacketAggregator::stop() {
    running_ = false;
    if (stream_) stream_->close();
    if (thread_.joinable()) thread_.join();
    stream_.reset();
}

void PacketAggregator::run(std::shared_ptr<PacketStream> stream) {
    using Clock = std::chrono::steady_clock;
    const auto poll = std::max(std::min(options_.batch_interval, std::chrono::milliseconds(100)),
                               std::chrono::milliseconds(1));
    {
        std::lock_guard<std::mutex> lk(batch_mutex_);
        last_flush_ = Clock::now();
    }

    while (!stream->finished()) {
        if (auto record = stream->pop_for(poll)) ingest(std::move(*record));
        if (flush_due()) flush();

        std::lock_guard<std::mutex> lk(mutex_);
        stream_drops_ = stream->dropped();
    }
    flush();
    running_ = false;
    log::debug("Aggregator") << "Packet stream finished";
}

} // namespace textcast
