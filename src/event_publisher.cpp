#include "textcast/event_publisher.hpp"
#include "textcast/log.hpp"

#include <stdexcept>

namespace textcast {

namespace {

double epoch_seconds(SystemClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace

Json::Value to_json(const PacketRecord& record) {
    Json::Value v;
    v["protocol"] = record.protocol;
    v["source_ip"] = record.source;
    v["dest_ip"] = record.destination;
    v["size_bytes"] = record.size_bytes;
    v["timestamp"] = epoch_seconds(record.captured_at);
    return v;
}

Json::Value to_json(const MessageSentEvent& event) {
    Json::Value v;
    v["event"] = "message_sent";
    v["session_id"] = static_cast<Json::UInt64>(event.session_id);
    v["text"] = event.text;
    v["delivered"] = event.delivered;
    v["latency_ms"] = event.latency_ms;
    if (!event.error.empty()) v["error"] = event.error;
    v["timestamp"] = epoch_seconds(event.timestamp);
    return v;
}

Json::Value to_json(const PacketBatchEvent& event) {
    Json::Value v;
    v["event"] = "packet_batch";
    v["session_id"] = static_cast<Json::UInt64>(event.session_id);
    Json::Value packets(Json::arrayValue);
    for (const auto& record : event.packets) packets.append(to_json(record));
    v["packets"] = packets;
    return v;
}

Json::Value to_json(const SessionStateEvent& event) {
    Json::Value v;
    v["event"] = "session_state";
    v["session_id"] = static_cast<Json::UInt64>(event.session_id);
    v["state"] = to_string(event.state);
    if (!event.error.empty()) v["error"] = event.error;
    v["timestamp"] = epoch_seconds(event.timestamp);
    return v;
}

Json::Value to_json(const PacketStatsSnapshot& snapshot) {
    Json::Value v;
    v["session_id"] = static_cast<Json::UInt64>(snapshot.session_id);
    v["total_packets"] = static_cast<Json::UInt64>(snapshot.total_packets);
    v["total_bytes"] = static_cast<Json::UInt64>(snapshot.total_bytes);
    Json::Value breakdown(Json::objectValue);
    for (const auto& kv : snapshot.protocol_counts) {
        breakdown[kv.first] = static_cast<Json::UInt64>(kv.second);
    }
    v["protocol_breakdown"] = breakdown;
    Json::Value recent(Json::arrayValue);
    for (const auto& record : snapshot.recent) recent.append(to_json(record));
    v["recent_packets"] = recent;
    v["publish_failures"] = static_cast<Json::UInt64>(snapshot.publish_failures);
    v["stream_drops"] = static_cast<Json::UInt64>(snapshot.stream_drops);
    return v;
}

// --- JsonLinesSink ---------------------------------------------------------

void JsonLinesSink::write(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::lock_guard<std::mutex> lk(mutex_);
    out_ << Json::writeString(builder, value) << "\n";
    out_.flush();
    if (!out_) throw std::runtime_error("event stream not writable");
}

void JsonLinesSink::on_message_sent(const MessageSentEvent& event) { write(to_json(event)); }
void JsonLinesSink::on_packet_batch(const PacketBatchEvent& event) { write(to_json(event)); }
void JsonLinesSink::on_session_state_changed(const SessionStateEvent& event) { write(to_json(event)); }

// --- QueuedPublisher -------------------------------------------------------

QueuedPublisher::QueuedPublisher(EventPublisher& downstream, std::size_t capacity)
    : downstream_(downstream), capacity_(capacity == 0 ? 1 : capacity) {}

QueuedPublisher::~QueuedPublisher() {
    stop();
}

void QueuedPublisher::start() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&QueuedPublisher::dispatch_loop, this);
}

void QueuedPublisher::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void QueuedPublisher::on_message_sent(const MessageSentEvent& event) { enqueue(event); }
void QueuedPublisher::on_packet_batch(const PacketBatchEvent& event) { enqueue(event); }
void QueuedPublisher::on_session_state_changed(const SessionStateEvent& event) { enqueue(event); }

void QueuedPublisher::enqueue(Event event) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void QueuedPublisher::dispatch_loop() {
    std::unique_lock<std::mutex> lk(mutex_);
    for (;;) {
        cv_.wait(lk, [this] { return !queue_.empty() || !running_; });
        if (queue_.empty()) break;  // stopped and drained

        Event event = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lk.unlock();
        deliver(event);
        lk.lock();
        busy_ = false;
        if (queue_.empty()) idle_cv_.notify_all();
    }
    idle_cv_.notify_all();
}

void QueuedPublisher::deliver(const Event& event) {
    try {
        if (auto* sent = std::get_if<MessageSentEvent>(&event)) {
            downstream_.on_message_sent(*sent);
        } else if (auto* batch = std::get_if<PacketBatchEvent>(&event)) {
            downstream_.on_packet_batch(*batch);
        } else if (auto* state = std::get_if<SessionStateEvent>(&event)) {
            downstream_.on_session_state_changed(*state);
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lk(mutex_);
        ++delivery_failures_;
        log::debug("Publish") << "Delivery failed: " << e.what();
    }
}

bool QueuedPublisher::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex_);
    return idle_cv_.wait_for(lk, timeout, [this] { return queue_.empty() && !busy_; });
}

uint64_t QueuedPublisher::dropped() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return dropped_;
}

uint64_t QueuedPublisher::delivery_failures() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return delivery_failures_;
}

} // namespace textcast
