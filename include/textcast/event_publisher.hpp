#pragma once
#include "textcast/types.hpp"

#include <json/json.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace textcast {

struct MessageSentEvent {
    uint64_t session_id{0};
    std::string text;
    bool delivered{false};
    double latency_ms{0.0};
    std::string error;
    SystemClock::time_point timestamp{};
};

struct PacketBatchEvent {
    uint64_t session_id{0};
    std::vector<PacketRecord> packets;
};

struct SessionStateEvent {
    uint64_t session_id{0};
    SessionState state{SessionState::Idle};
    std::string error;
    SystemClock::time_point timestamp{};
};

// Outbound events. Fire-and-forget: callers never wait for delivery, and an
// implementation may throw to signal that downstream is not ready.
class EventPublisher {
public:
    virtual ~EventPublisher() = default;

    virtual void on_message_sent(const MessageSentEvent& event) = 0;
    virtual void on_packet_batch(const PacketBatchEvent& event) = 0;
    virtual void on_session_state_changed(const SessionStateEvent& event) = 0;
};

Json::Value to_json(const MessageSentEvent& event);
Json::Value to_json(const PacketBatchEvent& event);
Json::Value to_json(const SessionStateEvent& event);
Json::Value to_json(const PacketRecord& record);
Json::Value to_json(const PacketStatsSnapshot& snapshot);

// Writes one compact JSON object per event and line.
class JsonLinesSink : public EventPublisher {
public:
    explicit JsonLinesSink(std::ostream& out) : out_(out) {}

    void on_message_sent(const MessageSentEvent& event) override;
    void on_packet_batch(const PacketBatchEvent& event) override;
    void on_session_state_changed(const SessionStateEvent& event) override;

private:
    void write(const Json::Value& value);

    std::mutex mutex_;
    std::ostream& out_;
};

// Decouples producers from a downstream publisher. Events are queued and
// delivered on a dispatch thread; a full queue drops its oldest event, so
// producers never block on a slow or absent subscriber.
class QueuedPublisher : public EventPublisher {
public:
    QueuedPublisher(EventPublisher& downstream, std::size_t capacity);
    ~QueuedPublisher() override;

    QueuedPublisher(const QueuedPublisher&) = delete;
    QueuedPublisher& operator=(const QueuedPublisher&) = delete;

    void start();
    // Delivers what is still queued, then joins the dispatch thread.
    void stop();

    void on_message_sent(const MessageSentEvent& event) override;
    void on_packet_batch(const PacketBatchEvent& event) override;
    void on_session_state_changed(const SessionStateEvent& event) override;

    // Blocks until the queue is drained and nothing is being delivered.
    bool wait_idle(std::chrono::milliseconds timeout);

    uint64_t dropped() const;
    uint64_t delivery_failures() const;

private:
    using Event = std::variant<MessageSentEvent, PacketBatchEvent, SessionStateEvent>;

    void enqueue(Event event);
    void dispatch_loop();
    void deliver(const Event& event);

    EventPublisher& downstream_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Event> queue_;
    bool running_{false};
    bool busy_{false};
    uint64_t dropped_{0};
    uint64_t delivery_failures_{0};
    std::thread thread_;
};

} // namespace textcast
