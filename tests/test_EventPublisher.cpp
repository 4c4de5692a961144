// tests/test_EventPublisher.cpp
#include <gtest/gtest.h>
#include "fake_device_client.hpp"
#include "textcast/event_publisher.hpp"

#include <json/json.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace textcast {
namespace testing {

namespace {

MessageSentEvent message(const std::string& text) {
    MessageSentEvent event;
    event.session_id = 1;
    event.text = text;
    event.delivered = true;
    event.latency_ms = 12.5;
    event.timestamp = SystemClock::now();
    return event;
}

Json::Value parse_line(const std::string& line) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errs;
    EXPECT_TRUE(reader->parse(line.data(), line.data() + line.size(), &value, &errs)) << errs;
    return value;
}

// Holds the first delivery until released.
class GatedPublisher : public RecordingPublisher {
public:
    void on_message_sent(const MessageSentEvent& event) override {
        {
            std::unique_lock<std::mutex> lk(gate_mutex_);
            entered_ = true;
            gate_cv_.notify_all();
            gate_cv_.wait(lk, [this] { return open_; });
        }
        RecordingPublisher::on_message_sent(event);
    }

    bool wait_entered() {
        std::unique_lock<std::mutex> lk(gate_mutex_);
        return gate_cv_.wait_for(lk, std::chrono::seconds(5), [this] { return entered_; });
    }

    void release() {
        std::lock_guard<std::mutex> lk(gate_mutex_);
        open_ = true;
        gate_cv_.notify_all();
    }

private:
    std::mutex gate_mutex_;
    std::condition_variable gate_cv_;
    bool entered_{false};
    bool open_{false};
};

class FailingPublisher : public RecordingPublisher {
public:
    void on_session_state_changed(const SessionStateEvent&) override {
        throw std::runtime_error("not ready");
    }
};

} // namespace

TEST(QueuedPublisherTest, DeliversInOrder) {
    RecordingPublisher downstream;
    QueuedPublisher queued(downstream, 16);
    queued.start();

    queued.on_message_sent(message("one"));
    queued.on_message_sent(message("two"));
    SessionStateEvent state;
    state.state = SessionState::Active;
    queued.on_session_state_changed(state);

    ASSERT_TRUE(queued.wait_idle(std::chrono::seconds(5)));
    ASSERT_EQ(downstream.messages.size(), 2u);
    EXPECT_EQ(downstream.messages[0].text, "one");
    EXPECT_EQ(downstream.messages[1].text, "two");
    ASSERT_EQ(downstream.states.size(), 1u);
    EXPECT_EQ(queued.dropped(), 0u);
    queued.stop();
}

TEST(QueuedPublisherTest, FullQueueDropsOldest) {
    GatedPublisher downstream;
    QueuedPublisher queued(downstream, 2);
    queued.start();

    queued.on_message_sent(message("held"));
    ASSERT_TRUE(downstream.wait_entered());

    for (const char* text : {"a", "b", "c", "d"}) queued.on_message_sent(message(text));
    EXPECT_EQ(queued.dropped(), 2u);

    downstream.release();
    ASSERT_TRUE(queued.wait_idle(std::chrono::seconds(5)));
    ASSERT_EQ(downstream.messages.size(), 3u);
    EXPECT_EQ(downstream.messages[0].text, "held");
    EXPECT_EQ(downstream.messages[1].text, "c");
    EXPECT_EQ(downstream.messages[2].text, "d");
    queued.stop();
}

TEST(QueuedPublisherTest, DownstreamFailuresAreCounted) {
    FailingPublisher downstream;
    QueuedPublisher queued(downstream, 8);
    queued.start();

    EXPECT_NO_THROW(queued.on_session_state_changed(SessionStateEvent{}));
    queued.on_message_sent(message("after"));

    ASSERT_TRUE(queued.wait_idle(std::chrono::seconds(5)));
    EXPECT_EQ(queued.delivery_failures(), 1u);
    EXPECT_EQ(downstream.messages.size(), 1u);
    queued.stop();
}

TEST(QueuedPublisherTest, StopDeliversWhatIsQueued) {
    RecordingPublisher downstream;
    QueuedPublisher queued(downstream, 8);
    queued.on_message_sent(message("early"));
    queued.start();
    queued.stop();
    EXPECT_EQ(downstream.messages.size(), 1u);
}

TEST(JsonLinesSinkTest, WritesOneObjectPerLine) {
    std::ostringstream out;
    JsonLinesSink sink(out);

    sink.on_message_sent(message("Hello"));
    PacketBatchEvent batch;
    batch.session_id = 3;
    PacketRecord record;
    record.protocol = "TCP";
    record.source = "10.0.0.5";
    record.destination = "192.168.1.20";
    record.size_bytes = 66;
    batch.packets.push_back(record);
    sink.on_packet_batch(batch);

    std::istringstream in(out.str());
    std::string first, second, extra;
    ASSERT_TRUE(std::getline(in, first));
    ASSERT_TRUE(std::getline(in, second));
    EXPECT_FALSE(std::getline(in, extra));

    Json::Value sent = parse_line(first);
    EXPECT_EQ(sent["event"].asString(), "message_sent");
    EXPECT_EQ(sent["text"].asString(), "Hello");
    EXPECT_TRUE(sent["delivered"].asBool());
    EXPECT_DOUBLE_EQ(sent["latency_ms"].asDouble(), 12.5);

    Json::Value packets = parse_line(second);
    EXPECT_EQ(packets["event"].asString(), "packet_batch");
    EXPECT_EQ(packets["session_id"].asUInt64(), 3u);
    ASSERT_EQ(packets["packets"].size(), 1u);
    EXPECT_EQ(packets["packets"][0]["dest_ip"].asString(), "192.168.1.20");
    EXPECT_EQ(packets["packets"][0]["size_bytes"].asUInt(), 66u);
}

TEST(JsonLinesSinkTest, BrokenStreamThrows) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    JsonLinesSink sink(out);
    EXPECT_THROW(sink.on_message_sent(message("lost")), std::runtime_error);
}

TEST(SnapshotJsonTest, CarriesBreakdownAndRecent) {
    PacketStatsSnapshot snapshot;
    snapshot.total_packets = 3;
    snapshot.total_bytes = 300;
    snapshot.protocol_counts = {{"TCP", 2}, {"UDP", 1}};
    snapshot.recent.resize(2);
    snapshot.session_id = 4;

    Json::Value v = to_json(snapshot);
    EXPECT_EQ(v["total_packets"].asUInt64(), 3u);
    EXPECT_EQ(v["protocol_breakdown"]["TCP"].asUInt64(), 2u);
    EXPECT_EQ(v["recent_packets"].size(), 2u);
    EXPECT_EQ(v["session_id"].asUInt64(), 4u);
}

} // namespace testing
} // namespace textcast
