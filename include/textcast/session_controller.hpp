#pragma once
#include "textcast/config.hpp"
#include "textcast/device_client.hpp"
#include "textcast/event_publisher.hpp"
#include "textcast/types.hpp"

#include <boost/system/error_code.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace textcast {

class DisplayText;

// Lifecycle signals shared with the observation pipeline. Only the session id
// crosses this boundary.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;
    virtual void session_started(uint64_t session_id) = 0;
    virtual void session_ended(uint64_t session_id) = 0;
};

struct ControllerOptions {
    DeviceTarget device;
    std::string receiver_app_id{"5CB45E5A"};
    std::string display_url;
    Timeouts timeouts;
    std::size_t max_text_length{1000};
    // Consecutive unanswered pings after which the device counts as gone.
    unsigned missed_heartbeat_limit{3};
};

// What the last teardown did. `restore` is empty when no relaunch was
// attempted (nothing recorded, or the recorded app was the receiver itself).
struct TeardownReport {
    uint64_t session_id{0};
    bool remote_gone{false};
    boost::system::error_code stop;
    std::optional<std::string> restored_app;
    std::optional<boost::system::error_code> restore;
};

// Owns the single live Session and the device client behind it.
//
//   Idle -> Connecting -> Active -> Disconnecting -> Idle
//   Connecting -> Failed   (attempt failed; the next connect starts over)
//   Active -> Idle         (channel lost; cleanup attempted first)
//
// connect/send_text/disconnect and the heartbeat are serialized on one
// command mutex; status() reads a separately guarded copy and never waits
// on network I/O.
class SessionController {
public:
    SessionController(ControllerOptions options, std::unique_ptr<DeviceClient> client,
                      EventPublisher& publisher, std::shared_ptr<DisplayText> display_text);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Not thread-safe; register observers before issuing commands.
    void add_observer(SessionObserver* observer);

    boost::system::error_code connect();
    SendResult send_text(const std::string& text);
    boost::system::error_code disconnect();

    SessionStatus status() const;
    SessionState state() const;
    Session session() const;
    std::optional<TeardownReport> last_teardown() const;

    // One keep-alive ping. A closed channel, or missed_heartbeat_limit
    // unanswered pings in a row, tears an Active session down to Idle.
    void check_connection();

    void start_heartbeat();
    void stop_heartbeat();

private:
    bool abort_requested() const { return abort_requested_.load(); }
    void set_state(SessionState state, const boost::system::error_code& ec = {});
    void teardown(bool remote_gone);
    void publish(const SessionStateEvent& event);
    void publish(const MessageSentEvent& event);
    void heartbeat_loop();

    const ControllerOptions options_;
    std::unique_ptr<DeviceClient> client_;
    EventPublisher& publisher_;
    std::shared_ptr<DisplayText> display_text_;
    std::vector<SessionObserver*> observers_;

    std::mutex command_mutex_;
    mutable std::mutex state_mutex_;
    Session session_;
    std::optional<TeardownReport> last_teardown_;
    std::atomic<bool> abort_requested_{false};
    uint64_t next_session_id_{0};
    unsigned missed_heartbeats_{0};

    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    bool heartbeat_running_{false};
    std::thread heartbeat_thread_;
};

} // namespace textcast
