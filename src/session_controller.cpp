#include "textcast/session_controller.hpp"
#include "textcast/display_server.hpp"
#include "textcast/error.hpp"
#include "textcast/log.hpp"

#include <boost/asio/error.hpp>

#include <algorithm>
#include <cctype>

using boost::system::error_code;

namespace textcast {

namespace {

bool blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// Never restored on disconnect.
constexpr const char* kDefaultMediaReceiver = "CC1AD845";

std::string preview(const std::string& text) {
    return text.size() > 60 ? text.substr(0, 60) + "..." : text;
}

} // namespace

SessionController::SessionController(ControllerOptions options, std::unique_ptr<DeviceClient> client,
                                     EventPublisher& publisher,
                                     std::shared_ptr<DisplayText> display_text)
    : options_(std::move(options)),
      client_(std::move(client)),
      publisher_(publisher),
      display_text_(std::move(display_text)) {
    session_.target = options_.device;
}

SessionController::~SessionController() {
    stop_heartbeat();
    const SessionState s = state();
    if (s == SessionState::Active || s == SessionState::Connecting) {
        error_code ec = disconnect();
        if (ec) log::warn("Session") << "Disconnect on shutdown: " << ec.message();
    }
}

void SessionController::add_observer(SessionObserver* observer) {
    if (observer) observers_.push_back(observer);
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return session_.state;
}

Session SessionController::session() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return session_;
}

std::optional<TeardownReport> SessionController::last_teardown() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    return last_teardown_;
}

SessionStatus SessionController::status() const {
    std::lock_guard<std::mutex> lk(state_mutex_);
    SessionStatus status;
    status.online = session_.state == SessionState::Active;
    status.device_name = options_.device.name;
    status.device_address = options_.device.host;
    status.state = session_.state;
    status.session_id = session_.id;
    status.prior_app_id = session_.prior_app_id;
    return status;
}

void SessionController::set_state(SessionState next, const error_code& ec) {
    SessionStateEvent event;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        session_.state = next;
        if (next == SessionState::Idle || next == SessionState::Failed) {
            session_.ended_at = SystemClock::now();
        }
        event.session_id = session_.id;
    }
    event.state = next;
    if (ec) event.error = error_name(ec);
    event.timestamp = SystemClock::now();
    log::debug("Session") << "Session " << event.session_id << " -> " << to_string(next);
    publish(event);
}

void SessionController::publish(const SessionStateEvent& event) {
    try {
        publisher_.on_session_state_changed(event);
    } catch (const std::exception& e) {
        log::debug("Session") << "State event not published: " << e.what();
    }
}

void SessionController::publish(const MessageSentEvent& event) {
    try {
        publisher_.on_message_sent(event);
    } catch (const std::exception& e) {
        log::debug("Session") << "Message event not published: " << e.what();
    }
}

error_code SessionController::connect() {
    // Reject early so a second connect does not queue behind a slow one.
    switch (state()) {
    case SessionState::Connecting: return error::already_connecting;
    case SessionState::Active:
    case SessionState::Disconnecting: return error::already_active;
    default: break;
    }

    std::lock_guard<std::mutex> command(command_mutex_);
    switch (state()) {
    case SessionState::Connecting: return error::already_connecting;
    case SessionState::Active:
    case SessionState::Disconnecting: return error::already_active;
    default: break;
    }

    abort_requested_ = false;
    missed_heartbeats_ = 0;
    uint64_t session_id = ++next_session_id_;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        session_ = Session{};
        session_.id = session_id;
        session_.target = options_.device;
        session_.started_at = SystemClock::now();
    }
    set_state(SessionState::Connecting);
    log::info("Session") << "Connecting to " << options_.device.name << " @ "
                         << options_.device.host << " (session " << session_id << ")";

    const Timeouts& t = options_.timeouts;
    error_code ec;

    // Step 1: control channel
    client_->open(options_.device, t.connect, ec);

    // Step 2: remember what was running so disconnect can bring it back
    if (!ec && !abort_requested()) {
        error_code query_ec;
        auto running = client_->query_running_application(t.query, query_ec);
        if (query_ec) {
            log::warn("Session") << "Could not read running application (" << query_ec.message()
                                 << "); nothing will be restored";
        } else if (running && *running != options_.receiver_app_id &&
                   *running != kDefaultMediaReceiver) {
            log::info("Session") << "Captured previous application to restore later: " << *running;
            std::lock_guard<std::mutex> lk(state_mutex_);
            session_.prior_app_id = running;
        }
    }

    // Step 3: launch the receiver
    std::string token;
    if (!ec && !abort_requested()) {
        token = client_->launch_application(options_.receiver_app_id, t.launch, ec);
    }

    // Step 4: point it at the display page
    if (!ec && !abort_requested()) {
        if (display_text_) display_text_->set(std::string());
        client_->set_payload(options_.display_url, DeviceClient::Params{}, t.send, ec);
    }

    if (abort_requested()) {
        log::info("Session") << "Connect abandoned for session " << session_id;
        client_->close();
        set_state(SessionState::Idle);
        return boost::asio::error::operation_aborted;
    }
    if (ec) {
        log::error("Session") << "Connect failed: " << ec.message();
        client_->close();
        set_state(SessionState::Failed, ec);
        return ec;
    }

    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        session_.receiver_token = token;
    }
    set_state(SessionState::Active);
    log::info("Session") << "Receiver " << options_.receiver_app_id << " is showing "
                         << options_.display_url;
    for (auto* observer : observers_) observer->session_started(session_id);
    return error_code();
}

SendResult SessionController::send_text(const std::string& text) {
    SendResult result;
    if (blank(text) || text.size() > options_.max_text_length) {
        result.error = error::invalid_text;
        return result;
    }

    std::lock_guard<std::mutex> command(command_mutex_);
    if (state() != SessionState::Active) {
        result.error = error::not_connected;
        return result;
    }

    error_code ec;
    const auto start = std::chrono::steady_clock::now();
    client_->set_payload(options_.display_url, DeviceClient::Params{{"text", text}},
                         options_.timeouts.send, ec);
    result.latency = std::chrono::steady_clock::now() - start;
    result.delivered = !ec;
    result.error = ec;

    if (result.delivered) {
        if (display_text_) display_text_->set(text);
        log::info("Session") << "Text sent: \"" << preview(text) << "\" (latency=" << result.latency_ms()
                             << "ms)";
    } else {
        log::warn("Session") << "Send failed: " << ec.message();
    }

    MessageSentEvent event;
    event.session_id = session().id;
    event.text = text;
    event.delivered = result.delivered;
    event.latency_ms = result.latency_ms();
    if (ec) event.error = error_name(ec);
    event.timestamp = SystemClock::now();
    publish(event);
    return result;
}

error_code SessionController::disconnect() {
    const SessionState observed = state();
    if (observed == SessionState::Connecting) {
        // Unblock the in-flight connect; it sees the flag and abandons.
        abort_requested_ = true;
        client_->cancel();
    }

    std::lock_guard<std::mutex> command(command_mutex_);
    abort_requested_ = false;

    switch (state()) {
    case SessionState::Active:
    case SessionState::Connecting:
        teardown(false);
        return error_code();
    case SessionState::Failed:
        if (observed == SessionState::Connecting) {
            // The attempt we meant to cancel failed on its own first.
            set_state(SessionState::Idle);
            return error_code();
        }
        return error::not_connected;
    default:
        return observed == SessionState::Connecting ? error_code() : error_code(error::not_connected);
    }
}

void SessionController::teardown(bool remote_gone) {
    TeardownReport report;
    std::optional<std::string> prior;
    bool was_active = false;
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        report.session_id = session_.id;
        prior = session_.prior_app_id;
        was_active = session_.state == SessionState::Active;
    }
    report.remote_gone = remote_gone;

    set_state(SessionState::Disconnecting);
    if (was_active) {
        for (auto* observer : observers_) observer->session_ended(report.session_id);
    }

    const auto restore_timeout = options_.timeouts.restore;

    // (a) stop the receiver
    log::info("Session") << "Stopping receiver " << options_.receiver_app_id << "...";
    client_->stop_application(restore_timeout, report.stop);
    if (report.stop) log::warn("Session") << "Stop receiver failed: " << report.stop.message();

    // (b) bring back what was running before
    if (prior && *prior != options_.receiver_app_id) {
        log::info("Session") << "Attempting to restore previous application: " << *prior;
        error_code restore_ec;
        client_->launch_application(*prior, restore_timeout, restore_ec);
        if (restore_ec) {
            log::warn("Session") << "Restoration failed: " << restore_ec.message();
        }
        report.restored_app = prior;
        report.restore = restore_ec;
    }

    // (c) release the channel
    client_->close();

    if (display_text_) display_text_->set(std::string());
    {
        std::lock_guard<std::mutex> lk(state_mutex_);
        last_teardown_ = report;
    }
    set_state(SessionState::Idle);
    log::info("Session") << "Session " << report.session_id << " closed";
}

void SessionController::check_connection() {
    std::unique_lock<std::mutex> command(command_mutex_, std::try_to_lock);
    if (!command.owns_lock() || state() != SessionState::Active) return;

    error_code ec;
    client_->ping(options_.timeouts.query, ec);
    if (!ec) {
        missed_heartbeats_ = 0;
        return;
    }

    if (ec == error::connection_closed || !client_->is_open()) {
        log::warn("Session") << "Control channel lost (" << ec.message() << "), cleaning up";
        teardown(true);
    } else if (++missed_heartbeats_ >= options_.missed_heartbeat_limit) {
        log::warn("Session") << "No heartbeat reply " << missed_heartbeats_
                             << " times in a row, cleaning up";
        teardown(true);
    } else {
        log::debug("Session") << "Heartbeat failed: " << ec.message() << " (" << missed_heartbeats_
                              << " missed)";
    }
}

void SessionController::start_heartbeat() {
    std::lock_guard<std::mutex> lk(heartbeat_mutex_);
    if (heartbeat_running_) return;
    heartbeat_running_ = true;
    heartbeat_thread_ = std::thread(&SessionController::heartbeat_loop, this);
}

void SessionController::stop_heartbeat() {
    {
        std::lock_guard<std::mutex> lk(heartbeat_mutex_);
        if (!heartbeat_running_) return;
        heartbeat_running_ = false;
    }
    heartbeat_cv_.notify_all();
    if (heartbeat_thread_.joinable()) heartbeat_thread_.join();
}

void SessionController::heartbeat_loop() {
    std::unique_lock<std::mutex> lk(heartbeat_mutex_);
    while (heartbeat_running_) {
        heartbeat_cv_.wait_for(lk, options_.timeouts.heartbeat, [this] { return !heartbeat_running_; });
        if (!heartbeat_running_) break;
        lk.unlock();
        check_connection();
        lk.lock();
    }
}

} // namespace textcast
