#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace textcast {

// The text the display page shows, shared with connection handler threads.
class DisplayText {
public:
    void set(const std::string& text);
    std::string get() const;
    uint64_t version() const;

private:
    mutable std::mutex mutex_;
    std::string text_;
    uint64_t version_{0};
};

// Minimal HTTP server for the receiver page:
//   GET /display        page that renders ?text= and polls for updates
//   GET /current-text   {"text": "...", "version": n}
class DisplayServer {
public:
    explicit DisplayServer(uint16_t port);
    ~DisplayServer();

    DisplayServer(const DisplayServer&) = delete;
    DisplayServer& operator=(const DisplayServer&) = delete;

    void start(boost::system::error_code& ec);
    // Closes the listener, then unblocks and joins every connection handler.
    void stop();

    void set_text(const std::string& text) { text_->set(text); }
    std::shared_ptr<DisplayText> shared_text() const { return text_; }

    // Bound port; differs from the requested one when that was 0.
    uint16_t port() const { return bound_port_; }
    std::string display_url(const std::string& local_address) const;

private:
    struct Connection {
        std::shared_ptr<boost::asio::ip::tcp::socket> socket;
        std::shared_ptr<std::atomic<bool>> finished;
        std::thread thread;
    };

    void do_accept();
    void add_connection(boost::asio::ip::tcp::socket sock);
    void reap_finished();

    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer accept_retry_;
    std::thread thread_;
    std::mutex connections_mutex_;
    std::list<Connection> connections_;
    std::shared_ptr<DisplayText> text_;
    uint16_t requested_port_;
    uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
};

} // namespace textcast
