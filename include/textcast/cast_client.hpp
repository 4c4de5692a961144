#pragma once
#include "textcast/device_client.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include <json/json.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace cast_channel { class CastMessage; }

namespace textcast {

// Cast V2 control channel: TLS to port 8009, length-prefixed protobuf frames
// carrying JSON payloads. Blocking calls are built from asio async operations
// run on a private io_context against a deadline.
class CastClient : public DeviceClient {
public:
    explicit CastClient(std::string payload_namespace);
    ~CastClient() override;

    CastClient(const CastClient&) = delete;
    CastClient& operator=(const CastClient&) = delete;

    void open(const DeviceTarget& target, std::chrono::milliseconds timeout,
              boost::system::error_code& ec) override;
    std::string launch_application(const std::string& app_id, std::chrono::milliseconds timeout,
                                   boost::system::error_code& ec) override;
    void set_payload(const std::string& url, const Params& params,
                     std::chrono::milliseconds timeout, boost::system::error_code& ec) override;
    std::optional<std::string> query_running_application(std::chrono::milliseconds timeout,
                                                         boost::system::error_code& ec) override;
    void stop_application(std::chrono::milliseconds timeout, boost::system::error_code& ec) override;
    void ping(std::chrono::milliseconds timeout, boost::system::error_code& ec) override;
    void cancel() override;
    void close() override;
    bool is_open() const override { return open_; }

private:
    using Clock = std::chrono::steady_clock;
    using ssl_socket = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;
    using Predicate = std::function<bool(const Json::Value&)>;

    void run_until(const bool& done, Clock::time_point deadline, boost::system::error_code& ec);
    void ensure_open(boost::system::error_code& ec) const;
    void send(const cast_channel::CastMessage& message, Clock::time_point deadline,
              boost::system::error_code& ec);
    void receive(cast_channel::CastMessage& message, Clock::time_point deadline,
                 boost::system::error_code& ec);
    Json::Value await(const Predicate& accept, Clock::time_point deadline,
                      boost::system::error_code& ec);
    Json::Value request(const std::string& destination, const std::string& namespace_name,
                        Json::Value payload, Clock::time_point deadline,
                        boost::system::error_code& ec);
    bool handle_control(const cast_channel::CastMessage& message, const Json::Value& payload,
                        Clock::time_point deadline, boost::system::error_code& ec);
    void drop_transport();
    void clear_application();

    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    std::unique_ptr<ssl_socket> stream_;
    std::string rx_;

    std::string payload_namespace_;
    std::string app_id_;
    std::string app_session_id_;
    std::string app_transport_id_;
    int next_request_id_{1};

    bool open_{false};
    bool cancelled_{false};
    std::atomic<uint64_t> generation_{0};
};

} // namespace textcast
