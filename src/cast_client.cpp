#include "textcast/cast_client.hpp"
#include "textcast/cast_messages.hpp"
#include "textcast/error.hpp"
#include "textcast/log.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <array>

namespace net = boost::asio;
using tcp = net::ip::tcp;
using boost::system::error_code;

namespace textcast {

namespace {
constexpr std::chrono::milliseconds kCloseGrace{500};
} // namespace

CastClient::CastClient(std::string payload_namespace)
    : ssl_ctx_(net::ssl::context::tlsv12_client),
      resolver_(ioc_),
      payload_namespace_(std::move(payload_namespace)) {
    // Cast devices present self-signed certificates; identity would come from
    // the deviceauth exchange, not from the TLS chain.
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(net::ssl::verify_none);
}

CastClient::~CastClient() {
    close();
}

void CastClient::run_until(const bool& done, Clock::time_point deadline, error_code& ec) {
    ioc_.restart();
    while (!done) {
        auto now = Clock::now();
        if (now >= deadline) break;
        if (ioc_.run_one_for(deadline - now) == 0 && ioc_.stopped()) ioc_.restart();
    }
    if (done) return;

    // Deadline reached: cancel the pending operation and let its handler run.
    error_code ignored;
    resolver_.cancel();
    if (stream_) stream_->lowest_layer().cancel(ignored);
    ioc_.restart();
    while (!done && ioc_.run_one() > 0) {
    }
    ec = error::timeout;
}

void CastClient::ensure_open(error_code& ec) const {
    if (stream_ && open_) return;
    if (cancelled_) ec = net::error::operation_aborted;
    else ec = error::not_connected;
}

void CastClient::drop_transport() {
    open_ = false;
    if (stream_) {
        error_code ignored;
        stream_->lowest_layer().close(ignored);
    }
}

void CastClient::clear_application() {
    app_id_.clear();
    app_session_id_.clear();
    app_transport_id_.clear();
}

void CastClient::open(const DeviceTarget& target, std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    if (open_) {
        ec = error::already_connected;
        return;
    }

    ++generation_;
    cancelled_ = false;
    rx_.clear();
    clear_application();
    next_request_id_ = 1;
    stream_ = std::make_unique<ssl_socket>(ioc_, ssl_ctx_);

    const auto deadline = Clock::now() + timeout;
    bool done = false;
    error_code op_ec;

    // Step 1: resolve and connect to port 8009
    log::info("Cast") << "Connecting to " << target.host << ":" << target.port << "...";
    tcp::resolver::results_type endpoints;
    resolver_.async_resolve(target.host, std::to_string(target.port),
                            [&](const error_code& e, tcp::resolver::results_type results) {
                                op_ec = e;
                                endpoints = std::move(results);
                                done = true;
                            });
    run_until(done, deadline, ec);
    if (!ec) ec = classify_network_error(op_ec);

    if (!ec) {
        done = false;
        net::async_connect(stream_->lowest_layer(), endpoints,
                           [&](const error_code& e, const tcp::endpoint&) {
                               op_ec = e;
                               done = true;
                           });
        run_until(done, deadline, ec);
        if (!ec) ec = classify_network_error(op_ec);
    }

    // Step 2: TLS handshake
    if (!ec) {
        log::debug("Cast") << "Performing TLS handshake...";
        done = false;
        stream_->async_handshake(net::ssl::stream_base::client, [&](const error_code& e) {
            op_ec = e;
            done = true;
        });
        run_until(done, deadline, ec);
        if (!ec) ec = classify_network_error(op_ec);
    }

    if (ec) {
        log::warn("Cast") << "Connect to " << target.host << " failed: " << ec.message();
        drop_transport();
        stream_.reset();
        return;
    }
    open_ = true;
    log::info("Cast") << "TLS connection established";

    // Step 3: device auth challenge; the reply is consumed by handle_control()
    send(cast::make_auth_challenge(), deadline, ec);

    // Step 4: CONNECT to the platform receiver
    if (!ec) {
        send(cast::make_message(cast::kSenderId, cast::kReceiverId, cast::kConnectionNamespace,
                                cast::connect_payload()),
             deadline, ec);
    }
    if (ec) {
        log::warn("Cast") << "Handshake with " << target.host << " failed: " << ec.message();
        drop_transport();
        stream_.reset();
    }
}

void CastClient::send(const cast_channel::CastMessage& message, Clock::time_point deadline,
                      error_code& ec) {
    ensure_open(ec);
    if (ec) return;

    const std::string frame = cast::encode_frame(message);
    log::debug("Cast") << "Sending to " << message.namespace_() << ": " << message.payload_utf8();

    bool done = false;
    error_code op_ec;
    net::async_write(*stream_, net::buffer(frame), [&](const error_code& e, std::size_t) {
        op_ec = e;
        done = true;
    });
    run_until(done, deadline, ec);
    if (!ec) ec = classify_network_error(op_ec);

    // A partially written frame leaves the channel unusable.
    if (ec) drop_transport();
}

void CastClient::receive(cast_channel::CastMessage& message, Clock::time_point deadline,
                         error_code& ec) {
    for (;;) {
        if (rx_.size() >= cast::kFrameHeaderSize) {
            const uint32_t len =
                cast::decode_frame_length(reinterpret_cast<const unsigned char*>(rx_.data()));
            if (len == 0 || len > cast::kMaxFrameSize) {
                log::warn("Cast") << "Invalid message length: " << len;
                ec = error::protocol_error;
                drop_transport();
                return;
            }
            if (rx_.size() >= cast::kFrameHeaderSize + len) {
                std::string body = rx_.substr(cast::kFrameHeaderSize, len);
                rx_.erase(0, cast::kFrameHeaderSize + len);
                if (!cast::decode_frame_body(body, message)) {
                    log::warn("Cast") << "Failed to parse protobuf message";
                    ec = error::protocol_error;
                }
                return;
            }
        }

        ensure_open(ec);
        if (ec) return;

        std::array<char, 4096> chunk;
        std::size_t bytes_read = 0;
        bool done = false;
        error_code op_ec;
        stream_->async_read_some(net::buffer(chunk), [&](const error_code& e, std::size_t n) {
            op_ec = e;
            bytes_read = n;
            done = true;
        });
        run_until(done, deadline, ec);
        rx_.append(chunk.data(), bytes_read);
        if (ec) return;
        if (op_ec) {
            ec = classify_network_error(op_ec);
            if (ec != net::error::operation_aborted) {
                log::warn("Cast") << "Read failed: " << op_ec.message();
            }
            drop_transport();
            return;
        }
    }
}

bool CastClient::handle_control(const cast_channel::CastMessage& message, const Json::Value& payload,
                                Clock::time_point deadline, error_code& ec) {
    const std::string& ns = message.namespace_();

    if (ns == cast::kDeviceAuthNamespace) {
        cast_channel::DeviceAuthMessage auth_response;
        if (auth_response.ParseFromString(message.payload_binary())) {
            if (auth_response.has_response()) {
                log::debug("Cast") << "Device auth response received";
            } else if (auth_response.has_error()) {
                log::warn("Cast") << "Device auth error: " << auth_response.error().error_type();
            }
        }
        return true;
    }

    const std::string type = payload["type"].asString();

    if (ns == cast::kHeartbeatNamespace && type == "PING") {
        send(cast::make_message(cast::kSenderId, message.source_id(), cast::kHeartbeatNamespace,
                                cast::pong_payload()),
             deadline, ec);
        return true;
    }

    if (ns == cast::kConnectionNamespace && type == "CLOSE") {
        if (message.source_id() == cast::kReceiverId) {
            log::warn("Cast") << "Device closed the control channel";
            drop_transport();
            ec = error::connection_closed;
        } else if (message.source_id() == app_transport_id_) {
            log::info("Cast") << "Receiver application closed its channel";
            clear_application();
        }
        return true;
    }
    return false;
}

Json::Value CastClient::await(const Predicate& accept, Clock::time_point deadline, error_code& ec) {
    for (;;) {
        cast_channel::CastMessage message;
        receive(message, deadline, ec);
        if (ec) return Json::Value();

        Json::Value payload;
        if (message.payload_type() == cast_channel::CastMessage::STRING &&
            !cast::parse_payload(message, payload)) {
            log::debug("Cast") << "Ignoring unparsable payload on " << message.namespace_();
            continue;
        }
        if (handle_control(message, payload, deadline, ec)) {
            if (ec) return Json::Value();
            continue;
        }
        if (accept(payload)) return payload;
        log::debug("Cast") << "Skipping " << payload["type"].asString() << " from "
                           << message.source_id();
    }
}

Json::Value CastClient::request(const std::string& destination, const std::string& namespace_name,
                                Json::Value payload, Clock::time_point deadline, error_code& ec) {
    const int request_id = payload["requestId"].asInt();
    send(cast::make_message(cast::kSenderId, destination, namespace_name, payload), deadline, ec);
    if (ec) return Json::Value();
    return await(
        [request_id](const Json::Value& reply) {
            return reply.isMember("requestId") && reply["requestId"].asInt() == request_id;
        },
        deadline, ec);
}

std::string CastClient::launch_application(const std::string& app_id,
                                           std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    ensure_open(ec);
    if (ec) return std::string();

    const auto deadline = Clock::now() + timeout;
    const int request_id = next_request_id_++;
    log::info("Cast") << "Launching application " << app_id << "...";
    send(cast::make_message(cast::kSenderId, cast::kReceiverId, cast::kReceiverNamespace,
                            cast::launch_request(request_id, app_id)),
         deadline, ec);
    if (ec) return std::string();

    // LAUNCH_STATUS carries no session; wait for the RECEIVER_STATUS listing the app.
    std::optional<cast::ApplicationInfo> launched;
    bool rejected = false;
    await(
        [&](const Json::Value& reply) {
            const std::string type = reply["type"].asString();
            if (type == "LAUNCH_ERROR" || type == "INVALID_REQUEST") {
                rejected = !reply.isMember("requestId") || reply["requestId"].asInt() == request_id;
                if (rejected) {
                    log::warn("Cast") << "Launch rejected: " << reply["reason"].asString();
                }
                return rejected;
            }
            if (type != "RECEIVER_STATUS") return false;
            launched = cast::find_application(reply, app_id);
            return launched.has_value() && !launched->transport_id.empty();
        },
        deadline, ec);
    if (ec) return std::string();
    if (rejected) {
        ec = error::app_launch_rejected;
        return std::string();
    }

    app_id_ = launched->app_id;
    app_session_id_ = launched->session_id;
    app_transport_id_ = launched->transport_id;
    log::info("Cast") << "Application " << app_id_ << " running, sessionId=" << app_session_id_;

    // Join the application's transport so it accepts our payloads.
    send(cast::make_message(cast::kSenderId, app_transport_id_, cast::kConnectionNamespace,
                            cast::connect_payload()),
         deadline, ec);
    if (ec) {
        clear_application();
        return std::string();
    }
    return app_transport_id_;
}

void CastClient::set_payload(const std::string& url, const Params& params,
                             std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    ensure_open(ec);
    if (ec) return;
    if (app_transport_id_.empty()) {
        ec = error::not_launched;
        return;
    }

    const auto deadline = Clock::now() + timeout;
    const std::string target_url = cast::append_query(url, params);
    const int request_id = next_request_id_++;
    Json::Value payload = cast::load_url_payload(payload_namespace_, request_id, target_url);

    if (payload_namespace_ != cast::kMediaNamespace) {
        // DashCast-style receivers do not acknowledge; a completed write is the ack.
        send(cast::make_message(cast::kSenderId, app_transport_id_, payload_namespace_, payload),
             deadline, ec);
        return;
    }

    Json::Value reply = request(app_transport_id_, payload_namespace_, payload, deadline, ec);
    if (ec) return;
    if (reply["type"].asString() == "LOAD_FAILED") {
        log::warn("Cast") << "LOAD_FAILED: " << cast::to_json(reply);
        ec = error::protocol_error;
    }
}

std::optional<std::string> CastClient::query_running_application(std::chrono::milliseconds timeout,
                                                                 error_code& ec) {
    ec.clear();
    ensure_open(ec);
    if (ec) return std::nullopt;

    const auto deadline = Clock::now() + timeout;
    Json::Value status = request(cast::kReceiverId, cast::kReceiverNamespace,
                                 cast::get_status_request(next_request_id_++), deadline, ec);
    if (ec) return std::nullopt;

    auto app = cast::foreground_application(status);
    if (!app) return std::nullopt;
    log::debug("Cast") << "Running application: " << app->app_id << " (" << app->display_name << ")";
    return app->app_id;
}

void CastClient::stop_application(std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    ensure_open(ec);
    if (ec) return;
    if (app_session_id_.empty()) {
        ec = error::not_launched;
        return;
    }

    const auto deadline = Clock::now() + timeout;
    log::info("Cast") << "Stopping application " << app_id_ << "...";

    // Leave the application's transport before asking the platform to stop it.
    send(cast::make_message(cast::kSenderId, app_transport_id_, cast::kConnectionNamespace,
                            cast::close_payload()),
         deadline, ec);
    if (ec) return;
    request(cast::kReceiverId, cast::kReceiverNamespace,
            cast::stop_request(next_request_id_++, app_session_id_), deadline, ec);
    if (!ec) clear_application();
}

void CastClient::ping(std::chrono::milliseconds timeout, error_code& ec) {
    ec.clear();
    const auto deadline = Clock::now() + timeout;
    send(cast::make_message(cast::kSenderId, cast::kReceiverId, cast::kHeartbeatNamespace,
                            cast::ping_payload()),
         deadline, ec);
    if (ec) return;
    await([](const Json::Value& reply) { return reply["type"].asString() == "PONG"; }, deadline, ec);
}

void CastClient::cancel() {
    const uint64_t generation = generation_.load();
    net::post(ioc_, [this, generation] {
        if (generation != generation_.load() || !stream_) return;
        log::debug("Cast") << "Cancelling control channel operations";
        cancelled_ = true;
        drop_transport();
    });
}

void CastClient::close() {
    if (!stream_) return;

    if (open_) {
        const auto deadline = Clock::now() + kCloseGrace;
        error_code ec;
        if (!app_transport_id_.empty()) {
            send(cast::make_message(cast::kSenderId, app_transport_id_, cast::kConnectionNamespace,
                                    cast::close_payload()),
                 deadline, ec);
        }
        if (!ec) {
            send(cast::make_message(cast::kSenderId, cast::kReceiverId, cast::kConnectionNamespace,
                                    cast::close_payload()),
                 deadline, ec);
        }
        if (!ec) {
            bool done = false;
            stream_->async_shutdown([&](const error_code&) { done = true; });
            run_until(done, deadline, ec);
        }
    }

    drop_transport();
    stream_.reset();
    rx_.clear();
    clear_application();

    // Discard handlers still queued against the old transport.
    ++generation_;
    ioc_.restart();
    ioc_.poll();
    log::info("Cast") << "TLS connection closed";
}

} // namespace textcast
