#include "textcast/error.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>

namespace textcast {

namespace {

class textcast_error_category : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "textcast"; }

    std::string message(int value) const override {
        switch (static_cast<error>(value)) {
        case error::network_unreachable: return "Device network unreachable";
        case error::timeout:             return "Operation timed out";
        case error::refused:             return "Connection refused by device";
        case error::app_launch_rejected: return "Device rejected application launch";
        case error::already_connecting:  return "A connect attempt is already in progress";
        case error::already_active:      return "A session is already active";
        case error::already_connected:   return "Control channel already open";
        case error::not_connected:       return "No active session";
        case error::not_launched:        return "Receiver application not launched";
        case error::capture_unavailable: return "Packet capture unavailable";
        case error::connection_closed:   return "Control channel closed by device";
        case error::protocol_error:      return "Malformed control message";
        case error::invalid_text:        return "Text is empty or too long";
        case error::invalid_config:      return "Invalid configuration";
        }
        return "Unknown textcast error";
    }
};

} // namespace

const boost::system::error_category& textcast_category() noexcept {
    static const textcast_error_category category;
    return category;
}

boost::system::error_code make_error_code(error e) noexcept {
    return boost::system::error_code(static_cast<int>(e), textcast_category());
}

const char* error_name(const boost::system::error_code& ec) {
    if (!ec) return "ok";
    if (ec == boost::asio::error::operation_aborted) return "aborted";
    if (ec.category() != textcast_category()) return "system";
    switch (static_cast<error>(ec.value())) {
    case error::network_unreachable: return "network_unreachable";
    case error::timeout:             return "timeout";
    case error::refused:             return "refused";
    case error::app_launch_rejected: return "app_launch_rejected";
    case error::already_connecting:  return "already_connecting";
    case error::already_active:      return "already_active";
    case error::already_connected:   return "already_connected";
    case error::not_connected:       return "not_connected";
    case error::not_launched:        return "not_launched";
    case error::capture_unavailable: return "capture_unavailable";
    case error::connection_closed:   return "connection_closed";
    case error::protocol_error:      return "protocol_error";
    case error::invalid_text:        return "invalid_text";
    case error::invalid_config:      return "invalid_config";
    }
    return "unknown";
}

boost::system::error_code classify_network_error(const boost::system::error_code& ec) {
    namespace aerr = boost::asio::error;
    if (!ec || ec.category() == textcast_category() || ec == aerr::operation_aborted) {
        return ec;
    }
    if (ec == aerr::host_not_found || ec == aerr::host_not_found_try_again ||
        ec == aerr::network_unreachable || ec == aerr::host_unreachable ||
        ec == aerr::network_down || ec == aerr::no_data) {
        return error::network_unreachable;
    }
    if (ec == aerr::connection_refused) return error::refused;
    if (ec == aerr::timed_out) return error::timeout;
    if (ec == aerr::eof || ec == aerr::connection_reset || ec == aerr::broken_pipe ||
        ec == aerr::connection_aborted || ec == aerr::not_connected ||
        ec == boost::asio::ssl::error::stream_truncated) {
        return error::connection_closed;
    }
    return error::protocol_error;
}

} // namespace textcast
