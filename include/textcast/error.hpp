#pragma once
#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace textcast {

// Stable failure kinds reported by every textcast operation.
enum class error {
    network_unreachable = 1,
    timeout,
    refused,
    app_launch_rejected,
    already_connecting,
    already_active,
    already_connected,
    not_connected,
    not_launched,
    capture_unavailable,
    connection_closed,
    protocol_error,
    invalid_text,
    invalid_config
};

const boost::system::error_category& textcast_category() noexcept;

boost::system::error_code make_error_code(error e) noexcept;

// Short stable name ("timeout", "already_active", ...) used in events and logs.
const char* error_name(const boost::system::error_code& ec);

// Folds asio/system errors into the textcast taxonomy. Codes that are already
// textcast errors, success and operation_aborted pass through unchanged.
boost::system::error_code classify_network_error(const boost::system::error_code& ec);

} // namespace textcast

namespace boost {
namespace system {

template <>
struct is_error_code_enum<textcast::error> : std::true_type {};

} // namespace system
} // namespace boost
