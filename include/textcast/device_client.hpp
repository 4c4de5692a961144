#pragma once
#include "textcast/types.hpp"

#include <boost/system/error_code.hpp>
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace textcast {

// Control channel to a single display device. Every operation carries its own
// timeout and reports failure through `ec`; none of them retries.
//
// Implementations are driven from one thread at a time (the session
// controller's serialization point). Only cancel() may be called concurrently.
class DeviceClient {
public:
    using Params = std::map<std::string, std::string>;

    virtual ~DeviceClient() = default;

    // Transport + handshake. Fails with already_connected while open.
    virtual void open(const DeviceTarget& target, std::chrono::milliseconds timeout,
                      boost::system::error_code& ec) = 0;

    // Returns the launched application's session token (its transport id).
    virtual std::string launch_application(const std::string& app_id,
                                           std::chrono::milliseconds timeout,
                                           boost::system::error_code& ec) = 0;

    virtual void set_payload(const std::string& url, const Params& params,
                             std::chrono::milliseconds timeout,
                             boost::system::error_code& ec) = 0;

    // Foreground application, or nullopt when only an idle screen runs.
    virtual std::optional<std::string> query_running_application(std::chrono::milliseconds timeout,
                                                                 boost::system::error_code& ec) = 0;

    virtual void stop_application(std::chrono::milliseconds timeout,
                                  boost::system::error_code& ec) = 0;

    virtual void ping(std::chrono::milliseconds timeout, boost::system::error_code& ec) = 0;

    // Thread-safe. The in-flight operation, if any, ends with operation_aborted.
    virtual void cancel() = 0;

    // Best-effort and idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

} // namespace textcast
