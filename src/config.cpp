#include "textcast/config.hpp"
#include "textcast/error.hpp"
#include "textcast/log.hpp"

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <limits>

namespace textcast {

namespace {

void read_string(const Json::Value& obj, const char* key, std::string& out) {
    if (obj.isMember(key) && obj[key].isString()) out = obj[key].asString();
}

void read_bool(const Json::Value& obj, const char* key, bool& out) {
    if (obj.isMember(key) && obj[key].isBool()) out = obj[key].asBool();
}

template <typename T>
bool read_unsigned(const Json::Value& obj, const char* key, T& out) {
    if (!obj.isMember(key)) return true;
    if (!obj[key].isUInt64()) return false;
    const uint64_t value = obj[key].asUInt64();
    if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) return false;
    out = static_cast<T>(value);
    return true;
}

bool read_millis(const Json::Value& obj, const char* key, Millis& out) {
    auto ms = out.count();
    if (!read_unsigned(obj, key, ms)) return false;
    out = Millis(ms);
    return true;
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

void apply_json(const Json::Value& root, Config& config, boost::system::error_code& ec) {
    ec.clear();
    if (!root.isObject()) {
        ec = error::invalid_config;
        return;
    }
    bool ok = true;

    const Json::Value& device = root["device"];
    if (device.isObject()) {
        read_string(device, "host", config.device.host);
        read_string(device, "name", config.device.name);
        ok &= read_unsigned(device, "port", config.device.port);
    }

    const Json::Value& receiver = root["receiver"];
    if (receiver.isObject()) {
        read_string(receiver, "app_id", config.receiver.app_id);
        read_string(receiver, "namespace", config.receiver.payload_namespace);
    }

    const Json::Value& timeouts = root["timeouts_ms"];
    if (timeouts.isObject()) {
        ok &= read_millis(timeouts, "connect", config.timeouts.connect);
        ok &= read_millis(timeouts, "launch", config.timeouts.launch);
        ok &= read_millis(timeouts, "send", config.timeouts.send);
        ok &= read_millis(timeouts, "restore", config.timeouts.restore);
        ok &= read_millis(timeouts, "query", config.timeouts.query);
        ok &= read_millis(timeouts, "heartbeat", config.timeouts.heartbeat);
        ok &= read_unsigned(timeouts, "missed_heartbeats", config.timeouts.missed_heartbeats);
    }

    const Json::Value& display = root["display"];
    if (display.isObject()) {
        ok &= read_unsigned(display, "port", config.display.port);
        read_string(display, "local_address", config.display.local_address);
    }

    const Json::Value& capture = root["capture"];
    if (capture.isObject()) {
        read_bool(capture, "enabled", config.capture.enabled);
        read_string(capture, "interface", config.capture.interface);
        read_string(capture, "file", config.capture.file);
        ok &= read_millis(capture, "read_timeout_ms", config.capture.read_timeout);
        ok &= read_unsigned(capture, "stream_capacity", config.capture.stream_capacity);
    }

    const Json::Value& aggregator = root["aggregator"];
    if (aggregator.isObject()) {
        ok &= read_unsigned(aggregator, "recent_capacity", config.aggregator.recent_capacity);
        ok &= read_unsigned(aggregator, "batch_size", config.aggregator.batch_size);
        ok &= read_millis(aggregator, "batch_interval_ms", config.aggregator.batch_interval);
    }

    const Json::Value& publisher = root["publisher"];
    if (publisher.isObject()) {
        ok &= read_unsigned(publisher, "queue_capacity", config.publisher_queue_capacity);
    }

    const Json::Value& logging = root["log"];
    if (logging.isObject()) {
        read_string(logging, "level", config.log_level);
    }

    if (!ok || config.timeouts.missed_heartbeats == 0 || config.aggregator.recent_capacity == 0 || config.capture.stream_capacity == 0 ||
        config.publisher_queue_capacity == 0) {
        ec = error::invalid_config;
    }
}

void apply_environment(Config& config) {
    if (const char* host = env("TEXTCAST_DEVICE_HOST")) config.device.host = host;
    if (const char* name = env("TEXTCAST_DEVICE_NAME")) config.device.name = name;
    if (const char* lvl = env("TEXTCAST_LOG_LEVEL")) config.log_level = lvl;
    if (const char* ifname = env("TEXTCAST_CAPTURE_INTERFACE")) config.capture.interface = ifname;
}

Config load_config(const std::string& path, boost::system::error_code& ec) {
    ec.clear();
    Config config;

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            log::error("Config") << "Cannot open " << path;
            ec = error::invalid_config;
            return config;
        }
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;
        if (!Json::parseFromStream(builder, in, &root, &errs)) {
            log::error("Config") << "Failed to parse " << path << ": " << errs;
            ec = error::invalid_config;
            return config;
        }
        apply_json(root, config, ec);
        if (ec) {
            log::error("Config") << "Invalid values in " << path;
            return config;
        }
    }

    apply_environment(config);

    if (config.device.host.empty()) {
        log::error("Config") << "No device host configured (device.host or TEXTCAST_DEVICE_HOST)";
        ec = error::invalid_config;
    }
    return config;
}

} // namespace textcast
