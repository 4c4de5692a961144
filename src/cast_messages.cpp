#include "textcast/cast_messages.hpp"

#include <arpa/inet.h>

#include <cctype>
#include <cstring>
#include <memory>
#include <sstream>

namespace textcast {
namespace cast {

cast_channel::CastMessage make_message(const std::string& source_id,
                                       const std::string& destination_id,
                                       const std::string& namespace_name,
                                       const Json::Value& payload) {
    cast_channel::CastMessage message;
    message.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
    message.set_source_id(source_id);
    message.set_destination_id(destination_id);
    message.set_namespace_(namespace_name);
    message.set_payload_type(cast_channel::CastMessage::STRING);
    message.set_payload_utf8(to_json(payload));
    return message;
}

cast_channel::CastMessage make_auth_challenge() {
    cast_channel::DeviceAuthMessage auth_msg;
    auth_msg.mutable_challenge();

    std::string auth_data;
    auth_msg.SerializeToString(&auth_data);

    cast_channel::CastMessage message;
    message.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
    message.set_source_id(kSenderId);
    message.set_destination_id(kReceiverId);
    message.set_namespace_(kDeviceAuthNamespace);
    message.set_payload_type(cast_channel::CastMessage::BINARY);
    message.set_payload_binary(auth_data);
    return message;
}

std::string encode_frame(const cast_channel::CastMessage& message) {
    std::string serialized;
    message.SerializeToString(&serialized);

    uint32_t len = htonl(static_cast<uint32_t>(serialized.size()));
    std::string frame;
    frame.reserve(kFrameHeaderSize + serialized.size());
    frame.append(reinterpret_cast<const char*>(&len), kFrameHeaderSize);
    frame.append(serialized);
    return frame;
}

uint32_t decode_frame_length(const unsigned char* header) {
    uint32_t len_network;
    std::memcpy(&len_network, header, kFrameHeaderSize);
    return ntohl(len_network);
}

bool decode_frame_body(const std::string& body, cast_channel::CastMessage& message) {
    return message.ParseFromString(body);
}

bool parse_payload(const cast_channel::CastMessage& message, Json::Value& payload) {
    if (message.payload_type() != cast_channel::CastMessage::STRING) return false;
    const std::string& text = message.payload_utf8();

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    return reader->parse(text.data(), text.data() + text.size(), &payload, &errs) &&
           payload.isObject();
}

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value connect_payload() {
    Json::Value payload;
    payload["type"] = "CONNECT";
    return payload;
}

Json::Value close_payload() {
    Json::Value payload;
    payload["type"] = "CLOSE";
    return payload;
}

Json::Value ping_payload() {
    Json::Value payload;
    payload["type"] = "PING";
    return payload;
}

Json::Value pong_payload() {
    Json::Value payload;
    payload["type"] = "PONG";
    return payload;
}

Json::Value launch_request(int request_id, const std::string& app_id) {
    Json::Value payload;
    payload["type"] = "LAUNCH";
    payload["requestId"] = request_id;
    payload["appId"] = app_id;
    return payload;
}

Json::Value get_status_request(int request_id) {
    Json::Value payload;
    payload["type"] = "GET_STATUS";
    payload["requestId"] = request_id;
    return payload;
}

Json::Value stop_request(int request_id, const std::string& session_id) {
    Json::Value payload;
    payload["type"] = "STOP";
    payload["requestId"] = request_id;
    payload["sessionId"] = session_id;
    return payload;
}

Json::Value load_url_payload(const std::string& namespace_name, int request_id,
                             const std::string& url) {
    Json::Value payload;
    if (namespace_name == kMediaNamespace) {
        payload["type"] = "LOAD";
        payload["requestId"] = request_id;
        payload["autoplay"] = true;
        payload["media"]["contentId"] = url;
        payload["media"]["contentType"] = "text/html";
        payload["media"]["streamType"] = "LIVE";
        return payload;
    }
    // DashCast: force replaces whatever page is loaded, no periodic reload.
    payload["url"] = url;
    payload["force"] = true;
    payload["reload"] = false;
    payload["reload_time"] = 0;
    return payload;
}

std::vector<ApplicationInfo> parse_applications(const Json::Value& receiver_status) {
    std::vector<ApplicationInfo> apps;
    const Json::Value& list = receiver_status["status"]["applications"];
    if (!list.isArray()) return apps;

    for (const auto& entry : list) {
        if (!entry.isObject()) continue;
        ApplicationInfo app;
        app.app_id = entry["appId"].asString();
        app.display_name = entry["displayName"].asString();
        app.session_id = entry["sessionId"].asString();
        app.transport_id = entry["transportId"].asString();
        app.status_text = entry["statusText"].asString();
        app.idle_screen = entry["isIdleScreen"].asBool() || app.app_id == kBackdropAppId;
        apps.push_back(std::move(app));
    }
    return apps;
}

std::optional<ApplicationInfo> foreground_application(const Json::Value& receiver_status) {
    for (auto& app : parse_applications(receiver_status)) {
        if (!app.idle_screen && !app.app_id.empty()) return app;
    }
    return std::nullopt;
}

std::optional<ApplicationInfo> find_application(const Json::Value& receiver_status,
                                                const std::string& app_id) {
    for (auto& app : parse_applications(receiver_status)) {
        if (app.app_id == app_id) return app;
    }
    return std::nullopt;
}

std::string url_encode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += hex[(c >> 4) & 0xF];
            encoded += hex[c & 0xF];
        }
    }
    return encoded;
}

std::string append_query(const std::string& url, const std::map<std::string, std::string>& params) {
    if (params.empty()) return url;
    std::ostringstream out;
    out << url;
    char sep = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& kv : params) {
        out << sep << url_encode(kv.first) << '=' << url_encode(kv.second);
        sep = '&';
    }
    return out.str();
}

} // namespace cast
} // namespace textcast
