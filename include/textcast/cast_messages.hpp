#pragma once
#include "cast_channel.pb.h"

#include <json/json.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace textcast {
namespace cast {

constexpr const char* kSenderId = "sender-0";
constexpr const char* kReceiverId = "receiver-0";

constexpr const char* kConnectionNamespace = "urn:x-cast:com.google.cast.tp.connection";
constexpr const char* kHeartbeatNamespace = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr const char* kDeviceAuthNamespace = "urn:x-cast:com.google.cast.tp.deviceauth";
constexpr const char* kReceiverNamespace = "urn:x-cast:com.google.cast.receiver";
constexpr const char* kMediaNamespace = "urn:x-cast:com.google.cast.media";

constexpr const char* kBackdropAppId = "E8C28D3C";

constexpr std::size_t kFrameHeaderSize = 4;
constexpr std::size_t kMaxFrameSize = 65536;

// --- Framing -----------------------------------------------------------------

cast_channel::CastMessage make_message(const std::string& source_id,
                                       const std::string& destination_id,
                                       const std::string& namespace_name,
                                       const Json::Value& payload);

cast_channel::CastMessage make_auth_challenge();

// 4-byte big-endian length prefix followed by the serialized message.
std::string encode_frame(const cast_channel::CastMessage& message);

uint32_t decode_frame_length(const unsigned char* header);

bool decode_frame_body(const std::string& body, cast_channel::CastMessage& message);

// Parses the UTF-8 JSON payload. Binary payloads and malformed JSON fail.
bool parse_payload(const cast_channel::CastMessage& message, Json::Value& payload);

std::string to_json(const Json::Value& value);

// --- Payloads ----------------------------------------------------------------

Json::Value connect_payload();
Json::Value close_payload();
Json::Value ping_payload();
Json::Value pong_payload();
Json::Value launch_request(int request_id, const std::string& app_id);
Json::Value get_status_request(int request_id);
Json::Value stop_request(int request_id, const std::string& session_id);

// Payload that makes the launched receiver load `url`. The media namespace
// gets a LOAD request; anything else gets the DashCast-style url message.
Json::Value load_url_payload(const std::string& namespace_name, int request_id,
                             const std::string& url);

// --- Receiver status ---------------------------------------------------------

struct ApplicationInfo {
    std::string app_id;
    std::string display_name;
    std::string session_id;
    std::string transport_id;
    std::string status_text;
    bool idle_screen{false};
};

std::vector<ApplicationInfo> parse_applications(const Json::Value& receiver_status);

// First running application that is not an idle screen / backdrop.
std::optional<ApplicationInfo> foreground_application(const Json::Value& receiver_status);

std::optional<ApplicationInfo> find_application(const Json::Value& receiver_status,
                                                const std::string& app_id);

// --- URLs --------------------------------------------------------------------

std::string url_encode(const std::string& value);

std::string append_query(const std::string& url, const std::map<std::string, std::string>& params);

} // namespace cast
} // namespace textcast
