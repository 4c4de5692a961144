// tests/test_cast_messages.cpp
#include <gtest/gtest.h>
#include "textcast/cast_messages.hpp"
#include "textcast/error.hpp"

#include <boost/asio/error.hpp>

#include <json/json.h>

#include <memory>

namespace textcast {
namespace testing {

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errs;
    reader->parse(text.data(), text.data() + text.size(), &value, &errs);
    return value;
}

const char* const kReceiverStatus = R"({
  "type": "RECEIVER_STATUS",
  "requestId": 3,
  "status": {
    "applications": [
      { "appId": "E8C28D3C", "displayName": "Backdrop", "isIdleScreen": true,
        "sessionId": "b-1", "transportId": "b-1" },
      { "appId": "CA5E8412", "displayName": "Netflix", "isIdleScreen": false,
        "sessionId": "n-7", "transportId": "web-7", "statusText": "Playing" }
    ]
  }
})";

} // namespace

TEST(CastFrameTest, FrameCarriesBigEndianLength) {
    auto message = cast::make_message(cast::kSenderId, cast::kReceiverId,
                                      cast::kConnectionNamespace, cast::connect_payload());
    std::string frame = cast::encode_frame(message);

    ASSERT_GT(frame.size(), cast::kFrameHeaderSize);
    auto header = reinterpret_cast<const unsigned char*>(frame.data());
    EXPECT_EQ(header[0], 0);
    EXPECT_EQ(cast::decode_frame_length(header), frame.size() - cast::kFrameHeaderSize);
}

TEST(CastFrameTest, DecodedFrameKeepsRoutingAndPayload) {
    auto message = cast::make_message(cast::kSenderId, "web-7", cast::kReceiverNamespace,
                                      cast::launch_request(4, "5CB45E5A"));
    std::string frame = cast::encode_frame(message);

    cast_channel::CastMessage decoded;
    ASSERT_TRUE(cast::decode_frame_body(frame.substr(cast::kFrameHeaderSize), decoded));
    EXPECT_EQ(decoded.source_id(), "sender-0");
    EXPECT_EQ(decoded.destination_id(), "web-7");
    EXPECT_EQ(decoded.namespace_(), cast::kReceiverNamespace);

    Json::Value payload;
    ASSERT_TRUE(cast::parse_payload(decoded, payload));
    EXPECT_EQ(payload["type"].asString(), "LAUNCH");
    EXPECT_EQ(payload["requestId"].asInt(), 4);
    EXPECT_EQ(payload["appId"].asString(), "5CB45E5A");
}

TEST(CastFrameTest, BinaryAndMalformedPayloadsAreRejected) {
    Json::Value payload;
    EXPECT_FALSE(cast::parse_payload(cast::make_auth_challenge(), payload));

    auto message = cast::make_message(cast::kSenderId, cast::kReceiverId,
                                      cast::kHeartbeatNamespace, cast::ping_payload());
    message.set_payload_utf8("{not json");
    EXPECT_FALSE(cast::parse_payload(message, payload));
}

TEST(CastFrameTest, AuthChallengeUsesDeviceAuthNamespace) {
    auto challenge = cast::make_auth_challenge();
    EXPECT_EQ(challenge.namespace_(), cast::kDeviceAuthNamespace);
    EXPECT_EQ(challenge.payload_type(), cast_channel::CastMessage::BINARY);

    cast_channel::DeviceAuthMessage auth;
    ASSERT_TRUE(auth.ParseFromString(challenge.payload_binary()));
    EXPECT_TRUE(auth.has_challenge());
}

TEST(CastPayloadTest, DashCastPayloadForcesUrl) {
    auto payload = cast::load_url_payload("urn:x-cast:es.offd.dashcast", 9,
                                          "http://10.0.0.5:5001/display");
    EXPECT_EQ(payload["url"].asString(), "http://10.0.0.5:5001/display");
    EXPECT_TRUE(payload["force"].asBool());
    EXPECT_FALSE(payload["reload"].asBool());
    EXPECT_FALSE(payload.isMember("type"));
}

TEST(CastPayloadTest, MediaNamespaceGetsLoadRequest) {
    auto payload = cast::load_url_payload(cast::kMediaNamespace, 9, "http://10.0.0.5:5001/display");
    EXPECT_EQ(payload["type"].asString(), "LOAD");
    EXPECT_EQ(payload["requestId"].asInt(), 9);
    EXPECT_EQ(payload["media"]["contentId"].asString(), "http://10.0.0.5:5001/display");
    EXPECT_EQ(payload["media"]["streamType"].asString(), "LIVE");
}

TEST(CastPayloadTest, StopRequestNamesSession) {
    auto payload = cast::stop_request(12, "n-7");
    EXPECT_EQ(payload["type"].asString(), "STOP");
    EXPECT_EQ(payload["sessionId"].asString(), "n-7");
    EXPECT_EQ(cast::to_json(cast::pong_payload()), R"({"type":"PONG"})");
}

TEST(ReceiverStatusTest, ParsesApplications) {
    auto apps = cast::parse_applications(parse(kReceiverStatus));
    ASSERT_EQ(apps.size(), 2u);
    EXPECT_TRUE(apps[0].idle_screen);
    EXPECT_EQ(apps[1].app_id, "CA5E8412");
    EXPECT_EQ(apps[1].transport_id, "web-7");
    EXPECT_EQ(apps[1].status_text, "Playing");
}

TEST(ReceiverStatusTest, ForegroundSkipsIdleScreen) {
    auto app = cast::foreground_application(parse(kReceiverStatus));
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(app->display_name, "Netflix");
}

TEST(ReceiverStatusTest, BackdropOnlyMeansNothingRunning) {
    auto status = parse(R"({"status":{"applications":[{"appId":"E8C28D3C"}]}})");
    EXPECT_FALSE(cast::foreground_application(status).has_value());
    EXPECT_FALSE(cast::foreground_application(parse(R"({"status":{}})")).has_value());
}

TEST(ReceiverStatusTest, FindsApplicationById) {
    auto status = parse(kReceiverStatus);
    EXPECT_TRUE(cast::find_application(status, "CA5E8412").has_value());
    EXPECT_FALSE(cast::find_application(status, "5CB45E5A").has_value());
}

TEST(UrlTest, EncodesReservedCharacters) {
    EXPECT_EQ(cast::url_encode("Hello World!"), "Hello%20World%21");
    EXPECT_EQ(cast::url_encode("a.b-c_d~e"), "a.b-c_d~e");
    EXPECT_EQ(cast::url_encode("caf\xC3\xA9"), "caf%C3%A9");
}

TEST(UrlTest, AppendsQueryParameters) {
    EXPECT_EQ(cast::append_query("http://h/display", {}), "http://h/display");
    EXPECT_EQ(cast::append_query("http://h/display", {{"text", "hi there"}}),
              "http://h/display?text=hi%20there");
    EXPECT_EQ(cast::append_query("http://h/display?x=1", {{"text", "a&b"}}),
              "http://h/display?x=1&text=a%26b");
}

TEST(ErrorTest, AsioFailuresMapOntoTaxonomy) {
    namespace aerr = boost::asio::error;
    EXPECT_EQ(classify_network_error(aerr::host_unreachable), error::network_unreachable);
    EXPECT_EQ(classify_network_error(aerr::host_not_found), error::network_unreachable);
    EXPECT_EQ(classify_network_error(aerr::connection_refused), error::refused);
    EXPECT_EQ(classify_network_error(aerr::eof), error::connection_closed);
    EXPECT_EQ(classify_network_error(aerr::connection_reset), error::connection_closed);
    EXPECT_EQ(classify_network_error(aerr::operation_aborted), aerr::operation_aborted);
    EXPECT_EQ(classify_network_error(error::timeout), error::timeout);
    EXPECT_FALSE(classify_network_error(boost::system::error_code()));
}

TEST(ErrorTest, NamesAreStable) {
    EXPECT_STREQ(error_name(error::already_active), "already_active");
    EXPECT_STREQ(error_name(boost::asio::error::operation_aborted), "aborted");
    EXPECT_STREQ(error_name(boost::system::error_code()), "ok");
    boost::system::error_code ec = error::capture_unavailable;
    EXPECT_EQ(ec.category().name(), std::string("textcast"));
}

} // namespace testing
} // namespace textcast
