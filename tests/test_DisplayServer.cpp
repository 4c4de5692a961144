// tests/test_DisplayServer.cpp
#include <gtest/gtest.h>
#include "textcast/display_server.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <json/json.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace textcast {
namespace testing {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class DisplayServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = std::make_unique<DisplayServer>(0);
        boost::system::error_code ec;
        server->start(ec);
        ASSERT_FALSE(ec) << ec.message();
        ASSERT_NE(server->port(), 0);
    }

    void TearDown() override {
        if (server) server->stop();
    }

    http::response<http::string_body> fetch(const std::string& target,
                                            http::verb method = http::verb::get) {
        net::io_context ioc;
        tcp::socket sock(ioc);
        sock.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server->port()));

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, "127.0.0.1");
        http::write(sock, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(sock, buffer, res);
        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }

    std::unique_ptr<DisplayServer> server;
};

TEST_F(DisplayServerTest, ServesDisplayPage) {
    auto res = fetch("/display?text=Hello");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("/current-text"), std::string::npos);
    auto content_type = res[http::field::content_type];
    EXPECT_NE(std::string(content_type.data(), content_type.size()).find("text/html"),
              std::string::npos);
}

TEST_F(DisplayServerTest, CurrentTextFollowsSharedText) {
    server->set_text("first");
    server->shared_text()->set("Hello \"TV\"");

    auto res = fetch("/current-text");
    ASSERT_EQ(res.result(), http::status::ok);

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value body;
    std::string errs;
    ASSERT_TRUE(reader->parse(res.body().data(), res.body().data() + res.body().size(), &body, &errs));
    EXPECT_EQ(body["text"].asString(), "Hello \"TV\"");
    EXPECT_EQ(body["version"].asUInt64(), 2u);
    EXPECT_EQ(server->shared_text()->get(), "Hello \"TV\"");
}

TEST_F(DisplayServerTest, RejectsUnknownPathsAndMethods) {
    EXPECT_EQ(fetch("/video.mp4").result(), http::status::not_found);
    EXPECT_EQ(fetch("/display", http::verb::post).result(), http::status::method_not_allowed);
}

TEST_F(DisplayServerTest, StopJoinsConnectionsStillReading) {
    net::io_context ioc;
    tcp::socket idle(ioc);
    idle.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server->port()));

    // A request that has started but never completes.
    const std::string partial = "GET /current-text HTTP/1.1\r\nHost: 127.0.0.1\r\n";
    net::write(idle, net::buffer(partial));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const auto start = std::chrono::steady_clock::now();
    server->stop();
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    // The handler gave up on the connection instead of answering it.
    char byte;
    boost::system::error_code ec;
    idle.read_some(net::buffer(&byte, 1), ec);
    EXPECT_TRUE(ec);

    server.reset();
}

TEST_F(DisplayServerTest, ServesAgainAfterManyConnections) {
    for (int i = 0; i < 20; ++i) {
        ASSERT_EQ(fetch("/current-text").result(), http::status::ok);
    }
    server->set_text("still here");
    auto res = fetch("/current-text");
    EXPECT_NE(res.body().find("still here"), std::string::npos);
}

TEST_F(DisplayServerTest, DisplayUrlUsesBoundPort) {
    EXPECT_EQ(server->display_url("10.0.0.5"),
              "http://10.0.0.5:" + std::to_string(server->port()) + "/display");
}

} // namespace testing
} // namespace textcast
