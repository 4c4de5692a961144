// tests/test_Config.cpp
#include <gtest/gtest.h>
#include "textcast/config.hpp"
#include "textcast/error.hpp"

#include <json/json.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
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

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kEnv) ::unsetenv(name);
        path = ::testing::TempDir() + "textcast_config.json";
    }

    void TearDown() override {
        for (const char* name : kEnv) ::unsetenv(name);
        std::remove(path.c_str());
    }

    void write(const std::string& text) {
        std::ofstream out(path);
        out << text;
    }

    static constexpr const char* kEnv[] = {"TEXTCAST_DEVICE_HOST", "TEXTCAST_DEVICE_NAME",
                                           "TEXTCAST_LOG_LEVEL", "TEXTCAST_CAPTURE_INTERFACE"};
    std::string path;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    Config config;
    EXPECT_EQ(config.device.port, 8009);
    EXPECT_EQ(config.receiver.app_id, "5CB45E5A");
    EXPECT_EQ(config.timeouts.connect.count(), 10000);
    EXPECT_EQ(config.timeouts.restore.count(), 3000);
    EXPECT_EQ(config.display.port, 5001);
    EXPECT_TRUE(config.capture.enabled);
    EXPECT_EQ(config.aggregator.recent_capacity, 20u);
}

TEST_F(ConfigTest, JsonOverridesOnlyPresentKeys) {
    Config config;
    boost::system::error_code ec;
    apply_json(parse(R"({
        "device": { "host": "192.168.29.28", "name": "Living Room TV" },
        "timeouts_ms": { "send": 1500 },
        "capture": { "enabled": false },
        "aggregator": { "batch_size": 4 }
    })"), config, ec);

    ASSERT_FALSE(ec);
    EXPECT_EQ(config.device.host, "192.168.29.28");
    EXPECT_EQ(config.device.name, "Living Room TV");
    EXPECT_EQ(config.device.port, 8009);
    EXPECT_EQ(config.timeouts.send.count(), 1500);
    EXPECT_EQ(config.timeouts.launch.count(), 8000);
    EXPECT_FALSE(config.capture.enabled);
    EXPECT_EQ(config.aggregator.batch_size, 4u);
}

TEST_F(ConfigTest, RejectsBadValues) {
    Config config;
    boost::system::error_code ec;
    apply_json(parse(R"({ "timeouts_ms": { "send": -5 } })"), config, ec);
    EXPECT_EQ(ec, error::invalid_config);

    apply_json(parse(R"({ "aggregator": { "recent_capacity": 0 } })"), config, ec);
    EXPECT_EQ(ec, error::invalid_config);

    Config fresh;
    apply_json(parse(R"({ "timeouts_ms": { "missed_heartbeats": 0 } })"), fresh, ec);
    EXPECT_EQ(ec, error::invalid_config);

    apply_json(Json::Value("not an object"), config, ec);
    EXPECT_EQ(ec, error::invalid_config);
}

TEST_F(ConfigTest, RejectsPortsOutOfRange) {
    Config config;
    boost::system::error_code ec;
    apply_json(parse(R"({ "device": { "port": 70000 } })"), config, ec);
    EXPECT_EQ(ec, error::invalid_config);
    EXPECT_EQ(config.device.port, 8009);

    apply_json(parse(R"({ "display": { "port": 65616 } })"), config, ec);
    EXPECT_EQ(ec, error::invalid_config);
    EXPECT_EQ(config.display.port, 5001);

    apply_json(parse(R"({ "device": { "port": 65535 } })"), config, ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(config.device.port, 65535);
}

TEST_F(ConfigTest, LoadsFileThenEnvironment) {
    write(R"({ "device": { "host": "192.168.1.20" }, "log": { "level": "debug" } })");
    ::setenv("TEXTCAST_DEVICE_NAME", "Bedroom", 1);
    ::setenv("TEXTCAST_CAPTURE_INTERFACE", "eth1", 1);

    boost::system::error_code ec;
    Config config = load_config(path, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(config.device.host, "192.168.1.20");
    EXPECT_EQ(config.device.name, "Bedroom");
    EXPECT_EQ(config.capture.interface, "eth1");
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, EnvironmentSuppliesHostWithoutFile) {
    ::setenv("TEXTCAST_DEVICE_HOST", "10.1.1.1", 1);
    boost::system::error_code ec;
    Config config = load_config("", ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(config.device.host, "10.1.1.1");
}

TEST_F(ConfigTest, MissingHostIsInvalid) {
    boost::system::error_code ec;
    load_config("", ec);
    EXPECT_EQ(ec, error::invalid_config);
}

TEST_F(ConfigTest, UnparsableFileIsInvalid) {
    write("{ device: ");
    boost::system::error_code ec;
    load_config(path, ec);
    EXPECT_EQ(ec, error::invalid_config);

    load_config(path + ".missing", ec);
    EXPECT_EQ(ec, error::invalid_config);
}

} // namespace testing
} // namespace textcast
