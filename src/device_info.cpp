#include "textcast/device_info.hpp"
#include "textcast/log.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>

#include <curl/curl.h>
#include <json/json.h>

#include <memory>

namespace net = boost::asio;

namespace textcast {

namespace {

size_t append_body(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

std::string detect_local_address(const std::string& device_host, uint16_t device_port) {
    net::io_context ioc;
    boost::system::error_code ec;

    // A UDP connect sends nothing; it only asks the kernel which source
    // address the route to the device uses.
    net::ip::udp::resolver udp_resolver(ioc);
    auto udp_endpoints = udp_resolver.resolve(net::ip::udp::v4(), device_host,
                                              std::to_string(device_port), ec);
    if (!ec && !udp_endpoints.empty()) {
        net::ip::udp::socket socket(ioc);
        socket.connect(*udp_endpoints.begin(), ec);
        if (!ec) {
            auto local = socket.local_endpoint(ec);
            if (!ec) return local.address().to_string();
        }
    }
    log::debug("Display") << "UDP route lookup failed (" << ec.message() << "), trying TCP";

    net::ip::tcp::resolver tcp_resolver(ioc);
    auto tcp_endpoints = tcp_resolver.resolve(net::ip::tcp::v4(), device_host,
                                              std::to_string(device_port), ec);
    if (ec || tcp_endpoints.empty()) {
        log::warn("Display") << "Failed to resolve " << device_host << ": " << ec.message();
        return std::string();
    }
    net::ip::tcp::socket socket(ioc);
    socket.connect(*tcp_endpoints.begin(), ec);
    if (ec) {
        log::warn("Display") << "Failed to get local IP: " << ec.message();
        return std::string();
    }
    auto local = socket.local_endpoint(ec);
    return ec ? std::string() : local.address().to_string();
}

std::string probe_friendly_name(const std::string& device_host, std::chrono::milliseconds timeout) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) return std::string();

    std::string response;
    const std::string url = "http://" + device_host + ":8008/setup/eureka_info";
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &append_body);

    CURLcode result = curl_easy_perform(curl.get());
    if (result != CURLE_OK) {
        log::debug("Device") << "eureka_info request failed: " << curl_easy_strerror(result);
        return std::string();
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value info;
    std::string errs;
    if (!reader->parse(response.data(), response.data() + response.size(), &info, &errs) ||
        !info.isObject()) {
        log::debug("Device") << "eureka_info is not JSON: " << errs;
        return std::string();
    }
    return info["name"].asString();
}

} // namespace textcast
