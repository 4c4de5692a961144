#include "textcast/display_server.hpp"
#include "textcast/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <json/json.h>

#include <sys/socket.h>
#include <sys/time.h>

#include <chrono>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace textcast {

namespace {

constexpr std::chrono::milliseconds kAcceptRetryDelay{500};

const char* const kDisplayPage = R"HTML(<!DOCTYPE html>
<html>
<head>
<meta charset="utf-8">
<title>textcast</title>
<style>
  html, body { margin: 0; height: 100%; background: #000; color: #fff; }
  body { display: flex; align-items: center; justify-content: center;
         font-family: sans-serif; font-size: 6vw; text-align: center; }
  #text { padding: 4vw; word-wrap: break-word; }
</style>
</head>
<body>
<div id="text"></div>
<script>
  var el = document.getElementById('text');
  var params = new URLSearchParams(window.location.search);
  var version = -1;
  el.textContent = params.get('text') || '';
  function poll() {
    fetch('/current-text', { cache: 'no-store' })
      .then(function (r) { return r.json(); })
      .then(function (d) {
        if (d.version !== version) { version = d.version; el.textContent = d.text; }
      })
      .catch(function () {});
  }
  setInterval(poll, 2000);
</script>
</body>
</html>
)HTML";

std::string current_text_json(const DisplayText& text) {
    Json::Value body;
    body["text"] = text.get();
    body["version"] = static_cast<Json::UInt64>(text.version());
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
}

void set_receive_timeout(tcp::socket& sock, int seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    ::setsockopt(sock.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

// The socket stays open until the owning Connection is reaped, so stop() can
// shut it down from another thread.
void serve_connection(tcp::socket& sock, const DisplayText& text) {
    try {
        set_receive_timeout(sock, 10);
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::error_code ec;
        http::read(sock, buffer, req, ec);
        if (ec) return;

        std::string target(req.target().data(), req.target().size());
        std::string path = target.substr(0, target.find('?'));

        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::server, "textcast");
        res.set(http::field::cache_control, "no-store");
        res.set(http::field::access_control_allow_origin, "*");
        res.set("Access-Control-Allow-Private-Network", "true");

        if (req.method() != http::verb::get) {
            res.result(http::status::method_not_allowed);
            res.set(http::field::content_type, "text/plain");
            res.body() = "Method not allowed";
        } else if (path == "/display") {
            res.set(http::field::content_type, "text/html; charset=utf-8");
            res.body() = kDisplayPage;
        } else if (path == "/current-text") {
            res.set(http::field::content_type, "application/json");
            res.body() = current_text_json(text);
        } else {
            res.result(http::status::not_found);
            res.set(http::field::content_type, "text/plain");
            res.body() = "Not found";
        }
        res.prepare_payload();
        http::write(sock, res, ec);
        if (ec) log::debug("HTTP") << "Write failed: " << ec.message();

        sock.shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& e) {
        log::warn("HTTP") << "Connection error: " << e.what();
    }
}

} // namespace

void DisplayText::set(const std::string& text) {
    std::lock_guard<std::mutex> lk(mutex_);
    text_ = text;
    ++version_;
}

std::string DisplayText::get() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return text_;
}

uint64_t DisplayText::version() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return version_;
}

DisplayServer::DisplayServer(uint16_t port)
    : acceptor_(ioc_),
      accept_retry_(ioc_),
      text_(std::make_shared<DisplayText>()),
      requested_port_(port) {}

DisplayServer::~DisplayServer() {
    stop();
}

void DisplayServer::start(boost::system::error_code& ec) {
    ec.clear();
    if (running_) return;

    tcp::endpoint endpoint{tcp::v4(), requested_port_};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        log::error("HTTP") << "Cannot listen on port " << requested_port_ << ": " << ec.message();
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return;
    }
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    do_accept();
    ioc_.restart();
    thread_ = std::thread([this] { ioc_.run(); });
    log::info("HTTP") << "Serving display page on port " << bound_port_;
}

void DisplayServer::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket sock) {
        if (ec == net::error::operation_aborted || !running_) return;
        if (ec) {
            // Persistent failures (EMFILE) would otherwise spin.
            log::warn("HTTP") << "Accept failed: " << ec.message();
            accept_retry_.expires_after(kAcceptRetryDelay);
            accept_retry_.async_wait([this](const boost::system::error_code& wait_ec) {
                if (!wait_ec && running_) do_accept();
            });
            return;
        }
        add_connection(std::move(sock));
        do_accept();
    });
}

void DisplayServer::add_connection(tcp::socket sock) {
    auto socket = std::make_shared<tcp::socket>(std::move(sock));
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::shared_ptr<DisplayText> text = text_;

    std::lock_guard<std::mutex> lk(connections_mutex_);
    reap_finished();
    connections_.push_back(Connection{socket, finished, std::thread([socket, finished, text] {
        serve_connection(*socket, *text);
        *finished = true;
    })});
}

void DisplayServer::reap_finished() {
    for (auto it = connections_.begin(); it != connections_.end();) {
        if (!it->finished->load()) {
            ++it;
            continue;
        }
        it->thread.join();
        it = connections_.erase(it);
    }
}

void DisplayServer::stop() {
    if (!running_.exchange(false)) return;
    net::post(ioc_, [this] {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        accept_retry_.cancel();
    });
    if (thread_.joinable()) thread_.join();

    std::list<Connection> connections;
    {
        std::lock_guard<std::mutex> lk(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& connection : connections) {
        // Wakes a handler blocked in read; the asio object is not touched.
        if (!connection.finished->load()) {
            ::shutdown(connection.socket->native_handle(), SHUT_RDWR);
        }
        connection.thread.join();
    }
    log::info("HTTP") << "Display server stopped";
}

std::string DisplayServer::display_url(const std::string& local_address) const {
    return "http://" + local_address + ":" + std::to_string(bound_port_) + "/display";
}

} // namespace textcast
