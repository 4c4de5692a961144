#include "textcast/cast_client.hpp"
#include "textcast/config.hpp"
#include "textcast/device_info.hpp"
#include "textcast/display_server.hpp"
#include "textcast/error.hpp"
#include "textcast/event_publisher.hpp"
#include "textcast/log.hpp"
#include "textcast/observation_pipeline.hpp"
#include "textcast/session_controller.hpp"

#include <curl/curl.h>
#include <json/json.h>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace textcast;

namespace {

void print_help() {
    std::cout << "Commands:\n"
              << "  connect          launch the receiver and show the display page\n"
              << "  send <text>      put text on the screen\n"
              << "  disconnect       stop the receiver and restore the previous app\n"
              << "  status           session state\n"
              << "  stats            packet statistics\n"
              << "  quit\n";
}

void print_status(const SessionStatus& status) {
    std::cout << "online:  " << (status.online ? "yes" : "no") << "\n"
              << "device:  " << status.device_name << " @ " << status.device_address << "\n"
              << "state:   " << to_string(status.state) << "\n";
    if (status.session_id) std::cout << "session: " << status.session_id << "\n";
    if (status.prior_app_id) std::cout << "restore: " << *status.prior_app_id << "\n";
}

void print_stats(const PacketStatsSnapshot& snapshot, bool capturing) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    Json::Value v = to_json(snapshot);
    v["capturing"] = capturing;
    std::cout << Json::writeString(builder, v) << "\n";
}

void report(const char* what, const boost::system::error_code& ec) {
    if (ec) {
        std::cout << what << " failed: " << error_name(ec) << " (" << ec.message() << ")\n";
    } else {
        std::cout << what << ": ok\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [CONFIG_JSON]\n";
        return 1;
    }

    boost::system::error_code ec;
    Config config = load_config(argc == 2 ? argv[1] : "", ec);
    if (ec) {
        std::cerr << "Invalid configuration: " << ec.message() << "\n";
        return 1;
    }
    if (!log::set_level(config.log_level)) {
        log::warn("Config") << "Unknown log level \"" << config.log_level << "\", using info";
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (config.device.name.empty()) {
        config.device.name = probe_friendly_name(config.device.host, config.timeouts.query);
        if (config.device.name.empty()) config.device.name = config.device.host;
    }

    std::string local_address = config.display.local_address;
    if (local_address.empty()) {
        local_address = detect_local_address(config.device.host, config.device.port);
        if (local_address.empty()) {
            log::error("Cast") << "No route to " << config.device.host
                               << "; set display.local_address in the config";
            curl_global_cleanup();
            return 1;
        }
    }
    log::info("Cast") << "Local IP: " << local_address;

    DisplayServer display(config.display.port);
    display.start(ec);
    if (ec) {
        curl_global_cleanup();
        return 1;
    }

    JsonLinesSink sink(std::cout);
    QueuedPublisher publisher(sink, config.publisher_queue_capacity);
    publisher.start();

    ObservationOptions observation;
    observation.capture_enabled = config.capture.enabled;
    observation.capture.interface = config.capture.interface;
    observation.capture.file = config.capture.file;
    observation.capture.read_timeout = config.capture.read_timeout;
    observation.capture.stream_capacity = config.capture.stream_capacity;
    observation.filter.controller_host = local_address;
    observation.filter.device_host = config.device.host;
    observation.aggregator.recent_capacity = config.aggregator.recent_capacity;
    observation.aggregator.batch_size = config.aggregator.batch_size;
    observation.aggregator.batch_interval = config.aggregator.batch_interval;
    ObservationPipeline pipeline(observation, publisher);

    ControllerOptions options;
    options.device = config.device;
    options.receiver_app_id = config.receiver.app_id;
    options.display_url = display.display_url(local_address);
    options.timeouts = config.timeouts;
    options.missed_heartbeat_limit = config.timeouts.missed_heartbeats;

    {
        SessionController controller(options,
                                     std::make_unique<CastClient>(config.receiver.payload_namespace),
                                     publisher, display.shared_text());
        controller.add_observer(&pipeline);

        // Capture failures leave the control path untouched.
        if (pipeline.start()) log::warn("Capture") << "Packet statistics will stay empty";
        controller.start_heartbeat();

        std::cout << "[Cast] Device: " << config.device.name << " @ " << config.device.host << "\n"
                  << "[Cast] Display URL = " << options.display_url << "\n";
        print_help();

        std::string line;
        while (std::cout << "> " << std::flush, std::getline(std::cin, line)) {
            std::istringstream in(line);
            std::string command;
            in >> command;
            if (command.empty()) continue;

            if (command == "connect") {
                report("connect", controller.connect());
            } else if (command == "send") {
                std::string text;
                std::getline(in >> std::ws, text);
                SendResult result = controller.send_text(text);
                if (result.delivered) {
                    std::cout << "sent (" << result.latency_ms() << " ms)\n";
                } else {
                    report("send", result.error);
                }
            } else if (command == "disconnect") {
                report("disconnect", controller.disconnect());
            } else if (command == "status") {
                print_status(controller.status());
            } else if (command == "stats") {
                print_stats(pipeline.stats(), pipeline.capturing());
            } else if (command == "quit" || command == "exit") {
                break;
            } else {
                print_help();
            }
        }

        controller.stop_heartbeat();
        if (controller.state() == SessionState::Active) report("disconnect", controller.disconnect());
    }

    pipeline.stop();
    publisher.stop();
    display.stop();
    curl_global_cleanup();
    return 0;
}
