#include "textcast/observation_pipeline.hpp"
#include "textcast/error.hpp"
#include "textcast/log.hpp"

using boost::system::error_code;

namespace textcast {

ObservationPipeline::ObservationPipeline(ObservationOptions options, EventPublisher& publisher)
    : options_(std::move(options)),
      capture_(options_.capture),
      aggregator_(options_.aggregator, publisher) {}

ObservationPipeline::~ObservationPipeline() {
    stop();
}

error_code ObservationPipeline::start() {
    if (!options_.capture_enabled) {
        log::info("Capture") << "Packet capture disabled";
        return error_code();
    }

    error_code ec;
    auto stream = capture_.start(options_.filter, ec);
    if (ec) {
        log::warn("Capture") << "Continuing without packet capture (" << capture_.last_error() << ")";
        return ec;
    }
    aggregator_.start(std::move(stream));
    return error_code();
}

void ObservationPipeline::stop() {
    capture_.stop();
    aggregator_.stop();
}

void ObservationPipeline::session_started(uint64_t session_id) {
    aggregator_.flush();
    aggregator_.set_session(session_id);
    log::debug("Capture") << "Tagging packets with session " << session_id;
}

void ObservationPipeline::session_ended(uint64_t session_id) {
    aggregator_.flush();
    aggregator_.set_session(0);
    log::debug("Capture") << "Session " << session_id << " ended";
}

} // namespace textcast
