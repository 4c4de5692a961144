#pragma once
#include "textcast/event_publisher.hpp"
#include "textcast/packet_aggregator.hpp"
#include "textcast/packet_capture.hpp"
#include "textcast/session_controller.hpp"
#include "textcast/types.hpp"

#include <boost/system/error_code.hpp>

#include <cstdint>

namespace textcast {

struct ObservationOptions {
    bool capture_enabled{true};
    CaptureOptions capture;
    CaptureFilter filter;
    AggregatorOptions aggregator;
};

// Capture -> stream -> aggregator, running beside the control path. Packets
// are tagged with the id of the session that is live when they arrive.
class ObservationPipeline : public SessionObserver {
public:
    ObservationPipeline(ObservationOptions options, EventPublisher& publisher);
    ~ObservationPipeline() override;

    // capture_unavailable leaves the pipeline serving (empty) statistics.
    boost::system::error_code start();
    void stop();

    bool capturing() const { return capture_.running(); }
    PacketStatsSnapshot stats() const { return aggregator_.snapshot(); }

    void session_started(uint64_t session_id) override;
    void session_ended(uint64_t session_id) override;

private:
    ObservationOptions options_;
    PacketCaptureSource capture_;
    PacketAggregator aggregator_;
};

} // namespace textcast
