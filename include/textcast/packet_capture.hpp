#pragma once
#include "textcast/packet_stream.hpp"
#include "textcast/types.hpp"

#include <boost/system/error_code.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

struct pcap;

namespace textcast {

// Traffic between the controller and the device, in either direction.
struct CaptureFilter {
    std::string controller_host;  // empty = any peer of the device
    std::string device_host;

    std::string bpf() const;
    bool matches(const std::string& source, const std::string& destination) const;
};

// "TCP", "UDP", "ICMP" or "OTHER" for an IPv4 protocol number.
const char* classify_protocol(uint8_t ip_protocol);

// Decodes one captured frame of the given libpcap link type. Returns nullopt
// for non-IPv4 and truncated frames. `wire_length` becomes the record size.
std::optional<PacketRecord> decode_frame(int link_type, const unsigned char* data,
                                         std::size_t captured_length, uint32_t wire_length,
                                         SystemClock::time_point captured_at);

struct CaptureOptions {
    std::string interface;     // empty = first capture-capable interface
    std::string file;          // replay this capture file instead of a live interface
    std::chrono::milliseconds read_timeout{250};
    std::size_t stream_capacity{4096};
    int snaplen{256};
};

// libpcap tap feeding a PacketStream from a background thread. Each start()
// returns a fresh stream that is closed when the capture stops (or when a
// replayed file ends), and restarts the packet counters.
class PacketCaptureSource {
public:
    explicit PacketCaptureSource(CaptureOptions options);
    ~PacketCaptureSource();

    PacketCaptureSource(const PacketCaptureSource&) = delete;
    PacketCaptureSource& operator=(const PacketCaptureSource&) = delete;

    // Fails fast with capture_unavailable when the handle cannot be opened or
    // the filter cannot be installed (typically missing privileges).
    std::shared_ptr<PacketStream> start(const CaptureFilter& filter, boost::system::error_code& ec);
    void stop();

    bool running() const { return running_.load(); }
    std::string last_error() const;
    uint64_t captured() const { return captured_.load(); }

private:
    pcap* open_handle(std::string& reason) const;
    void capture_loop(CaptureFilter filter, std::shared_ptr<PacketStream> stream, int link_type);

    CaptureOptions options_;
    mutable std::mutex mutex_;
    pcap* handle_{nullptr};
    std::string last_error_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> captured_{0};
    std::atomic<uint64_t> filtered_out_{0};
};

} // namespace textcast
