#include "textcast/packet_capture.hpp"
#include "textcast/error.hpp"
#include "textcast/log.hpp"

#include <pcap.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>

namespace textcast {

namespace {

constexpr uint16_t kEtherTypeIPv4 = 0x0800;
constexpr uint16_t kEtherTypeVlan = 0x8100;
constexpr std::size_t kEthernetHeader = 14;
constexpr std::size_t kVlanTag = 4;
constexpr std::size_t kSllHeader = 16;
constexpr std::size_t kNullHeader = 4;
constexpr std::size_t kMinIPv4Header = 20;

uint16_t read_be16(const unsigned char* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

std::string ipv4_to_string(const unsigned char* p) {
    char buf[INET_ADDRSTRLEN];
    in_addr addr;
    std::memcpy(&addr, p, sizeof(addr));
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf))) return std::string();
    return buf;
}

// Offset of the IPv4 header inside the frame, or nullopt if the frame does
// not carry IPv4.
std::optional<std::size_t> ipv4_offset(int link_type, const unsigned char* data, std::size_t caplen) {
    switch (link_type) {
    case DLT_EN10MB: {
        if (caplen < kEthernetHeader) return std::nullopt;
        std::size_t offset = kEthernetHeader;
        uint16_t ether_type = read_be16(data + 12);
        if (ether_type == kEtherTypeVlan) {
            if (caplen < kEthernetHeader + kVlanTag) return std::nullopt;
            ether_type = read_be16(data + 16);
            offset += kVlanTag;
        }
        if (ether_type != kEtherTypeIPv4) return std::nullopt;
        return offset;
    }
    case DLT_LINUX_SLL:
        if (caplen < kSllHeader || read_be16(data + 14) != kEtherTypeIPv4) return std::nullopt;
        return kSllHeader;
    case DLT_NULL: {
        if (caplen < kNullHeader) return std::nullopt;
        uint32_t family;
        std::memcpy(&family, data, sizeof(family));
        if (family != AF_INET) return std::nullopt;
        return kNullHeader;
    }
    case DLT_RAW:
#ifdef DLT_IPV4
    case DLT_IPV4:
#endif
        return std::size_t{0};
    default:
        return std::nullopt;
    }
}

} // namespace

std::string CaptureFilter::bpf() const {
    if (controller_host.empty()) return "host " + device_host;
    return "(src host " + controller_host + " and dst host " + device_host + ") or (src host " +
           device_host + " and dst host " + controller_host + ")";
}

bool CaptureFilter::matches(const std::string& source, const std::string& destination) const {
    if (controller_host.empty()) return source == device_host || destination == device_host;
    return (source == controller_host && destination == device_host) ||
           (source == device_host && destination == controller_host);
}

const char* classify_protocol(uint8_t ip_protocol) {
    switch (ip_protocol) {
    case IPPROTO_TCP:  return "TCP";
    case IPPROTO_UDP:  return "UDP";
    case IPPROTO_ICMP: return "ICMP";
    default:           return "OTHER";
    }
}

std::optional<PacketRecord> decode_frame(int link_type, const unsigned char* data,
                                         std::size_t captured_length, uint32_t wire_length,
                                         SystemClock::time_point captured_at) {
    auto offset = ipv4_offset(link_type, data, captured_length);
    if (!offset || captured_length < *offset + kMinIPv4Header) return std::nullopt;

    const unsigned char* ip = data + *offset;
    const unsigned version = ip[0] >> 4;
    const std::size_t header_len = static_cast<std::size_t>(ip[0] & 0x0F) * 4;
    if (version != 4 || header_len < kMinIPv4Header) return std::nullopt;

    PacketRecord record;
    record.protocol = classify_protocol(ip[9]);
    record.source = ipv4_to_string(ip + 12);
    record.destination = ipv4_to_string(ip + 16);
    record.size_bytes = wire_length;
    record.captured_at = captured_at;
    return record;
}

PacketCaptureSource::PacketCaptureSource(CaptureOptions options) : options_(std::move(options)) {}

PacketCaptureSource::~PacketCaptureSource() {
    stop();
}

std::string PacketCaptureSource::last_error() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return last_error_;
}

pcap* PacketCaptureSource::open_handle(std::string& reason) const {
    char errbuf[PCAP_ERRBUF_SIZE] = {0};

    if (!options_.file.empty()) {
        pcap_t* handle = pcap_open_offline(options_.file.c_str(), errbuf);
        if (!handle) reason = errbuf;
        return handle;
    }

    std::string device = options_.interface;
    if (device.empty()) {
        pcap_if_t* devices = nullptr;
        if (pcap_findalldevs(&devices, errbuf) == -1) {
            reason = errbuf;
            return nullptr;
        }
        for (pcap_if_t* d = devices; d; d = d->next) {
            if (!(d->flags & PCAP_IF_LOOPBACK)) {
                device = d->name;
                break;
            }
        }
        pcap_freealldevs(devices);
        if (device.empty()) {
            reason = "no capture-capable interface";
            return nullptr;
        }
    }

    pcap_t* handle = pcap_create(device.c_str(), errbuf);
    if (!handle) {
        reason = errbuf;
        return nullptr;
    }
    pcap_set_snaplen(handle, options_.snaplen);
    pcap_set_promisc(handle, 0);
    pcap_set_timeout(handle, static_cast<int>(options_.read_timeout.count()));

    int rc = pcap_activate(handle);
    if (rc < 0) {
        reason = device + ": " + pcap_geterr(handle);
        if (rc == PCAP_ERROR_PERM_DENIED) reason += " (capture needs root or CAP_NET_RAW)";
        pcap_close(handle);
        return nullptr;
    }
    if (rc > 0) log::warn("Capture") << device << ": " << pcap_statustostr(rc);
    log::info("Capture") << "Capturing on " << device;
    return handle;
}

std::shared_ptr<PacketStream> PacketCaptureSource::start(const CaptureFilter& filter,
                                                         boost::system::error_code& ec) {
    ec.clear();
    stop();

    std::string reason;
    pcap_t* handle = open_handle(reason);

    if (handle) {
        const std::string expression = filter.bpf();
        bpf_program program;
        if (pcap_compile(handle, &program, expression.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
            reason = "bad filter \"" + expression + "\": " + pcap_geterr(handle);
        } else {
            if (pcap_setfilter(handle, &program) == -1) {
                reason = std::string("cannot install filter: ") + pcap_geterr(handle);
            }
            pcap_freecode(&program);
        }
        if (!reason.empty()) {
            pcap_close(handle);
            handle = nullptr;
        } else {
            log::info("Capture") << "BPF filter: " << expression;
        }
    }

    if (!handle) {
        log::error("Capture") << "Packet capture unavailable: " << reason;
        std::lock_guard<std::mutex> lk(mutex_);
        last_error_ = reason;
        ec = error::capture_unavailable;
        return nullptr;
    }

    const int link_type = pcap_datalink(handle);
    auto stream = std::make_shared<PacketStream>(options_.stream_capacity);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        handle_ = handle;
        last_error_.clear();
    }
    captured_ = 0;
    filtered_out_ = 0;
    running_ = true;
    thread_ = std::thread(&PacketCaptureSource::capture_loop, this, filter, stream, link_type);
    return stream;
}

void PacketCaptureSource::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        running_ = false;
        if (handle_) pcap_breakloop(handle_);
    }
    if (thread_.joinable()) thread_.join();
}

void PacketCaptureSource::capture_loop(CaptureFilter filter, std::shared_ptr<PacketStream> stream,
                                       int link_type) {
    pcap_t* handle;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        handle = handle_;
    }

    while (running_) {
        pcap_pkthdr* header = nullptr;
        const u_char* data = nullptr;
        int rc = pcap_next_ex(handle, &header, &data);
        if (rc == 0) continue;  // read timeout
        if (rc == PCAP_ERROR_BREAK) break;  // breakloop or end of file
        if (rc < 0) {
            std::lock_guard<std::mutex> lk(mutex_);
            last_error_ = pcap_geterr(handle);
            log::error("Capture") << "Capture error: " << last_error_;
            break;
        }

        auto ts = SystemClock::time_point(std::chrono::duration_cast<SystemClock::duration>(
            std::chrono::seconds(header->ts.tv_sec) + std::chrono::microseconds(header->ts.tv_usec)));
        auto record = decode_frame(link_type, data, header->caplen, header->len, ts);
        if (!record) continue;
        if (!filter.matches(record->source, record->destination)) {
            ++filtered_out_;
            continue;
        }
        ++captured_;
        stream->push(std::move(*record));
    }

    stream->close();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pcap_close(handle_);
        handle_ = nullptr;
    }
    running_ = false;
    log::info("Capture") << "Packet capture loop exited (" << captured_.load() << " packets, "
                         << filtered_out_.load() << " outside the pair)";
}

} // namespace textcast
