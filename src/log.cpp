#include "textcast/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace textcast {
namespace log {

namespace {
std::atomic<Level> current_level{Level::Info};
std::mutex output_lock;
} // namespace

void set_level(Level level) { current_level = level; }

bool enabled(Level lvl) {
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(current_level.load());
}

bool set_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") set_level(Level::Debug);
    else if (lower == "info") set_level(Level::Info);
    else if (lower == "warn" || lower == "warning") set_level(Level::Warn);
    else if (lower == "error") set_level(Level::Error);
    else if (lower == "off") set_level(Level::Off);
    else return false;
    return true;
}

Line::Line(Level lvl, const char* tag) : level_(lvl), active_(enabled(lvl)) {
    if (active_) {
        stream_ << '[' << tag << "] ";
        if (lvl == Level::Warn) stream_ << "Warning: ";
        else if (lvl == Level::Error) stream_ << "ERROR: ";
    }
}

Line::Line(Line&& other) noexcept
    : level_(other.level_), active_(other.active_), stream_(std::move(other.stream_)) {
    other.active_ = false;
}

Line::~Line() {
    if (!active_) return;
    std::lock_guard<std::mutex> lk(output_lock);
    std::ostream& out = level_ >= Level::Warn ? std::cerr : std::cout;
    out << stream_.str() << "\n";
    out.flush();
}

} // namespace log
} // namespace textcast
