#pragma once
#include <sstream>
#include <string>

namespace textcast {
namespace log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

void set_level(Level level);
bool enabled(Level level);

// Accepts "debug", "info", "warn"/"warning", "error", "off". Unknown names
// leave the level unchanged and return false.
bool set_level(const std::string& name);

// One tagged console line, emitted when the object goes out of scope:
//   log::info("Cast") << "Connecting to " << host;
// prints "[Cast] Connecting to 192.168.1.20".
class Line {
public:
    Line(Level level, const char* tag);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;
    Line(Line&& other) noexcept;

    template <typename T>
    Line& operator<<(const T& value) {
        if (active_) stream_ << value;
        return *this;
    }

private:
    Level level_;
    bool active_;
    std::ostringstream stream_;
};

inline Line debug(const char* tag) { return Line(Level::Debug, tag); }
inline Line info(const char* tag) { return Line(Level::Info, tag); }
inline Line warn(const char* tag) { return Line(Level::Warn, tag); }
inline Line error(const char* tag) { return Line(Level::Error, tag); }

} // namespace log
} // namespace textcast
