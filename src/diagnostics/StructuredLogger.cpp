#include "wormhole/diagnostics/StructuredLogger.hpp"

#include "wormhole/protocol/Json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace wormhole::diagnostics {

namespace json = protocol::json;

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || level < minimum_level_) {
        return;
    }

    // Keys serialize in sorted order: event, fields, level, ts.
    auto line = json::Value::make_object();
    line.set("ts", json::Value(format_timestamp()));
    line.set("level", json::Value(level_to_string(level)));
    line.set("event", json::Value(std::string(event)));
    if (!fields.empty()) {
        auto payload = json::Value::make_object();
        for (auto& [key, value] : fields) {
            payload.set(std::move(key), json::Value(std::move(value)));
        }
        line.set("fields", std::move(payload));
    }

    auto& sink = stream_ != nullptr ? *stream_ : std::clog;
    sink << json::serialize(line) << '\n';
    sink.flush();
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_level_ = level;
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace wormhole::diagnostics
