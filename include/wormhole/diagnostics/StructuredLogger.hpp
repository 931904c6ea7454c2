#pragma once

#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wormhole::diagnostics {

class StructuredLogger {
public:
    enum class Level {
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    // Events below this level are dropped. Defaults to Info.
    void set_minimum_level(Level level);

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    // nullptr restores the default sink (std::clog).
    void set_stream(std::ostream* stream);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);

    std::string format_timestamp();

    bool enabled_{true};
    Level minimum_level_{Level::Info};
    std::ostream* stream_{nullptr};
    mutable std::mutex mutex_;
};

inline void log_info(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Info, event, std::move(fields));
}

inline void log_warning(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Warning, event, std::move(fields));
}

inline void log_error(std::string_view event, StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(StructuredLogger::Level::Error, event, std::move(fields));
}

}  // namespace wormhole::diagnostics
