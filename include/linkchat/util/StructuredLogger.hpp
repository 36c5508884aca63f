#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace linkchat::util {

// One JSON object per line: {"ts":...,"level":...,"event":...,"fields":{...}}.
class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_minimum_level(Level level);
    [[nodiscard]] Level minimum_level() const noexcept;

    // Null restores std::clog.
    void set_output(std::ostream* stream);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    bool enabled_{true};
    Level minimum_level_{Level::Info};
    std::ostream* output_{nullptr};
    mutable std::mutex mutex_;
};

std::string_view to_string(StructuredLogger::Level level) noexcept;

// Accepts debug, info, warning (or warn) and error, case-insensitively.
std::optional<StructuredLogger::Level> parse_log_level(std::string_view text);

inline void log_event(StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace linkchat::util
