#include "linkchat/util/StructuredLogger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace linkchat::util {

namespace {

void write_json_string(std::ostream& out, std::string_view value) {
    out << '"';
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (ch < 0x20) {
                    const auto flags = out.flags();
                    out << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    out.flags(flags);
                } else {
                    out << static_cast<char>(ch);
                }
                break;
        }
    }
    out << '"';
}

void write_timestamp(std::ostream& out) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
    gmtime_r(&now_c, &tm);
    out << '"' << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
        << "Z\"";
}

}  // namespace

std::string_view to_string(StructuredLogger::Level level) noexcept {
    switch (level) {
        case StructuredLogger::Level::Debug:
            return "debug";
        case StructuredLogger::Level::Info:
            return "info";
        case StructuredLogger::Level::Warning:
            return "warning";
        case StructuredLogger::Level::Error:
            return "error";
    }
    return "info";
}

std::optional<StructuredLogger::Level> parse_log_level(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (const unsigned char ch : text) {
        lowered.push_back(static_cast<char>(std::tolower(ch)));
    }
    if (lowered == "debug") {
        return StructuredLogger::Level::Debug;
    }
    if (lowered == "info") {
        return StructuredLogger::Level::Info;
    }
    if (lowered == "warning" || lowered == "warn") {
        return StructuredLogger::Level::Warning;
    }
    if (lowered == "error") {
        return StructuredLogger::Level::Error;
    }
    return std::nullopt;
}

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    std::scoped_lock lock(mutex_);
    if (!enabled_ || level < minimum_level_) {
        return;
    }

    // Built off to the side so concurrent writers to std::clog never interleave a line.
    std::ostringstream line;
    line << "{\"ts\":";
    write_timestamp(line);
    line << ",\"level\":\"" << to_string(level) << "\",\"event\":";
    write_json_string(line, event);
    if (!fields.empty()) {
        line << ",\"fields\":{";
        bool first = true;
        for (const auto& [key, value] : fields) {
            if (!first) {
                line << ',';
            }
            first = false;
            write_json_string(line, key);
            line << ':';
            write_json_string(line, value);
        }
        line << '}';
    }
    line << "}\n";

    auto& out = output_ != nullptr ? *output_ : std::clog;
    out << line.str();
    out.flush();
}

void StructuredLogger::set_enabled(bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
}

bool StructuredLogger::enabled() const noexcept {
    std::scoped_lock lock(mutex_);
    return enabled_;
}

void StructuredLogger::set_minimum_level(Level level) {
    std::scoped_lock lock(mutex_);
    minimum_level_ = level;
}

StructuredLogger::Level StructuredLogger::minimum_level() const noexcept {
    std::scoped_lock lock(mutex_);
    return minimum_level_;
}

void StructuredLogger::set_output(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    output_ = stream;
}

}  // namespace linkchat::util
