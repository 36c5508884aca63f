#include "linkchat/util/StructuredLogger.hpp"

#include <cassert>
#include <sstream>
#include <string>

using linkchat::util::StructuredLogger;
using linkchat::util::log_event;
using linkchat::util::parse_log_level;

namespace {

std::size_t count_lines(const std::string& text) {
    std::size_t lines = 0;
    for (const char ch : text) {
        if (ch == '\n') {
            ++lines;
        }
    }
    return lines;
}

}  // namespace

int main() {
    auto& logger = StructuredLogger::instance();
    std::ostringstream sink;
    logger.set_output(&sink);
    logger.set_enabled(true);

    assert(logger.minimum_level() == StructuredLogger::Level::Info);
    log_event(StructuredLogger::Level::Debug, "transfer.fragment.stale_ack");
    assert(sink.str().empty());

    log_event(StructuredLogger::Level::Warning,
              "transfer.fragment.corrupt",
              {{"peer", "02:00:00:00:00:01"}, {"sequence", "7"}});
    const auto line = sink.str();
    assert(count_lines(line) == 1);
    assert(line.starts_with("{\"ts\":\""));
    assert(line.find("\"level\":\"warning\"") != std::string::npos);
    assert(line.find("\"event\":\"transfer.fragment.corrupt\"") != std::string::npos);
    assert(line.find("\"fields\":{\"peer\":\"02:00:00:00:00:01\",\"sequence\":\"7\"}}") != std::string::npos);

    // File names may carry quotes and control characters.
    sink.str("");
    log_event(StructuredLogger::Level::Info, "transfer.receive.start", {{"file", "a\"b\\c\n\x01"}});
    assert(sink.str().find("\"file\":\"a\\\"b\\\\c\\n\\u0001\"") != std::string::npos);
    assert(sink.str().find("\"fields\"") != std::string::npos);

    sink.str("");
    logger.set_minimum_level(StructuredLogger::Level::Debug);
    log_event(StructuredLogger::Level::Debug, "transfer.fragment.stale_ack");
    assert(sink.str().find("\"level\":\"debug\"") != std::string::npos);
    assert(sink.str().find("\"fields\"") == std::string::npos);

    sink.str("");
    logger.set_minimum_level(StructuredLogger::Level::Error);
    log_event(StructuredLogger::Level::Warning, "transfer.fragment.retry");
    log_event(StructuredLogger::Level::Error, "transfer.send.failed");
    assert(count_lines(sink.str()) == 1);

    sink.str("");
    logger.set_enabled(false);
    log_event(StructuredLogger::Level::Error, "transfer.send.failed");
    assert(sink.str().empty());
    assert(!logger.enabled());

    assert(parse_log_level("debug") == StructuredLogger::Level::Debug);
    assert(parse_log_level("WARN") == StructuredLogger::Level::Warning);
    assert(parse_log_level("Error") == StructuredLogger::Level::Error);
    assert(!parse_log_level("verbose").has_value());
    assert(linkchat::util::to_string(StructuredLogger::Level::Info) == "info");

    logger.set_enabled(true);
    logger.set_minimum_level(StructuredLogger::Level::Info);
    logger.set_output(nullptr);
    return 0;
}
