#include "linkchat/ConfigLoader.hpp"

#include "linkchat/util/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <utility>

namespace linkchat {

namespace {

std::string trim_copy(std::string_view value) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if(value.begin(), value.end(), [&](unsigned char ch) { return !is_space(ch); });
    auto end = std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) { return !is_space(ch); }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string normalize_key(std::string_view key) {
    std::string normalized;
    normalized.reserve(key.size());
    for (const unsigned char ch : key) {
        normalized.push_back(ch == '-' ? '_' : static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_bool(std::string_view text, bool& value) {
    const auto lowered = normalize_key(text);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        value = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        value = false;
        return true;
    }
    return false;
}

[[noreturn]] void throw_bad_value(std::string_view key, std::string_view value, std::string hint) {
    throw ConfigError("E_CONFIG_VALUE",
                      "Invalid value for '" + std::string(key) + "': " + std::string(value),
                      std::move(hint));
}

}  // namespace

ConfigError::ConfigError(std::string code, std::string message, std::string hint)
    : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
    formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
}

bool parse_duration_ms(std::string_view text, std::chrono::milliseconds& duration) {
    if (text.empty()) {
        return false;
    }
    std::uint64_t multiplier = 1;
    if (text.size() > 2 && text.substr(text.size() - 2) == "ms") {
        text.remove_suffix(2);
    } else if (text.back() == 's') {
        multiplier = 1000;
        text.remove_suffix(1);
    }
    std::uint64_t value = 0;
    if (!parse_uint64(text, value)) {
        return false;
    }
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) / multiplier) {
        return false;
    }
    duration = std::chrono::milliseconds(static_cast<std::int64_t>(value * multiplier));
    return true;
}

void apply_config_value(Config& config, std::string_view key, std::string_view raw_value) {
    const auto name = normalize_key(key);
    const auto value = unquote(trim_copy(raw_value));

    if (name == "fragment_size") {
        std::uint64_t parsed = 0;
        if (!parse_uint64(value, parsed) || parsed == 0 || parsed > std::numeric_limits<std::uint16_t>::max()) {
            throw_bad_value(key, value, "Use a positive byte count no larger than 65535");
        }
        config.fragment_size = static_cast<std::size_t>(parsed);
        return;
    }
    if (name == "ack_timeout") {
        std::chrono::milliseconds parsed{};
        if (!parse_duration_ms(value, parsed) || parsed.count() == 0) {
            throw_bad_value(key, value, "Use a duration such as 500ms or 2s");
        }
        config.ack_timeout = parsed;
        return;
    }
    if (name == "max_retries") {
        std::uint64_t parsed = 0;
        if (!parse_uint64(value, parsed) || parsed == 0 || parsed > 1000) {
            throw_bad_value(key, value, "Use an attempt count between 1 and 1000");
        }
        config.max_retries = static_cast<std::uint32_t>(parsed);
        return;
    }
    if (name == "interface" || name == "interface_name") {
        config.interface_name = value;
        return;
    }
    if (name == "ether_type" || name == "ethertype") {
        std::uint64_t parsed = 0;
        bool ok = false;
        if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
            const char* begin = value.data() + 2;
            const char* end = value.data() + value.size();
            auto result = std::from_chars(begin, end, parsed, 16);
            ok = result.ec == std::errc{} && result.ptr == end;
        } else {
            ok = parse_uint64(value, parsed);
        }
        // Values below 0x0600 are 802.3 length fields, not EtherTypes.
        if (!ok || parsed < 0x0600 || parsed > 0xFFFF) {
            throw_bad_value(key, value, "Use an EtherType between 0x0600 and 0xFFFF");
        }
        config.ether_type = static_cast<std::uint16_t>(parsed);
        return;
    }
    if (name == "receive_directory" || name == "receive_dir") {
        if (value.empty()) {
            throw_bad_value(key, value, "Provide a directory path");
        }
        config.receive_directory = value;
        return;
    }
    if (name == "username") {
        if (value.empty()) {
            throw_bad_value(key, value, "Provide a non-empty display name");
        }
        config.username = value;
        return;
    }
    if (name == "logging") {
        bool parsed = true;
        if (!parse_bool(value, parsed)) {
            throw_bad_value(key, value, "Use true or false");
        }
        config.logging = parsed;
        return;
    }
    if (name == "log_level") {
        if (!util::parse_log_level(value).has_value()) {
            throw_bad_value(key, value, "Use debug, info, warning or error");
        }
        config.log_level = value;
        return;
    }

    throw ConfigError("E_CONFIG_KEY",
                      "Unknown configuration key: " + std::string(key),
                      "Supported keys: fragment_size, ack_timeout, max_retries, interface, ether_type, "
                      "receive_directory, username, logging, log_level");
}

Config parse_config_text(std::string_view text, Config base) {
    Config config = std::move(base);
    std::istringstream input{std::string(text)};
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        const auto content = trim_copy(strip_comment(line));
        if (content.empty()) {
            continue;
        }
        const auto colon = content.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw ConfigError("E_CONFIG_PARSE",
                              "Expected 'key: value' on line " + std::to_string(line_number),
                              "Each setting must be written as key: value");
        }
        apply_config_value(config, trim_copy(std::string_view(content).substr(0, colon)),
                           std::string_view(content).substr(colon + 1));
    }
    validate_config(config);
    return config;
}

Config load_config_file(const std::filesystem::path& path, Config base) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw ConfigError("E_CONFIG_IO",
                          "Unable to open configuration file: " + path.string(),
                          "Check the path passed to --config");
    }
    std::string text((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    return parse_config_text(text, std::move(base));
}

void validate_config(const Config& config) {
    if (config.fragment_size == 0) {
        throw ConfigError("E_CONFIG_VALUE", "fragment_size must be positive");
    }
    if (config.ack_timeout.count() <= 0) {
        throw ConfigError("E_CONFIG_VALUE", "ack_timeout must be positive");
    }
    if (config.max_retries == 0) {
        throw ConfigError("E_CONFIG_VALUE", "max_retries must allow at least one attempt");
    }
}

}  // namespace linkchat
