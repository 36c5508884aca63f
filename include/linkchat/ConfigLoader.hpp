#pragma once

#include "linkchat/Config.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>

namespace linkchat {

class ConfigError : public std::exception {
public:
    ConfigError(std::string code, std::string message, std::string hint = {});

    const char* what() const noexcept override { return formatted_.c_str(); }

    const std::string& code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& hint() const noexcept { return hint_; }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

// Reads a flat "key: value" document. Unknown keys and bad values raise ConfigError.
Config load_config_file(const std::filesystem::path& path, Config base = {});
Config parse_config_text(std::string_view text, Config base = {});

void apply_config_value(Config& config, std::string_view key, std::string_view value);
void validate_config(const Config& config);

bool parse_duration_ms(std::string_view text, std::chrono::milliseconds& duration);

}  // namespace linkchat
