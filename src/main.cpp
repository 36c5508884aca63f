#include "linkchat/Config.hpp"
#include "linkchat/ConfigLoader.hpp"
#include "linkchat/Types.hpp"
#include "linkchat/core/LinkNode.hpp"
#include "linkchat/network/RawSocketTransport.hpp"
#include "linkchat/util/StructuredLogger.hpp"

#include <array>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <signal.h>

namespace {

using namespace linkchat;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& message() const& {
        return message_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

std::atomic<bool> g_run_loop{false};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
        g_run_loop.store(false, std::memory_order_release);
        break;
    default:
        break;
    }
}

void install_termination_handlers() {
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
}

void uninstall_termination_handlers() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGQUIT
    std::signal(SIGQUIT, SIG_DFL);
#endif
}

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
};

void print_usage() {
    std::cout << "Link-Chat" << std::endl;
    std::cout << "Usage: linkchat [options] <command> [args]\n\n";
    std::cout << "Options:\n"
              << "  --config <file>          Load settings from a key: value file\n"
              << "  --interface <name>       Network interface (default: first non-loopback)\n"
              << "  --fragment-size <bytes>  Payload bytes per FILE_DATA fragment\n"
              << "  --ack-timeout <dur>      Wait per fragment before retransmitting (e.g. 500ms, 1s)\n"
              << "  --max-retries <n>        Attempts per fragment before giving up\n"
              << "  --receive-dir <path>     Where received files and folders are written\n"
              << "  --username <name>        Name announced in discovery replies\n"
              << "  --no-log                 Disable structured logging on stderr\n"
              << "  --verbose                Include debug events in the log\n"
              << "  -h, --help               Show this help\n\n";
    std::cout << "Commands:\n"
              << "  listen                       Receive messages and files until interrupted\n"
              << "  send <peer> <text>           Send a chat message\n"
              << "  send-file <peer> <path>      Send a file reliably\n"
              << "  send-folder <peer> <path>    Send a folder and its contents\n"
              << "  discover [seconds]           Broadcast a discovery request and list replies\n"
              << "  chat                         Interactive session\n\n";
    std::cout << "A peer is a MAC address (aa:bb:cc:dd:ee:ff) or the username of a discovered peer." << std::endl;
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_uint32(std::string_view text, std::uint32_t& value) {
    std::uint64_t temp{};
    if (!parse_uint64(text, temp) || temp > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    value = static_cast<std::uint32_t>(temp);
    return true;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

std::string join_words(const std::vector<std::string>& words, std::size_t from) {
    std::string joined;
    for (std::size_t i = from; i < words.size(); ++i) {
        if (!joined.empty()) {
            joined.push_back(' ');
        }
        joined += words[i];
    }
    return joined;
}

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

Config build_config(const GlobalOptions& options) {
    try {
        Config config = options.config_path.has_value() ? load_config_file(*options.config_path) : Config{};
        for (const auto& [key, value] : options.overrides) {
            apply_config_value(config, key, value);
        }
        validate_config(config);
        return config;
    } catch (const ConfigError& error) {
        throw_cli_error(error.code(), error.message(), error.hint());
    }
}

MacAddress resolve_peer(const core::LinkNode& node, const std::string& text) {
    if (const auto mac = mac_from_string(text)) {
        return *mac;
    }
    if (const auto peer = node.find_peer(text)) {
        return peer->address;
    }
    throw_cli_error("E_UNKNOWN_PEER",
                    "Unknown peer: " + text,
                    "Use a MAC address like aa:bb:cc:dd:ee:ff, or run 'discover' to learn peer usernames");
}

void print_peers(const core::LinkNode& node) {
    const auto peers = node.known_peers();
    if (peers.empty()) {
        std::cout << "No peers discovered." << std::endl;
        return;
    }
    for (const auto& peer : peers) {
        std::cout << "  " << mac_to_string(peer.address) << "  " << peer.username << std::endl;
    }
}

bool report_transfer(const transfer::TransferResult& result) {
    if (const auto* failure = std::get_if<transfer::TransferFailure>(&result)) {
        std::cerr << "Send failed: " << failure->describe() << std::endl;
        return false;
    }
    const auto& report = std::get<transfer::TransferReport>(result);
    std::cout << "Sent '" << report.name << "' (" << format_bytes(report.byte_count) << ", "
              << report.fragment_count << " fragments, " << report.retransmissions << " retransmissions) in "
              << report.elapsed.count() << " ms" << std::endl;
    return true;
}

bool report_folder(const core::FolderResult& result) {
    if (const auto* failure = std::get_if<transfer::TransferFailure>(&result)) {
        std::cerr << "Folder send failed: " << failure->describe() << std::endl;
        return false;
    }
    const auto& report = std::get<core::FolderReport>(result);
    std::cout << "Sent folder '" << report.root << "' (" << report.files.size() << " files, "
              << report.folders << " folders, " << format_bytes(report.byte_count) << ")" << std::endl;
    return true;
}

void wait_for(std::chrono::milliseconds duration) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_run_loop.load(std::memory_order_acquire) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void run_chat(core::LinkNode& node) {
    std::cout << "Commands: discover | peers | send <peer> <text> | sendfile <peer> <path> | "
                 "sendfolder <peer> <path> | exit"
              << std::endl;
    std::string line;
    while (g_run_loop.load(std::memory_order_acquire)) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        const auto words = split_words(line);
        if (words.empty()) {
            continue;
        }
        const auto& command = words.front();
        try {
            if (command == "exit" || command == "quit") {
                break;
            }
            if (command == "discover") {
                if (!node.discover()) {
                    std::cerr << "Discovery request could not be sent." << std::endl;
                }
                continue;
            }
            if (command == "peers") {
                print_peers(node);
                continue;
            }
            if (command == "send" || command == "sendfile" || command == "sendfolder") {
                if (words.size() < 3) {
                    throw_cli_error("E_MISSING_ARGUMENT", "Usage: " + command + " <peer> <" +
                                                              (command == "send" ? "text" : "path") + ">");
                }
                const auto peer = resolve_peer(node, words[1]);
                if (command == "send") {
                    if (!node.send_text(peer, join_words(words, 2))) {
                        std::cerr << "Message could not be sent." << std::endl;
                    }
                } else if (command == "sendfile") {
                    report_transfer(node.send_file(peer, join_words(words, 2)));
                } else {
                    report_folder(node.send_folder(peer, join_words(words, 2)));
                }
                continue;
            }
            throw_cli_error("E_UNKNOWN_COMMAND", "Unknown chat command: " + command);
        } catch (const CliException& ex) {
            print_cli_error(ex);
        }
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return args[index++];
        };

        while (index < args.size() && args[index].starts_with("-")) {
            const auto opt = args[index++];
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path.has_value()) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--no-log") {
                options.overrides.emplace_back("logging", "false");
                continue;
            }
            if (opt == "--verbose") {
                options.overrides.emplace_back("log_level", "debug");
                continue;
            }
            if (opt == "--interface" || opt == "--fragment-size" || opt == "--ack-timeout" ||
                opt == "--max-retries" || opt == "--receive-dir" || opt == "--username") {
                options.overrides.emplace_back(opt.substr(2), require_value(opt));
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + opt,
                            "Run 'linkchat --help' to see the supported options");
        }

        if (index >= args.size()) {
            print_usage();
            return 1;
        }
        const std::string command = args[index++];
        const std::vector<std::string> rest(args.begin() + static_cast<std::ptrdiff_t>(index), args.end());

        if (command == "send" || command == "send-file" || command == "send-folder") {
            if (rest.size() < 2) {
                throw_cli_error("E_MISSING_ARGUMENT",
                                command + " requires a peer and " + (command == "send" ? "a message" : "a path"),
                                "Example: linkchat " + command + " aa:bb:cc:dd:ee:ff " +
                                    (command == "send" ? "hello" : "./data"));
            }
        } else if (command == "discover") {
            if (rest.size() > 1) {
                throw_cli_error("E_UNEXPECTED_ARGUMENT", "discover takes at most one argument");
            }
        } else if (command == "listen" || command == "chat") {
            if (!rest.empty()) {
                throw_cli_error("E_UNEXPECTED_ARGUMENT", command + " takes no arguments");
            }
        } else {
            throw_cli_error("E_UNKNOWN_COMMAND",
                            "Unknown command: " + command,
                            "Run 'linkchat --help' to see the list of available commands");
        }

        std::uint32_t discover_seconds = 3;
        if (command == "discover" && !rest.empty() && !parse_uint32(rest.front(), discover_seconds)) {
            throw_cli_error("E_INVALID_VALUE", "discover expects a number of seconds, got '" + rest.front() + "'");
        }

        Config config = build_config(options);
        auto& logger = util::StructuredLogger::instance();
        logger.set_enabled(config.logging);
        logger.set_minimum_level(util::parse_log_level(config.log_level).value_or(util::StructuredLogger::Level::Info));

        std::string interface_name = config.interface_name;
        if (interface_name.empty()) {
            try {
                interface_name = network::find_default_interface();
            } catch (const std::runtime_error& ex) {
                throw_cli_error("E_NO_INTERFACE", ex.what(), "Pass --interface <name> explicitly");
            }
        }

        network::RawSocketTransport transport(interface_name, config.ether_type);
        core::LinkNode node(transport, config);
        node.set_text_handler([](const MacAddress& peer, const std::string& text) {
            std::cout << "\n[" << mac_to_string(peer) << "] " << text << std::endl;
        });
        node.on_transfer_complete([](const std::string& name, std::uint64_t byte_count, const MacAddress& peer) {
            std::cout << "\nReceived '" << name << "' (" << format_bytes(byte_count) << ") from "
                      << mac_to_string(peer) << std::endl;
        });

        try {
            node.start();
        } catch (const std::runtime_error& ex) {
            throw_cli_error("E_TRANSPORT",
                            ex.what(),
                            "Raw sockets need CAP_NET_RAW; run as root or grant the capability to the binary");
        }

        g_run_loop.store(true, std::memory_order_release);
        install_termination_handlers();

        int exit_code = 0;
        if (command == "listen") {
            std::cout << "Listening on " << interface_name << " as " << mac_to_string(node.address())
                      << " (" << config.username << "). Press Ctrl+C to stop." << std::endl;
            while (g_run_loop.load(std::memory_order_acquire)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        } else if (command == "send") {
            const auto peer = resolve_peer(node, rest[0]);
            if (!node.send_text(peer, join_words(rest, 1))) {
                uninstall_termination_handlers();
                throw_cli_error("E_SEND_FAILED", "Message could not be sent");
            }
        } else if (command == "send-file") {
            exit_code = report_transfer(node.send_file(resolve_peer(node, rest[0]), rest[1])) ? 0 : 1;
        } else if (command == "send-folder") {
            exit_code = report_folder(node.send_folder(resolve_peer(node, rest[0]), rest[1])) ? 0 : 1;
        } else if (command == "discover") {
            if (!node.discover()) {
                uninstall_termination_handlers();
                throw_cli_error("E_SEND_FAILED", "Discovery request could not be sent");
            }
            wait_for(std::chrono::seconds(discover_seconds));
            print_peers(node);
        } else {
            run_chat(node);
        }

        uninstall_termination_handlers();
        node.stop();
        return exit_code;
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
