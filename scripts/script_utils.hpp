/**
 * @file script_utils.hpp
 * @brief Shared utilities for the DS205A command-line programs
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include "../include/ds205a.hpp"
#include <string>
#include <vector>
#include <iostream>
#include <optional>
#include <functional>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <getopt.h>

namespace ds205a {

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt = *std::localtime(&timer);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

// === Command Table ===

    using CommandAction = std::function<void (DeviceSession&, std::uint8_t, const CancelToken&)>;

    struct CliCommand {
        std::string name;
        std::string category;
        std::string description;
        CommandAction action;
    };

    inline void print_status(const DeviceStatus& status) {
        std::cout << status.to_string() << "\n";
    }

/**
 * @brief Commands understood by ds205a_cli, grouped by category for the help text
 */
    inline const std::vector<CliCommand>& cli_commands() {
        static const std::vector<CliCommand> commands = {
            {"status", "Status", "Get device status",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Getting device status...\n";
                 print_status(s.get_status(c));
             }},
            {"info", "Status", "Get device information",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Getting device information...\n";
                 std::cout << s.get_device_info(c).to_string() << "\n";
             }},
            {"left-open", "Passage", "Open left passage (uses -v)",
             [](DeviceSession& s, std::uint8_t v, const CancelToken& c) {
                 std::cout << "Opening left passage with value " << static_cast<int>(v) <<
                     "...\n";
                 s.left_open(v, c);
             }},
            {"left-always-open", "Passage", "Keep left passage open",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Setting left passage to always open...\n";
                 s.left_always_open(c);
             }},
            {"right-open", "Passage", "Open right passage (uses -v)",
             [](DeviceSession& s, std::uint8_t v, const CancelToken& c) {
                 std::cout << "Opening right passage with value " << static_cast<int>(v) <<
                     "...\n";
                 s.right_open(v, c);
             }},
            {"right-always-open", "Passage", "Keep right passage open",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Setting right passage to always open...\n";
                 s.right_always_open(c);
             }},
            {"close-gate", "Passage", "Close the gate",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Closing gate...\n";
                 s.close_gate(c);
             }},
            {"forbid-left", "Restriction", "Forbid left passage",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Forbidding left passage...\n";
                 s.forbid_left_passage(c);
             }},
            {"forbid-right", "Restriction", "Forbid right passage",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Forbidding right passage...\n";
                 s.forbid_right_passage(c);
             }},
            {"disable-restrictions", "Restriction", "Lift all passage restrictions",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Disabling passage restrictions...\n";
                 s.disable_restrictions(c);
             }},
            {"reset-left-counters", "Counter", "Reset left pedestrian counter",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Resetting left counters...\n";
                 s.reset_left_counters(c);
             }},
            {"reset-right-counters", "Counter", "Reset right pedestrian counter",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Resetting right counters...\n";
                 s.reset_right_counters(c);
             }},
            {"set-params", "System", "Set device parameters (uses -v)",
             [](DeviceSession& s, std::uint8_t v, const CancelToken& c) {
                 std::cout << "Setting parameters with value " << static_cast<int>(v) <<
                     "...\n";
                 s.set_parameters(v, c);
             }},
            {"reset", "System", "Restart the device",
             [](DeviceSession& s, std::uint8_t, const CancelToken& c) {
                 std::cout << "Restarting device...\n";
                 s.restart_device(c);
             }}
        };
        return commands;
    }

/**
 * @brief Look up a command by name
 * @return Pointer into cli_commands(), or nullptr when unknown
 */
    inline const CliCommand* find_command(const std::string& name) {
        for (const auto& cmd : cli_commands()) {
            if (cmd.name == name) {
                return &cmd;
            }
        }
        return nullptr;
    }

// === Command-Line Argument Parsing ===

/**
 * @brief Program configuration structure
 *
 * Serial overrides stay empty unless given on the command line, so values
 * from the config file and the environment survive.
 */
    struct ScriptConfig {
        std::optional<std::string> config_file;
        std::optional<std::string> device;
        std::optional<int> baud_rate;
        std::optional<std::uint8_t> device_id;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<LogLevel> log_level;

        std::string command;
        std::uint8_t value = 1;
    };

/**
 * @brief Display help message for ds205a_cli
 * @param program_name The name of the program (argv[0])
 */
    inline void display_help(const std::string& program_name) {
        std::cout << "Usage: " << program_name << " -c <command> [OPTIONS]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -d <device>     Serial device path (default: /dev/ttyUSB0)\n";
        std::cout << "  -s <baudrate>   Serial baudrate (default: 9600)\n";
        std::cout << "  -i <id>         Device ID in hex or decimal (default: 0x01)\n";
        std::cout << "  -t <ms>         Response timeout in milliseconds (default: 5000)\n";
        std::cout << "  -c <command>    Command to execute\n";
        std::cout << "  -v <value>      Value for left-open, right-open, set-params (default: 1)\n";
        std::cout << "  -f <file>       JSON configuration file\n";
        std::cout << "  -l <level>      Log level: silent, error, warn, info, debug\n";
        std::cout << "  -h              Display this help message\n";
        std::cout << "\n";
        std::cout << "Commands:\n";

        std::string category;
        for (const auto& cmd : cli_commands()) {
            if (cmd.category != category) {
                category = cmd.category;
                std::cout << "  " << category << ":\n";
            }
            std::cout << "    " << std::left << std::setw(22) << cmd.name << cmd.description <<
                "\n";
        }

        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  # Read the gate status:\n";
        std::cout << "  " << program_name << " -d /dev/ttyUSB0 -c status\n\n";
        std::cout << "  # Let one pedestrian through on the left:\n";
        std::cout << "  " << program_name << " -i 0x02 -c left-open -v 1\n\n";
        std::cout << "  # Use a config file with debug tracing:\n";
        std::cout << "  " << program_name << " -f config/session_config.json -l debug -c info\n";
    }

/**
 * @brief Parse hex or decimal integer from string
 * @param value_str String representation of integer (supports 0x prefix for hex)
 * @return std::uint32_t Parsed integer value
 * @throws std::invalid_argument if string is not a valid integer
 */
    inline std::uint32_t parse_uint32(const std::string& value_str) {
        std::uint32_t value;
        std::size_t pos = 0;

        if (value_str.empty() || value_str[0] == '-') {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }

        try {
            if (value_str.size() >= 2 && value_str[0] == '0' &&
                (value_str[1] == 'x' || value_str[1] == 'X')) {
                value = static_cast<std::uint32_t>(std::stoul(value_str, &pos, 16));
            } else {
                value = static_cast<std::uint32_t>(std::stoul(value_str, &pos, 10));
            }
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("Integer out of range: " + value_str);
        }

        if (pos != value_str.size()) {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }

        return value;
    }

/**
 * @brief Parse a value that must fit in one byte
 * @throws std::invalid_argument if the value is not an integer in 0..255
 */
    inline std::uint8_t parse_byte(const std::string& value_str) {
        std::uint32_t value = parse_uint32(value_str);
        if (value > 0xFF) {
            throw std::invalid_argument("Value exceeds one byte: " + value_str);
        }
        return static_cast<std::uint8_t>(value);
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[]) {
        ScriptConfig config;
        int opt;

        while ((opt = getopt(argc, argv, "hd:s:i:t:c:v:f:l:")) != -1) {
            switch (opt) {
            case 'h':
                display_help(argv[0]);
                std::exit(0);

            case 'd':
                config.device = std::string(optarg);
                break;

            case 's':
                try {
                    std::uint32_t baud = parse_uint32(optarg);
                    if (baud == 0 || baud > 4000000) {
                        throw std::invalid_argument("Unsupported serial baudrate: " +
                            std::string(optarg));
                    }
                    config.baud_rate = static_cast<int>(baud);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Invalid serial baudrate: " << optarg << "\n";
                    throw;
                }
                break;

            case 'i':
                try {
                    config.device_id = parse_byte(optarg);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Invalid device ID: " << optarg << "\n";
                    std::cerr << "Use decimal or hex (0x...) format, 0..255\n";
                    throw;
                }
                break;

            case 't':
                try {
                    config.timeout_ms = parse_uint32(optarg);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Invalid timeout: " << optarg << "\n";
                    std::cerr << "Use positive integer (milliseconds)\n";
                    throw;
                }
                break;

            case 'c':
                config.command = optarg;
                break;

            case 'v':
                try {
                    config.value = parse_byte(optarg);
                } catch (const std::invalid_argument& e) {
                    std::cerr << "Invalid command value: " << optarg << "\n";
                    std::cerr << "Use decimal or hex (0x...) format, 0..255\n";
                    throw;
                }
                break;

            case 'f':
                config.config_file = std::string(optarg);
                break;

            case 'l': {
                    bool level_not_found = false;
                    LogLevel level = log_level_from_string(optarg, level_not_found);
                    if (level_not_found) {
                        std::cerr << "Invalid log level: " << optarg << "\n";
                        std::cerr << "Supported: silent, error, warn, info, debug\n";
                        throw std::invalid_argument("Unsupported log level: " +
                            std::string(optarg));
                    }
                    config.log_level = level;
                    break;
                }

            default:
                display_help(argv[0]);
                throw std::invalid_argument("Invalid command-line arguments");
            }
        }

        return config;
    }

/**
 * @brief Merge command-line overrides into the loaded session configuration
 *
 * Priority: command line > environment > JSON file > defaults
 */
    inline SessionConfig build_session_config(const ScriptConfig& script) {
        SessionConfig config = SessionConfig::load(script.config_file);

        if (script.device) config.port = *script.device;
        if (script.baud_rate) config.baud_rate = *script.baud_rate;
        if (script.device_id) config.device_id = *script.device_id;
        if (script.timeout_ms) config.timeout_ms = *script.timeout_ms;
        if (script.log_level) config.log_level = *script.log_level;

        config.validate();
        return config;
    }

} // namespace ds205a
