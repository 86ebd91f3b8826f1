/**
 * @file session_config.cpp
 * @brief SessionConfig implementation
 * @version 0.1
 * @date 2025-11-18
 */

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../include/pattern/session_config.hpp"
#include "../include/exception/ds205a_exception.hpp"

using json = nlohmann::json;

namespace ds205a {

    namespace {

        // Every key understood by apply_config_map(), in the same order as
        // the JSON field table below.
        const char* const ENV_KEYS[] = {
            "DS205A_PORT",
            "DS205A_BAUD",
            "DS205A_DATA_BITS",
            "DS205A_STOP_BITS",
            "DS205A_PARITY",
            "DS205A_TIMEOUT_MS",
            "DS205A_READ_TIMEOUT_MS",
            "DS205A_WRITE_TIMEOUT_MS",
            "DS205A_DEVICE_ID",
            "DS205A_RETRY_COUNT",
            "DS205A_RETRY_BACKOFF_MS",
            "DS205A_READ_ATTEMPTS",
            "DS205A_LOG_LEVEL"
        };

        const char* const JSON_KEYS[] = {
            "port",
            "baud_rate",
            "data_bits",
            "stop_bits",
            "parity",
            "timeout_ms",
            "read_timeout_ms",
            "write_timeout_ms",
            "device_id",
            "retry_count",
            "retry_backoff_ms",
            "read_attempts",
            "log_level"
        };

        long parse_long(const std::string& key, const std::string& text) {
            try {
                std::size_t pos = 0;
                long value = std::stol(text, &pos, 0);  // Support hex (0x...)
                if (pos != text.size()) {
                    throw ConfigException(key + ": trailing characters in '" + text + "'");
                }
                return value;
            } catch (const std::invalid_argument&) {
                throw ConfigException(key + ": not a number '" + text + "'");
            } catch (const std::out_of_range&) {
                throw ConfigException(key + ": out of range '" + text + "'");
            }
        }

        std::uint32_t parse_u32(const std::string& key, const std::string& text) {
            long value = parse_long(key, text);
            if (value < 0 || value > 0xFFFFFFFFL) {
                throw ConfigException(key + ": must be a non-negative 32-bit value, got " + text);
            }
            return static_cast<std::uint32_t>(value);
        }

        int parse_int(const std::string& key, const std::string& text) {
            long value = parse_long(key, text);
            if (value < std::numeric_limits<int>::min() ||
                value > std::numeric_limits<int>::max()) {
                throw ConfigException(key + ": out of range '" + text + "'");
            }
            return static_cast<int>(value);
        }

    } // namespace

    // === Configuration Validation ===

    void SessionConfig::validate() const {
        if (port.empty()) {
            throw ConfigException("port cannot be empty");
        }

        // NOTE: no check that the device node exists; open() reports DNOT_FOUND.

        if (baud_rate <= 0) {
            throw ConfigException("baud_rate must be > 0, got " + std::to_string(baud_rate));
        }
        if (data_bits < 5 || data_bits > 8) {
            throw ConfigException("data_bits must be 5..8, got " + std::to_string(data_bits));
        }
        if (stop_bits != 1 && stop_bits != 2) {
            throw ConfigException("stop_bits must be 1 or 2, got " + std::to_string(stop_bits));
        }
        switch (parity) {
        case Parity::NONE:
        case Parity::ODD:
        case Parity::EVEN:
        case Parity::MARK:
        case Parity::SPACE:
            break;
        default:
            throw ConfigException("parity out of range: " +
                std::to_string(static_cast<int>(parity)));
        }

        // Validate timeouts
        if (timeout_ms == 0) {
            throw ConfigException("timeout_ms must be > 0");
        }
        if (read_timeout_ms == 0) {
            throw ConfigException("read_timeout_ms must be > 0");
        }
        if (write_timeout_ms == 0) {
            throw ConfigException("write_timeout_ms must be > 0");
        }
        if (read_timeout_ms > 60000 || write_timeout_ms > 60000) {
            throw ConfigException("read/write timeout too large (max 60000ms)");
        }

        if (retry_count < 0) {
            throw ConfigException("retry_count must be >= 0, got " + std::to_string(retry_count));
        }
        if (retry_count > MAX_RETRY_COUNT) {
            throw ConfigException("retry_count must be <= " + std::to_string(MAX_RETRY_COUNT) +
                ", got " + std::to_string(retry_count));
        }
        if (read_attempts == 0) {
            throw ConfigException("read_attempts must be > 0");
        }
    }

    SerialSettings SessionConfig::serial_settings() const {
        SerialSettings settings;
        settings.device_path = port;
        settings.baud_rate = baud_rate;
        settings.data_bits = data_bits;
        settings.stop_bits = stop_bits;
        settings.parity = parity;
        settings.read_timeout_ms = read_timeout_ms;
        settings.write_timeout_ms = write_timeout_ms;
        return settings;
    }

    std::string SessionConfig::to_string() const {
        std::ostringstream oss;
        oss << port << " " << baud_rate << " " << data_bits
            << parity_to_string(parity)[0] << stop_bits
            << ", id=" << format_byte(device_id)
            << ", timeout=" << timeout_ms << "ms"
            << ", retries=" << retry_count
            << ", backoff=" << retry_backoff_ms << "ms";
        return oss.str();
    }

    // === Factory Methods ===

    SessionConfig SessionConfig::create_default() {
        SessionConfig config;
        config.port = "/dev/ttyUSB0";
        config.baud_rate = DEFAULT_BAUD_RATE;
        config.data_bits = DEFAULT_DATA_BITS;
        config.stop_bits = DEFAULT_STOP_BITS;
        config.parity = DEFAULT_PARITY;
        config.timeout_ms = 5000;
        config.read_timeout_ms = 2000;
        config.write_timeout_ms = 2000;
        config.device_id = DEFAULT_DEVICE_ID;
        config.retry_count = 3;
        config.retry_backoff_ms = 100;
        config.read_attempts = 30;
        config.log_level = LogLevel::SILENT;
        return config;
    }

    // === Environment Variable Helpers ===

    std::string SessionConfig::get_env(const std::string& name, const std::string& default_val) {
        const char* val = std::getenv(name.c_str());
        return val ? std::string(val) : default_val;
    }

    // === JSON Parsing ===

    SessionConfig SessionConfig::from_json(const json& j) {
        SessionConfig config = create_default();

        // Convert JSON to string map to reuse apply_config_map logic
        std::map<std::string, std::string> config_map;

        if (j.contains("session_config")) {
            const auto& sc = j["session_config"];
            constexpr std::size_t key_count = sizeof(JSON_KEYS) / sizeof(JSON_KEYS[0]);

            for (std::size_t i = 0; i < key_count; ++i) {
                if (!sc.contains(JSON_KEYS[i])) {
                    continue;
                }
                const auto& field = sc[JSON_KEYS[i]];
                if (field.is_string()) {
                    config_map[ENV_KEYS[i]] = field.get<std::string>();
                } else if (field.is_number_integer()) {
                    config_map[ENV_KEYS[i]] = std::to_string(field.get<long long>());
                } else {
                    throw ConfigException(std::string("session_config.") + JSON_KEYS[i] +
                        ": expected string or integer, got " + field.type_name());
                }
            }
        }

        apply_config_map(config, config_map);

        return config;
    }

    // === Configuration Application ===

    void SessionConfig::apply_config_map(SessionConfig& config,
        const std::map<std::string, std::string>& vars) {
        // Helper to get value with key
        auto get_val = [&vars](const std::string& key) -> std::optional<std::string> {
                auto it = vars.find(key);
                if (it != vars.end()) {
                    return it->second;
                }
                return std::nullopt;
            };

        if (auto val = get_val("DS205A_PORT")) {
            config.port = *val;
        }

        // Line settings
        if (auto val = get_val("DS205A_BAUD")) {
            config.baud_rate = parse_int("DS205A_BAUD", *val);
        }
        if (auto val = get_val("DS205A_DATA_BITS")) {
            config.data_bits = parse_int("DS205A_DATA_BITS", *val);
        }
        if (auto val = get_val("DS205A_STOP_BITS")) {
            config.stop_bits = parse_int("DS205A_STOP_BITS", *val);
        }
        if (auto val = get_val("DS205A_PARITY")) {
            bool use_default = false;
            config.parity = parity_from_string(*val, use_default);
            if (use_default) {
                throw ConfigException("Invalid parity: " + *val);
            }
        }

        // Timeouts
        if (auto val = get_val("DS205A_TIMEOUT_MS")) {
            config.timeout_ms = parse_u32("DS205A_TIMEOUT_MS", *val);
        }
        if (auto val = get_val("DS205A_READ_TIMEOUT_MS")) {
            config.read_timeout_ms = parse_u32("DS205A_READ_TIMEOUT_MS", *val);
        }
        if (auto val = get_val("DS205A_WRITE_TIMEOUT_MS")) {
            config.write_timeout_ms = parse_u32("DS205A_WRITE_TIMEOUT_MS", *val);
        }

        // Addressing
        if (auto val = get_val("DS205A_DEVICE_ID")) {
            long id = parse_long("DS205A_DEVICE_ID", *val);
            if (id < 0 || id > 0xFF) {
                throw ConfigException("Device ID must fit in one byte: " + *val);
            }
            config.device_id = static_cast<std::uint8_t>(id);
        }

        // Retry policy
        if (auto val = get_val("DS205A_RETRY_COUNT")) {
            config.retry_count = parse_int("DS205A_RETRY_COUNT", *val);
        }
        if (auto val = get_val("DS205A_RETRY_BACKOFF_MS")) {
            config.retry_backoff_ms = parse_u32("DS205A_RETRY_BACKOFF_MS", *val);
        }
        if (auto val = get_val("DS205A_READ_ATTEMPTS")) {
            config.read_attempts = parse_u32("DS205A_READ_ATTEMPTS", *val);
        }

        if (auto val = get_val("DS205A_LOG_LEVEL")) {
            bool use_default = false;
            config.log_level = log_level_from_string(*val, use_default);
            if (use_default) {
                throw ConfigException("Invalid log level: " + *val);
            }
        }
    }

    // === Load Methods ===

    SessionConfig SessionConfig::from_file(const std::string& filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw ConfigException("Cannot open JSON config file: " + filepath);
        }

        try {
            json j;
            file >> j;
            return from_json(j);
        } catch (const json::exception& e) {
            throw ConfigException("JSON parse error in " + filepath + ": " + e.what());
        }
    }

    SessionConfig SessionConfig::load(const std::optional<std::string>& config_file_path) {
        // Start with defaults, then the JSON file when given
        SessionConfig config = config_file_path.has_value()
            ? from_file(*config_file_path)
            : create_default();

        // Apply environment variables (highest priority)
        std::map<std::string, std::string> env_vars;
        for (const char* key : ENV_KEYS) {
            std::string val = get_env(key);
            if (!val.empty()) {
                env_vars[key] = val;
            }
        }

        if (!env_vars.empty()) {
            apply_config_map(config, env_vars);
        }

        return config;
    }

} // namespace ds205a
