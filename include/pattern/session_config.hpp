/**
 * @file session_config.hpp
 * @brief Configuration structure for a DS205A device session
 * @version 0.1
 * @date 2025-11-18
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing (config/session_config.json)
 * 2. Environment variables (DS205A_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <map>

#include <nlohmann/json.hpp>

#include "../enums/protocol.hpp"
#include "../io/serial_port.hpp"
#include "../logging/logger.hpp"

namespace ds205a {

    /**
     * @brief Configuration for a DeviceSession
     *
     * Environment Variables:
     *
     * - DS205A_PORT: serial device path (default: "/dev/ttyUSB0")
     *
     * - DS205A_BAUD: baud rate in bps (default: 9600)
     *
     * - DS205A_DATA_BITS: 5..8 (default: 8)
     *
     * - DS205A_STOP_BITS: 1 or 2 (default: 1)
     *
     * - DS205A_PARITY: none/odd/even/mark/space (default: none)
     *
     * - DS205A_TIMEOUT_MS: per-exchange read budget in ms (default: 5000)
     *
     * - DS205A_READ_TIMEOUT_MS: single read timeout in ms (default: 2000)
     *
     * - DS205A_WRITE_TIMEOUT_MS: write timeout in ms (default: 2000)
     *
     * - DS205A_DEVICE_ID: gate address, decimal or 0x.. (default: 0x01)
     *
     * - DS205A_RETRY_COUNT: extra attempts after the first (default: 3)
     *
     * - DS205A_RETRY_BACKOFF_MS: linear backoff step in ms (default: 100)
     *
     * - DS205A_READ_ATTEMPTS: reads per response before giving up (default: 30)
     *
     * - DS205A_LOG_LEVEL: silent/error/warn/info/debug (default: silent)
     */
    struct SessionConfig {
        static constexpr int MAX_RETRY_COUNT = 100;

        // === Serial Line ===
        std::string port = "/dev/ttyUSB0";
        int baud_rate = DEFAULT_BAUD_RATE;
        int data_bits = DEFAULT_DATA_BITS;
        int stop_bits = DEFAULT_STOP_BITS;
        Parity parity = DEFAULT_PARITY;

        // === Timeouts (milliseconds) ===
        std::uint32_t timeout_ms = 5000;
        std::uint32_t read_timeout_ms = 2000;
        std::uint32_t write_timeout_ms = 2000;

        // === Addressing ===
        std::uint8_t device_id = DEFAULT_DEVICE_ID;

        // === Retry Policy ===
        int retry_count = 3;          // 0..MAX_RETRY_COUNT
        std::uint32_t retry_backoff_ms = 100;
        std::uint32_t read_attempts = 30;

        // === Diagnostics ===
        LogLevel log_level = LogLevel::SILENT;   // used when DeviceSession gets no logger

        /**
         * @brief Validate configuration
         * @throws ConfigException if any field is out of range
         */
        void validate() const;

        /**
         * @brief Line settings for the transport
         */
        SerialSettings serial_settings() const;

        std::string to_string() const;

        /**
         * @brief Create default configuration
         * @return SessionConfig with sensible defaults
         */
        static SessionConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file (e.g., session_config.json)
         * @return SessionConfig loaded from JSON file
         * @throws ConfigException if file cannot be read or parsed
         */
        static SessionConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing session_config
         * @return SessionConfig loaded from JSON
         * @throws ConfigException if JSON values are malformed
         */
        static SessionConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         * @return SessionConfig with merged settings
         */
        static SessionConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            /**
             * @brief Apply configuration from key-value map
             * @param config Configuration to update
             * @param vars Key-value pairs keyed by environment variable name
             */
            static void apply_config_map(SessionConfig& config,
                const std::map<std::string, std::string>& vars);

            /**
             * @brief Get environment variable with optional default
             */
            static std::string get_env(const std::string& name,
                const std::string& default_val = "");
    };

} // namespace ds205a
