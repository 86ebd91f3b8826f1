/**
 * @file device_session.hpp
 * @brief Command/response session with one DS205A turnstile controller
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "../enums/protocol.hpp"
#include "../exception/ds205a_exception.hpp"
#include "../frame/frame_codec.hpp"
#include "../io/serial_port.hpp"
#include "../logging/logger.hpp"
#include "cancel_token.hpp"
#include "session_config.hpp"

namespace ds205a {

    /**
     * @brief Creates the transport for a session; called on every open()
     */
    using PortFactory = std::function<std::unique_ptr<ISerialPort>(const SerialSettings&)>;

    /**
     * @brief Device session for a DS205A turnstile
     *
     * Owns the serial transport while open and runs one strictly half-duplex
     * exchange at a time: write an 8-byte command, read back one 18-byte
     * response, retrying transient failures with linear backoff.
     *
     * @note The transport is created through a PortFactory so tests can inject
     * MockSerialPort. Production code uses RealSerialPort.
     */
    class DeviceSession {

        private:
            // # Configuration (immutable after construction)
            const SessionConfig config_;
            std::shared_ptr<Logger> logger_;
            PortFactory port_factory_;

            // # I/O abstraction
            std::unique_ptr<ISerialPort> serial_port_;
            bool is_open_ = false;

            // # Thread-safety primitives
            mutable std::shared_mutex state_mutex_;  // Protects is_open_ and serial_port_
            std::mutex exchange_mutex_;              // One command in flight per session

            // === Low-level exchange (state lock held shared, exchange lock held) ===

            /**
             * @brief Write one command frame
             * @throws DeviceException DWRITE_ERROR on error or partial write
             */
            void write_frame(const CommandFrame& frame);

            /**
             * @brief Read until one header-aligned response frame is available
             *
             * Reads in chunks of up to 32 bytes through a FrameSynchronizer, bounded
             * by read_attempts and by timeout_ms.
             *
             * @return std::vector<std::uint8_t> Exactly 18 bytes starting at the header
             * @throws CancelledException if the token is cancelled before a read
             * @throws DeviceException DREAD_ERROR if the first read fails
             * @throws TimeoutException INCOMPLETE_FRAME (with partial bytes) or NO_DATA
             */
            std::vector<std::uint8_t> read_response(const CancelToken& cancel);

            /**
             * @brief Sleep for the backoff of the given attempt, in small slices
             * so that cancellation is noticed
             */
            void backoff(int attempt, const CancelToken& cancel) const;

        public:
            /**
             * @brief Construct a closed session
             *
             * @param config Session configuration, validated here
             * @param logger Diagnostics sink; when null, a std::cerr logger at
             *        config.log_level is created
             * @param port_factory Transport factory (RealSerialPort by default)
             * @throws ConfigException if the configuration is invalid
             */
            explicit DeviceSession(SessionConfig config,
                std::shared_ptr<Logger> logger = nullptr,
                PortFactory port_factory = PortFactory());

            /**
             * @brief Destructor - closes the session if still open
             */
            ~DeviceSession();

            DeviceSession(const DeviceSession&) = delete;
            DeviceSession& operator=(const DeviceSession&) = delete;

            // === Lifecycle ===

            /**
             * @brief Open the transport and apply the configured timeouts
             *
             * No-op if already open.
             *
             * @throws DeviceException DNOT_FOUND / DOPEN_ERROR / DCONFIG_ERROR
             */
            void open();

            /**
             * @brief Release the transport. No-op if already closed.
             */
            void close();

            bool is_open() const {
                std::shared_lock<std::shared_mutex> lock(state_mutex_);
                return is_open_;
            }

            SessionConfig get_config() const { return config_; }

            std::shared_ptr<Logger> get_logger() const { return logger_; }

            std::string to_string() const;

            // === Generic exchange ===

            /**
             * @brief Send one command and return the validated response
             *
             * @param code Command code
             * @param data 0 to 3 parameter bytes
             * @param cancel Cooperative cancellation token
             * @return ResponseFrame Response whose execution byte reported success
             * @throws DeviceException DNOT_OPEN if the session is closed
             * @throws ProtocolException DATA_TOO_LARGE before any I/O
             * @throws ResponseException DEVICE_ID_MISMATCH / COMMAND_FAILED (not retried)
             * @throws ProtocolException FRAME_TOO_SHORT / INVALID_HEADER (not retried)
             * @throws CancelledException if cancelled (not retried)
             * @throws RetryExhaustedException when every attempt failed transiently
             */
            ResponseFrame send_command(CommandCode code,
                span<const std::uint8_t> data = {},
                const CancelToken& cancel = CancelToken::none());

            // === Typed operations ===

            DeviceStatus get_status(const CancelToken& cancel = CancelToken::none());

            DeviceInfo get_device_info(const CancelToken& cancel = CancelToken::none());

            /**
             * @brief Open the left passage
             * @param value Pass count / hold parameter forwarded as data byte 0
             */
            void left_open(std::uint8_t value, const CancelToken& cancel = CancelToken::none());
            void left_always_open(const CancelToken& cancel = CancelToken::none());

            /**
             * @brief Open the right passage
             * @param value Pass count / hold parameter forwarded as data byte 0
             */
            void right_open(std::uint8_t value, const CancelToken& cancel = CancelToken::none());
            void right_always_open(const CancelToken& cancel = CancelToken::none());

            void close_gate(const CancelToken& cancel = CancelToken::none());
            void forbid_left_passage(const CancelToken& cancel = CancelToken::none());
            void forbid_right_passage(const CancelToken& cancel = CancelToken::none());
            void disable_restrictions(const CancelToken& cancel = CancelToken::none());

            void reset_left_counters(const CancelToken& cancel = CancelToken::none());
            void reset_right_counters(const CancelToken& cancel = CancelToken::none());

            void set_parameters(std::uint8_t value, const CancelToken& cancel = CancelToken::none());

            /**
             * @brief Restart the controller (sends the 0x60 confirmation byte)
             */
            void restart_device(const CancelToken& cancel = CancelToken::none());
    };

} // namespace ds205a
