/**
 * @file device_session.cpp
 * @brief DS205A device session implementation
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "../include/pattern/device_session.hpp"
#include "../include/pattern/frame_synchronizer.hpp"
#include "../include/io/real_serial_port.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <thread>

namespace ds205a {

    namespace {
        constexpr std::size_t READ_CHUNK_SIZE = 32;
        constexpr std::uint32_t BACKOFF_SLICE_MS = 10;

        /**
         * @brief Throw for a failed codec result, naming the operation in its trail
         */
        template<typename T>
        void throw_if_failed(const Result<T>& result, const std::string& op) {
            const auto forwarded = Result<void>::error(result, op);
            throw_if_error(forwarded.error(), forwarded.trail());
        }
    }

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    DeviceSession::DeviceSession(SessionConfig config, std::shared_ptr<Logger> logger,
        PortFactory port_factory)
        : config_(std::move(config)),
        logger_(logger ? std::move(logger) : std::make_shared<Logger>(config_.log_level)),
        port_factory_(std::move(port_factory)) {

        // Fail fast, before any transport exists
        config_.validate();

        if (!port_factory_) {
            port_factory_ = [](const SerialSettings& settings) -> std::unique_ptr<ISerialPort> {
                    return std::make_unique<RealSerialPort>(settings);
                };
        }
    }

    DeviceSession::~DeviceSession() {
        close();
    }

    // ===================================================================
    // Lifecycle
    // ===================================================================

    void DeviceSession::open() {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (is_open_) {
            return;
        }

        std::unique_ptr<ISerialPort> port = port_factory_(config_.serial_settings());
        if (!port) {
            throw DeviceException(Status::DOPEN_ERROR,
                "DeviceSession::open: no transport for " + config_.port);
        }

        port->open();  // throws DeviceException
        port->set_read_timeout(config_.read_timeout_ms);
        port->set_write_timeout(config_.write_timeout_ms);

        serial_port_ = std::move(port);
        is_open_ = true;

        logger_->info("Opened " + config_.to_string());
    }

    void DeviceSession::close() {
        std::unique_lock<std::shared_mutex> lock(state_mutex_);
        if (!is_open_) {
            return;
        }

        if (serial_port_) {
            serial_port_->close();
            serial_port_.reset();
        }
        is_open_ = false;

        logger_->info("Closed " + config_.port);
    }

    std::string DeviceSession::to_string() const {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        std::ostringstream oss;
        oss << "DeviceSession(";
        oss << "Port: " << config_.port << ", ";
        oss << "Baudrate: " << config_.baud_rate << ", ";
        oss << "Device ID: " << format_byte(config_.device_id) << ", ";
        oss << "Open: " << (is_open_ ? "Yes" : "No");
        oss << ")";
        return oss.str();
    }

    // ===================================================================
    // Low-level exchange
    // ===================================================================

    void DeviceSession::write_frame(const CommandFrame& frame) {
        logger_->debug("TX: " + format_hex(frame.view()));

        ssize_t bytes_written = serial_port_->write(frame.bytes().data(), frame.size());
        if (bytes_written < 0) {
            throw DeviceException(Status::DWRITE_ERROR,
                "write_frame: " + std::string(std::strerror(errno)));
        }
        if (static_cast<std::size_t>(bytes_written) != frame.size()) {
            throw DeviceException(Status::DWRITE_ERROR,
                "write_frame: partial write " + std::to_string(bytes_written) +
                "/" + std::to_string(frame.size()));
        }
    }

    std::vector<std::uint8_t> DeviceSession::read_response(const CancelToken& cancel) {
        FrameSynchronizer sync;
        std::uint8_t chunk[READ_CHUNK_SIZE];
        std::size_t total_received = 0;
        std::uint32_t reads = 0;

        auto start_time = std::chrono::steady_clock::now();

        while (reads < config_.read_attempts) {
            if (cancel.is_cancelled()) {
                throw CancelledException("read_response: cancelled after " +
                    std::to_string(total_received) + " bytes");
            }

            // Check timeout
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time
            ).count();
            if (elapsed >= static_cast<long long>(config_.timeout_ms)) {
                logger_->debug("read_response: timeout after " + std::to_string(elapsed) + "ms");
                break;
            }

            auto remaining = static_cast<std::uint32_t>(config_.timeout_ms - elapsed);
            int wait_ms = static_cast<int>(std::min(config_.read_timeout_ms, remaining));

            ++reads;
            ssize_t bytes_read = serial_port_->read(chunk, sizeof(chunk), wait_ms);

            if (bytes_read < 0) {
                if (total_received == 0) {
                    throw DeviceException(Status::DREAD_ERROR,
                        "read_response: " + std::string(std::strerror(errno)));
                }
                // Keep what was already collected and try again
                logger_->debug("read_response: ignoring read error after " +
                    std::to_string(total_received) + " bytes: " + std::strerror(errno));
                continue;
            }
            if (bytes_read == 0) {
                continue;
            }

            total_received += static_cast<std::size_t>(bytes_read);
            span<const std::uint8_t> received(chunk, static_cast<std::size_t>(bytes_read));
            logger_->debug("RX: " + format_hex(received));

            if (sync.feed(received)) {
                if (sync.discarded() > 0) {
                    logger_->debug("read_response: skipped " +
                        std::to_string(sync.discarded()) + " bytes before header");
                }
                return sync.take_frame();
            }
        }

        if (total_received > 0) {
            throw TimeoutException(Status::INCOMPLETE_FRAME,
                "read_response: " + std::to_string(sync.buffered()) + "/" +
                std::to_string(RESPONSE_FRAME_SIZE) + " bytes after " +
                std::to_string(reads) + " reads",
                sync.pending());
        }
        throw TimeoutException(Status::NO_DATA,
            "read_response: nothing received after " + std::to_string(reads) + " reads");
    }

    void DeviceSession::backoff(int attempt, const CancelToken& cancel) const {
        auto delay = std::chrono::milliseconds(
            static_cast<std::uint64_t>(attempt) * config_.retry_backoff_ms);
        auto deadline = std::chrono::steady_clock::now() + delay;

        // Checked at least once, even for a zero step
        do {
            if (cancel.is_cancelled()) {
                throw CancelledException("backoff: cancelled before attempt " +
                    std::to_string(attempt + 1));
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() > 0) {
                std::this_thread::sleep_for(
                    std::min(left, std::chrono::milliseconds(BACKOFF_SLICE_MS)));
            }
        } while (std::chrono::steady_clock::now() < deadline);
    }

    // ===================================================================
    // Generic exchange
    // ===================================================================

    ResponseFrame DeviceSession::send_command(CommandCode code,
        span<const std::uint8_t> data,
        const CancelToken& cancel) {
        const std::string name = command_to_string(code);

        // Shared lock for the whole exchange: open/close wait for it to finish
        std::shared_lock<std::shared_mutex> state_lock(state_mutex_);
        if (!is_open_ || !serial_port_) {
            throw DeviceException(Status::DNOT_OPEN, name + ": session is not open");
        }

        auto built = FrameCodec::build_command(config_.device_id, code, data);
        throw_if_failed(built, name);
        const CommandFrame& frame = built.value();

        // Exclusive exchange lock - strict half duplex
        std::lock_guard<std::mutex> exchange_lock(exchange_mutex_);

        const int total_attempts = config_.retry_count + 1;
        Status last_status = Status::UNKNOWN;
        std::string last_error;
        std::vector<std::uint8_t> last_partial;

        for (int attempt = 0; attempt < total_attempts; ++attempt) {
            if (attempt > 0) {
                logger_->debug(name + ": retry " + std::to_string(attempt) + " in " +
                    std::to_string(attempt * config_.retry_backoff_ms) + "ms");
                backoff(attempt, cancel);
            }
            if (cancel.is_cancelled()) {
                throw CancelledException(name + ": cancelled before attempt " +
                    std::to_string(attempt + 1));
            }

            try {
                write_frame(frame);
                std::vector<std::uint8_t> raw = read_response(cancel);

                auto parsed = FrameCodec::parse_response(
                    span<const std::uint8_t>(raw.data(), raw.size()), config_.device_id);
                // Rejected by the device or malformed: surfaced without retry
                throw_if_failed(parsed, name);

                if (!parsed.value().checksum_valid()) {
                    logger_->debug(name + ": response checksum " +
                        format_byte(parsed.value().checksum()) + " does not match, accepted");
                }
                return parsed.value();

            } catch (const DS205AException& e) {
                if (!is_transient(e.status())) {
                    throw;
                }
                last_status = e.status();
                last_error = e.what();
                if (auto* timeout = dynamic_cast<const TimeoutException*>(&e)) {
                    last_partial = timeout->partial_frame();
                } else {
                    last_partial.clear();
                }
                logger_->warn(name + " attempt " + std::to_string(attempt + 1) + "/" +
                    std::to_string(total_attempts) + " failed: " + last_error);
            }
        }

        logger_->error(name + ": no valid response after " +
            std::to_string(total_attempts) + " attempts");
        throw RetryExhaustedException(last_status, total_attempts,
            name + ": no valid response after " + std::to_string(total_attempts) +
            " attempts: " + last_error,
            std::move(last_partial));
    }

    // ===================================================================
    // Typed operations
    // ===================================================================

    DeviceStatus DeviceSession::get_status(const CancelToken& cancel) {
        return FrameCodec::to_status(send_command(CommandCode::GET_STATUS, {}, cancel));
    }

    DeviceInfo DeviceSession::get_device_info(const CancelToken& cancel) {
        return FrameCodec::to_device_info(send_command(CommandCode::GET_STATUS, {}, cancel));
    }

    void DeviceSession::left_open(std::uint8_t value, const CancelToken& cancel) {
        const std::uint8_t data[] = {value};
        send_command(CommandCode::LEFT_OPEN, span<const std::uint8_t>(data, 1), cancel);
    }

    void DeviceSession::left_always_open(const CancelToken& cancel) {
        send_command(CommandCode::LEFT_ALWAYS_OPEN, {}, cancel);
    }

    void DeviceSession::right_open(std::uint8_t value, const CancelToken& cancel) {
        const std::uint8_t data[] = {value};
        send_command(CommandCode::RIGHT_OPEN, span<const std::uint8_t>(data, 1), cancel);
    }

    void DeviceSession::right_always_open(const CancelToken& cancel) {
        send_command(CommandCode::RIGHT_ALWAYS_OPEN, {}, cancel);
    }

    void DeviceSession::close_gate(const CancelToken& cancel) {
        send_command(CommandCode::CLOSE_GATE, {}, cancel);
    }

    void DeviceSession::forbid_left_passage(const CancelToken& cancel) {
        send_command(CommandCode::FORBID_LEFT_PASSAGE, {}, cancel);
    }

    void DeviceSession::forbid_right_passage(const CancelToken& cancel) {
        send_command(CommandCode::FORBID_RIGHT_PASSAGE, {}, cancel);
    }

    void DeviceSession::disable_restrictions(const CancelToken& cancel) {
        send_command(CommandCode::DISABLE_RESTRICTIONS, {}, cancel);
    }

    void DeviceSession::reset_left_counters(const CancelToken& cancel) {
        send_command(CommandCode::RESET_LEFT_COUNTERS, {}, cancel);
    }

    void DeviceSession::reset_right_counters(const CancelToken& cancel) {
        send_command(CommandCode::RESET_RIGHT_COUNTERS, {}, cancel);
    }

    void DeviceSession::set_parameters(std::uint8_t value, const CancelToken& cancel) {
        const std::uint8_t data[] = {value};
        send_command(CommandCode::SET_PARAMETERS, span<const std::uint8_t>(data, 1), cancel);
    }

    void DeviceSession::restart_device(const CancelToken& cancel) {
        const std::uint8_t data[] = {to_byte(Constants::RESTART_CONFIRM)};
        send_command(CommandCode::RESTART_DEVICE, span<const std::uint8_t>(data, 1), cancel);
    }

} // namespace ds205a
