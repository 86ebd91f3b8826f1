/**
 * @file response_frame.hpp
 * @brief Inbound 18-byte response frame
 * @version 0.1
 * @date 2025-11-18
 *
 * Frame structure:
 * ```
 * [0x7F][VER][MACH][FAULT][GATE][ALARM][LEFT(3)][RIGHT(3)][IR][EXEC][VOLT][UNDEF(2)][CHK]
 *   0     1    2     3      4     5      6-8      9-11    12   13    14    15-16    17
 * ```
 * Field access is purely positional. Counters are 24-bit big-endian.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <string>
#include <sstream>
#include "../enums/protocol.hpp"

namespace ds205a {

    class ResponseFrame {
        public:
            using Storage = std::array<std::uint8_t, RESPONSE_FRAME_SIZE>;

            ResponseFrame() = default;

            /**
             * @param bytes Raw frame bytes
             * @param checksum_valid Result of the RX checksum rule (diagnostic only)
             */
            ResponseFrame(const Storage& bytes, bool checksum_valid)
                : bytes_(bytes), checksum_valid_(checksum_valid) {}

            std::uint8_t header() const { return bytes_[ResponseLayout::HEADER]; }
            std::uint8_t version_number() const { return bytes_[ResponseLayout::VERSION]; }
            std::uint8_t machine_number() const { return bytes_[ResponseLayout::MACHINE]; }
            std::uint8_t fault_event() const { return bytes_[ResponseLayout::FAULT]; }
            std::uint8_t gate_status() const { return bytes_[ResponseLayout::GATE]; }
            std::uint8_t alarm_event() const { return bytes_[ResponseLayout::ALARM]; }
            std::uint8_t infrared_status() const { return bytes_[ResponseLayout::INFRARED]; }
            std::uint8_t command_execution() const { return bytes_[ResponseLayout::EXECUTION]; }
            std::uint8_t power_supply_voltage() const { return bytes_[ResponseLayout::VOLTAGE]; }
            std::uint8_t checksum() const { return bytes_[ResponseLayout::CHECKSUM]; }

            std::uint32_t left_count() const {
                return bytes_to_int_be<std::uint32_t>(
                    view().subspan(ResponseLayout::LEFT_COUNT, ResponseLayout::COUNTER_SIZE));
            }

            std::uint32_t right_count() const {
                return bytes_to_int_be<std::uint32_t>(
                    view().subspan(ResponseLayout::RIGHT_COUNT, ResponseLayout::COUNTER_SIZE));
            }

            bool succeeded() const {
                return command_execution() == to_byte(Constants::EXECUTION_SUCCESS);
            }

            /**
             * @brief Whether the RX checksum rule held for this frame
             * @note Advisory only; frames are never rejected on this.
             */
            bool checksum_valid() const { return checksum_valid_; }

            const Storage& bytes() const { return bytes_; }

            span<const std::uint8_t> view() const {
                return span<const std::uint8_t>(bytes_.data(), bytes_.size());
            }

            std::size_t size() const { return RESPONSE_FRAME_SIZE; }

            std::string to_string() const {
                std::ostringstream oss;
                oss << "ResponseFrame(machine=" << format_byte(machine_number())
                    << ", exec=" << format_byte(command_execution())
                    << ", checksum=" << (checksum_valid_ ? "ok" : "mismatch")
                    << ", [" << format_hex(view()) << "])";
                return oss.str();
            }

        private:
            Storage bytes_{};
            bool checksum_valid_ = false;
    };

} // namespace ds205a
