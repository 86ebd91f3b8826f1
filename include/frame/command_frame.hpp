/**
 * @file command_frame.hpp
 * @brief Outbound 8-byte command frame
 * @version 0.1
 * @date 2025-11-18
 *
 * Frame structure:
 * ```
 * [0x7E][0x00][DEVICE_ID][COMMAND][DATA0][DATA1][DATA2][CHECKSUM]
 *   0     1       2         3       4      5      6        7
 * ```
 * Instances are produced by FrameCodec::build_command(), which guarantees a
 * correct header and checksum.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <string>
#include <sstream>
#include "../enums/protocol.hpp"

namespace ds205a {

    class CommandFrame {
        public:
            using Storage = std::array<std::uint8_t, COMMAND_FRAME_SIZE>;

            CommandFrame() = default;

            explicit CommandFrame(const Storage& bytes) : bytes_(bytes) {}

            std::uint8_t header() const { return bytes_[CommandLayout::HEADER]; }
            std::uint8_t device_id() const { return bytes_[CommandLayout::DEVICE_ID]; }

            CommandCode command() const {
                return from_byte<CommandCode>(bytes_[CommandLayout::COMMAND]);
            }

            /**
             * @brief Data byte at index 0..2
             */
            std::uint8_t data(std::size_t index) const {
                return index < COMMAND_DATA_SIZE ? bytes_[CommandLayout::DATA + index] : 0x00;
            }

            std::uint8_t checksum() const { return bytes_[CommandLayout::CHECKSUM]; }

            const Storage& bytes() const { return bytes_; }

            span<const std::uint8_t> view() const {
                return span<const std::uint8_t>(bytes_.data(), bytes_.size());
            }

            std::size_t size() const { return COMMAND_FRAME_SIZE; }

            std::string to_string() const {
                std::ostringstream oss;
                oss << "CommandFrame(" << command_to_string(command())
                    << ", id=" << format_byte(device_id())
                    << ", [" << format_hex(view()) << "])";
                return oss.str();
            }

        private:
            Storage bytes_{};
    };

} // namespace ds205a
