/**
 * @file serialization_helpers.hpp
 * @brief Pure static checksum helpers for DS205A frames
 * @version 0.1
 * @date 2025-11-18
 *
 * The protocol uses two different checksum rules:
 * - TX (command frames): one's complement of the modulo-256 byte sum
 * - RX (response frames): byte sum plus one must wrap to zero
 *
 * These are pure static helpers (no state) working on raw byte buffers
 * with layout offsets provided by the caller.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <numeric>
#include <boost/core/span.hpp>
#include "../enums/protocol.hpp"

namespace ds205a {

    /**
     * @brief Static helper for checksum computation and validation
     */
    class ChecksumHelper {
        public:
            /**
             * @brief Modulo-256 sum of a byte range
             *
             * @param data Buffer containing the data
             * @param start Start offset (inclusive)
             * @param end End offset (exclusive)
             * @return std::uint8_t The lower 8 bits of the sum, 0 for an invalid range
             */
            static std::uint8_t sum(span<const std::uint8_t> data,
                std::size_t start,
                std::size_t end) {
                if (end > data.size() || start >= end) {
                    return 0x00; // Invalid range
                }

                std::uint32_t total = std::accumulate(
                    data.begin() + start,
                    data.begin() + end,
                    std::uint32_t(0),
                    [](std::uint32_t acc, std::uint8_t b) {
                        return acc + b;
                    }
                );

                return static_cast<std::uint8_t>(total & 0xFF);
            }

            /**
             * @brief TX checksum: one's complement of the byte sum
             *
             * @example
             * @code
             * // Command frame: checksum over bytes 1..6
             * auto chk = ChecksumHelper::compute_tx(frame, 1, 7);
             * @endcode
             */
            static std::uint8_t compute_tx(span<const std::uint8_t> data,
                std::size_t start,
                std::size_t end) {
                return static_cast<std::uint8_t>(~sum(data, start, end));
            }

            /**
             * @brief Compute the TX checksum over [start, end) and store it at checksum_pos
             */
            static void write_tx(span<std::uint8_t> buffer,
                std::size_t checksum_pos,
                std::size_t start,
                std::size_t end) {
                if (checksum_pos >= buffer.size()) {
                    return;
                }

                buffer[checksum_pos] = compute_tx(buffer, start, end);
            }

            /**
             * @brief RX rule: sum of [start, end) plus one wraps to zero
             *
             * The range includes the stored checksum byte itself.
             */
            static bool validate_rx(span<const std::uint8_t> buffer,
                std::size_t start,
                std::size_t end) {
                if (end > buffer.size() || start >= end) {
                    return false;
                }
                return static_cast<std::uint8_t>(sum(buffer, start, end) + 1) == 0;
            }
    };

}  // namespace ds205a
