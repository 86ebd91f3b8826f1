/**
 * @file frame_synchronizer.hpp
 * @brief Header-locking accumulator for fixed-size response frames
 * @version 0.1
 * @date 2025-11-18
 *
 * The gate can emit line noise or a stale tail before a response. Bytes are
 * fed in as they arrive; everything before the first header byte is dropped,
 * and once a header is locked the scan is never repeated, so a header value
 * appearing inside the payload does not move the frame boundary.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include "../enums/protocol.hpp"

namespace ds205a {

    class FrameSynchronizer {
        public:
            explicit FrameSynchronizer(
                std::uint8_t header = to_byte(Constants::RESPONSE_HEADER),
                std::size_t frame_size = RESPONSE_FRAME_SIZE);

            /**
             * @brief Append freshly read bytes
             * @return true once a full frame is available from the locked header
             */
            bool feed(span<const std::uint8_t> chunk);

            bool header_locked() const { return locked_; }

            bool complete() const { return locked_ && buffer_.size() >= frame_size_; }

            /**
             * @brief Bytes currently held (aligned on the header once locked)
             */
            std::size_t buffered() const { return buffer_.size(); }

            /**
             * @brief Number of leading bytes dropped while hunting for the header
             */
            std::size_t discarded() const { return discarded_; }

            const std::vector<std::uint8_t>& pending() const { return buffer_; }

            /**
             * @brief Copy out exactly one frame
             *
             * Bytes past the first frame are left in the buffer and never become
             * part of the result.
             *
             * @throws ProtocolException if no complete frame is available
             */
            std::vector<std::uint8_t> take_frame() const;

            void reset();

        private:
            std::uint8_t header_;
            std::size_t frame_size_;
            std::vector<std::uint8_t> buffer_;
            std::size_t scan_pos_ = 0;
            std::size_t discarded_ = 0;
            bool locked_ = false;
    };

} // namespace ds205a
