/**
 * @file frame_codec.hpp
 * @brief Stateless construction and parsing of DS205A frames
 * @version 0.1
 * @date 2025-11-18
 *
 * No I/O happens here. Every function is deterministic, so the frame layout
 * and both checksum rules are testable without a transport.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include "command_frame.hpp"
#include "response_frame.hpp"
#include "device_status.hpp"
#include "../interface/serialization_helpers.hpp"
#include "../template/result.hpp"

namespace ds205a {

    class FrameCodec {
        public:
            /**
             * @brief Build an outbound command frame
             *
             * Pads missing data bytes with 0x00 and writes the TX checksum
             * (~sum of bytes 1..6).
             *
             * @param device_id Target gate address
             * @param code Command code
             * @param data 0 to 3 parameter bytes
             * @return Result<CommandFrame> The frame, or DATA_TOO_LARGE
             */
            static Result<CommandFrame> build_command(std::uint8_t device_id,
                CommandCode code,
                span<const std::uint8_t> data = {});

            /**
             * @brief Parse and validate an inbound response frame
             *
             * Checks, in order: length (FRAME_TOO_SHORT), header (INVALID_HEADER),
             * machine number (DEVICE_ID_MISMATCH), execution byte (COMMAND_FAILED).
             * The RX checksum is evaluated and recorded on the frame but never
             * causes a rejection.
             *
             * @param raw At least 18 bytes; only the first 18 are used
             * @param expected_device_id Device ID the session is configured for
             * @return Result<ResponseFrame> The parsed frame or the first failed check
             */
            static Result<ResponseFrame> parse_response(span<const std::uint8_t> raw,
                std::uint8_t expected_device_id);

            /**
             * @brief Project a response into DeviceStatus
             */
            static DeviceStatus to_status(const ResponseFrame& frame);

            /**
             * @brief Project a response into DeviceInfo
             */
            static DeviceInfo to_device_info(const ResponseFrame& frame);
    };

} // namespace ds205a
