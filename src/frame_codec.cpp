/**
 * @file frame_codec.cpp
 * @brief FrameCodec implementation
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "../include/frame/frame_codec.hpp"

#include <algorithm>

namespace ds205a {

    // === Command Frames ===

    Result<CommandFrame> FrameCodec::build_command(std::uint8_t device_id,
        CommandCode code,
        span<const std::uint8_t> data) {
        if (data.size() > COMMAND_DATA_SIZE) {
            return Result<CommandFrame>::error(Status::DATA_TOO_LARGE,
                "build_command(" + command_to_string(code) + "): " +
                std::to_string(data.size()) + " data bytes (max " +
                std::to_string(COMMAND_DATA_SIZE) + ")");
        }

        CommandFrame::Storage buffer{};

        // Fixed protocol bytes
        buffer[CommandLayout::HEADER] = to_byte(Constants::COMMAND_HEADER);
        buffer[CommandLayout::RESERVED] = to_byte(Constants::RESERVED);

        // Addressing
        buffer[CommandLayout::DEVICE_ID] = device_id;
        buffer[CommandLayout::COMMAND] = to_byte(code);

        // Data (3 bytes, zero padded)
        std::copy(data.begin(), data.end(), buffer.begin() + CommandLayout::DATA);

        ChecksumHelper::write_tx(span<std::uint8_t>(buffer.data(), buffer.size()),
            CommandLayout::CHECKSUM,
            CommandLayout::CHECKSUM_START,
            CommandLayout::CHECKSUM_END);

        return Result<CommandFrame>::success(CommandFrame(buffer));
    }

    // === Response Frames ===

    Result<ResponseFrame> FrameCodec::parse_response(span<const std::uint8_t> raw,
        std::uint8_t expected_device_id) {
        if (raw.size() < RESPONSE_FRAME_SIZE) {
            return Result<ResponseFrame>::error(Status::FRAME_TOO_SHORT,
                "parse_response: got " + std::to_string(raw.size()) +
                " bytes, expected " + std::to_string(RESPONSE_FRAME_SIZE));
        }

        const std::uint8_t header = raw[ResponseLayout::HEADER];
        if (header != to_byte(Constants::RESPONSE_HEADER)) {
            return Result<ResponseFrame>::error(Status::INVALID_HEADER,
                "parse_response: header " + format_byte(header) + ", expected " +
                format_byte(to_byte(Constants::RESPONSE_HEADER)));
        }

        ResponseFrame::Storage buffer{};
        std::copy_n(raw.begin(), RESPONSE_FRAME_SIZE, buffer.begin());

        // Advisory: devices in the field do not fill this byte reliably
        const bool checksum_ok = ChecksumHelper::validate_rx(
            span<const std::uint8_t>(buffer.data(), buffer.size()),
            ResponseLayout::CHECKSUM_START,
            ResponseLayout::CHECKSUM_END);

        ResponseFrame frame(buffer, checksum_ok);

        if (frame.machine_number() != expected_device_id) {
            return Result<ResponseFrame>::error(Status::DEVICE_ID_MISMATCH,
                "parse_response: machine number " + format_byte(frame.machine_number()) +
                ", expected " + format_byte(expected_device_id));
        }

        if (!frame.succeeded()) {
            return Result<ResponseFrame>::error(Status::COMMAND_FAILED,
                "parse_response: execution byte " + format_byte(frame.command_execution()) +
                ", expected " + format_byte(to_byte(Constants::EXECUTION_SUCCESS)));
        }

        return Result<ResponseFrame>::success(frame);
    }

    // === Projections ===

    DeviceStatus FrameCodec::to_status(const ResponseFrame& frame) {
        DeviceStatus status;
        status.machine_number = frame.machine_number();
        status.version_number = frame.version_number();
        status.fault_event = frame.fault_event();
        status.gate_status = frame.gate_status();
        status.alarm_event = frame.alarm_event();
        status.infrared_status = frame.infrared_status();
        status.power_supply_voltage = frame.power_supply_voltage();
        status.left_pedestrian_count = frame.left_count();
        status.right_pedestrian_count = frame.right_count();
        return status;
    }

    DeviceInfo FrameCodec::to_device_info(const ResponseFrame& frame) {
        DeviceInfo info;
        info.version = {frame.version_number(), 0, 0};
        info.machine_type = frame.machine_number();
        return info;
    }

} // namespace ds205a
