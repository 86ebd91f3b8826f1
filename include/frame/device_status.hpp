/**
 * @file device_status.hpp
 * @brief Typed views derived from a status response
 * @version 0.1
 * @date 2025-11-18
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <sstream>
#include "../enums/protocol.hpp"

namespace ds205a {

    /**
     * @brief Gate state as reported by a GetStatus response
     */
    struct DeviceStatus {
        std::uint8_t machine_number = 0;
        std::uint8_t version_number = 0;
        std::uint8_t fault_event = 0;
        std::uint8_t gate_status = 0;
        std::uint8_t alarm_event = 0;
        std::uint8_t infrared_status = 0;
        std::uint8_t power_supply_voltage = 0;
        std::uint32_t left_pedestrian_count = 0;
        std::uint32_t right_pedestrian_count = 0;

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Turnstile Status:\n"
                << "  Machine Number:         " << static_cast<int>(machine_number) << "\n"
                << "  Version Number:         " << static_cast<int>(version_number) << "\n"
                << "  Fault Event:            " << format_byte(fault_event) << "\n"
                << "  Gate Status:            " << format_byte(gate_status) << "\n"
                << "  Alarm Event:            " << format_byte(alarm_event) << "\n"
                << "  Infrared Status:        " << format_byte(infrared_status) << "\n"
                << "  Power Supply Voltage:   " << static_cast<int>(power_supply_voltage) << "\n"
                << "  Left Pedestrian Count:  " << left_pedestrian_count << "\n"
                << "  Right Pedestrian Count: " << right_pedestrian_count << "\n";
            return oss.str();
        }
    };

    /**
     * @brief Firmware and machine identification
     *
     * The gate only reports a single version byte; minor and patch stay zero.
     */
    struct DeviceInfo {
        std::array<std::uint8_t, 3> version{};
        std::uint8_t machine_type = 0;

        std::string to_string() const {
            std::ostringstream oss;
            oss << "Device Information:\n"
                << "  Version:      " << static_cast<int>(version[0]) << "."
                << static_cast<int>(version[1]) << "." << static_cast<int>(version[2]) << "\n"
                << "  Machine Type: " << static_cast<int>(machine_type) << "\n";
            return oss.str();
        }
    };

} // namespace ds205a
