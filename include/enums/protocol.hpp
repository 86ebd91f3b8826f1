/**
 * @file protocol.hpp
 * @brief Protocol definitions and helper functions for the DS205A turnstile.
 * @version 0.1
 * @date 2025-11-18
 *
 * Frame constants, command codes and serial line enums for the DS205A
 * RS-485 command/response protocol.
 *
 * @copyright Copyright (c) 2025
 *
 */


#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <string>
#include <sstream>
#include <iomanip>
#include <array>
#include <boost/core/span.hpp>

/**
 * @namespace ds205a
 * @brief Namespace containing all DS205A turnstile driver functionality.
 */
namespace ds205a {

    using boost::span;

    // === Frame Byte Constants ===

    /**
     * @brief Frame byte constants for DS205A communication.
     *
     * Command frames (host to gate) start with COMMAND_HEADER, response frames
     * (gate to host) start with RESPONSE_HEADER. A response whose execution byte
     * equals EXECUTION_SUCCESS reports that the command was carried out.
     */
    enum class Constants : std::uint8_t {
        COMMAND_HEADER = 0x7E,
        RESPONSE_HEADER = 0x7F,
        RESERVED = 0x00,
        EXECUTION_SUCCESS = 0x55,
        RESTART_CONFIRM = 0x60
    };

    static constexpr std::size_t COMMAND_FRAME_SIZE = 8;
    static constexpr std::size_t RESPONSE_FRAME_SIZE = 18;
    static constexpr std::size_t COMMAND_DATA_SIZE = 3;

    /**
     * @brief Byte offsets of the 8-byte command frame.
     * ```
     * [HEADER][RESERVED][DEVICE_ID][COMMAND][DATA0][DATA1][DATA2][CHECKSUM]
     *    0        1         2          3       4      5      6       7
     * ```
     * The checksum covers RESERVED..DATA2.
     */
    struct CommandLayout {
        static constexpr std::size_t HEADER = 0;
        static constexpr std::size_t RESERVED = 1;
        static constexpr std::size_t DEVICE_ID = 2;
        static constexpr std::size_t COMMAND = 3;
        static constexpr std::size_t DATA = 4;
        static constexpr std::size_t CHECKSUM = 7;
        static constexpr std::size_t CHECKSUM_START = 1;
        static constexpr std::size_t CHECKSUM_END = 7; // exclusive
    };

    /**
     * @brief Byte offsets of the 18-byte response frame.
     * ```
     * [HDR][VER][MACH][FAULT][GATE][ALARM][LEFT(3)][RIGHT(3)][IR][EXEC][VOLT][UNDEF(2)][CHK]
     *   0    1    2     3      4     5      6-8      9-11    12   13    14    15-16    17
     * ```
     * Counters are 24-bit big-endian. The checksum covers VER..CHK.
     */
    struct ResponseLayout {
        static constexpr std::size_t HEADER = 0;
        static constexpr std::size_t VERSION = 1;
        static constexpr std::size_t MACHINE = 2;
        static constexpr std::size_t FAULT = 3;
        static constexpr std::size_t GATE = 4;
        static constexpr std::size_t ALARM = 5;
        static constexpr std::size_t LEFT_COUNT = 6;
        static constexpr std::size_t RIGHT_COUNT = 9;
        static constexpr std::size_t COUNTER_SIZE = 3;
        static constexpr std::size_t INFRARED = 12;
        static constexpr std::size_t EXECUTION = 13;
        static constexpr std::size_t VOLTAGE = 14;
        static constexpr std::size_t UNDEFINED = 15;
        static constexpr std::size_t CHECKSUM = 17;
        static constexpr std::size_t CHECKSUM_START = 1;
        static constexpr std::size_t CHECKSUM_END = 18; // exclusive
    };

    /**
     * @brief Command codes understood by the gate.
     * @note RESTART_DEVICE must carry Constants::RESTART_CONFIRM as its only data byte.
     */
    enum class CommandCode : std::uint8_t {
        GET_STATUS = 0x10,
        RESET_LEFT_COUNTERS = 0x20,
        RESET_RIGHT_COUNTERS = 0x21,
        RESTART_DEVICE = 0x35,
        LEFT_OPEN = 0x80,
        LEFT_ALWAYS_OPEN = 0x81,
        RIGHT_OPEN = 0x82,
        RIGHT_ALWAYS_OPEN = 0x83,
        CLOSE_GATE = 0x84,
        FORBID_LEFT_PASSAGE = 0x88,
        FORBID_RIGHT_PASSAGE = 0x89,
        DISABLE_RESTRICTIONS = 0x8F,
        SET_PARAMETERS = 0x96
    };

    // === Serial Line Constants ===

    /**
     * @brief Parity modes supported by the RS-485 line.
     */
    enum class Parity : std::uint8_t {
        NONE = 0,   // <<< Recommended
        ODD,
        EVEN,
        MARK,
        SPACE
    };
    static constexpr Parity DEFAULT_PARITY = Parity::NONE;

    static constexpr int DEFAULT_BAUD_RATE = 9600;
    static constexpr int DEFAULT_DATA_BITS = 8;
    static constexpr int DEFAULT_STOP_BITS = 1;
    static constexpr std::uint8_t DEFAULT_DEVICE_ID = 0x01;

    // === Enum Helper Functions ===

    /**
     * @brief Converts an enum value to std::uint8_t.
     *
     * @tparam EnumType The enum type to convert (must be an enum class)
     * @param value The enum value to convert
     * @return std::uint8_t representation of the enum value
     *
     * @example
     * @code
     * auto header = to_byte(Constants::COMMAND_HEADER);
     * auto cmd = to_byte(CommandCode::GET_STATUS);
     * @endcode
     */
    template<typename EnumType> constexpr std::uint8_t to_byte(EnumType value) {
        return static_cast<std::uint8_t>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    /**
     * @brief Converts a std::uint8_t to an enum value.
     * @warning Ensure the byte value corresponds to a valid enum value.
     */
    template<typename EnumType> constexpr EnumType from_byte(std::uint8_t value) {
        return static_cast<EnumType>(
            static_cast<std::underlying_type_t<EnumType> >(value));
    }

    /**
     * @brief Human readable name of a command code
     * @return e.g. "GetStatus", or "Unknown(0xAB)" for codes outside the table
     */
    inline std::string command_to_string(CommandCode code) {
        switch (code) {
        case CommandCode::GET_STATUS:           return "GetStatus";
        case CommandCode::RESET_LEFT_COUNTERS:  return "ResetLeftCounters";
        case CommandCode::RESET_RIGHT_COUNTERS: return "ResetRightCounters";
        case CommandCode::RESTART_DEVICE:       return "RestartDevice";
        case CommandCode::LEFT_OPEN:            return "LeftOpen";
        case CommandCode::LEFT_ALWAYS_OPEN:     return "LeftAlwaysOpen";
        case CommandCode::RIGHT_OPEN:           return "RightOpen";
        case CommandCode::RIGHT_ALWAYS_OPEN:    return "RightAlwaysOpen";
        case CommandCode::CLOSE_GATE:           return "CloseGate";
        case CommandCode::FORBID_LEFT_PASSAGE:  return "ForbidLeftPassage";
        case CommandCode::FORBID_RIGHT_PASSAGE: return "ForbidRightPassage";
        case CommandCode::DISABLE_RESTRICTIONS: return "DisableRestrictions";
        case CommandCode::SET_PARAMETERS:       return "SetParameters";
        default:
            break;
        }
        std::ostringstream oss;
        oss << "Unknown(0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(to_byte(code)) << ")";
        return oss.str();
    }

    inline std::string parity_to_string(Parity parity) {
        switch (parity) {
        case Parity::NONE:  return "none";
        case Parity::ODD:   return "odd";
        case Parity::EVEN:  return "even";
        case Parity::MARK:  return "mark";
        case Parity::SPACE: return "space";
        default:            return "none";
        }
    }

    /**
     * @brief Parse a parity name (case-insensitive)
     * @param str One of none, odd, even, mark, space
     * @param use_default Set to true if the string is not recognised
     * @return Parity The parsed parity, or DEFAULT_PARITY
     */
    inline Parity parity_from_string(const std::string& str, bool& use_default) {
        std::string lower = str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        use_default = false;
        if (lower == "none") return Parity::NONE;
        if (lower == "odd") return Parity::ODD;
        if (lower == "even") return Parity::EVEN;
        if (lower == "mark") return Parity::MARK;
        if (lower == "space") return Parity::SPACE;
        use_default = true;
        return DEFAULT_PARITY;
    }

    // === Byte Manipulation Helpers ===

    /**
     * @brief Converts a big-endian byte array to an unsigned integer.
     * The most significant byte is at index 0.
     * @example
     * @code
     * // bytes = {0x00, 0x01, 0x2C}
     * auto value = bytes_to_int_be<uint32_t>(bytes); // value = 300
     * @endcode
     */
    template<typename T>
    constexpr T bytes_to_int_be(span<const std::uint8_t> bytes) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        T value = 0;
        for (std::size_t i = 0; i < bytes.size() && i < sizeof(T); ++i) {
            value = (value << 8) | (static_cast<T>(bytes[i]) & 0xFF);
        }
        return value;
    }

    /**
     * @brief Converts an unsigned integer to a big-endian byte array of N bytes.
     * @example
     * @code
     * auto bytes = int_to_bytes_be<uint32_t, 3>(300); // bytes = {0x00, 0x01, 0x2C}
     * @endcode
     */
    template<typename T, std::size_t N>
    constexpr std::array<std::uint8_t, N> int_to_bytes_be(T value) {
        static_assert(std::is_unsigned<T>::value, "T must be an unsigned integer type");
        static_assert(N > 0 && N <= sizeof(T), "N must be between 1 and sizeof(T)");
        std::array<std::uint8_t, N> bytes = {};
        for (std::size_t i = 0; i < N; ++i) {
            bytes[N - 1 - i] = static_cast<std::uint8_t>(value & 0xFF);
            value >>= 8;
        }
        return bytes;
    }

    /**
     * @brief Format bytes as an uppercase hex string ("7E 00 01 10")
     */
    inline std::string format_hex(span<const std::uint8_t> data) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < data.size(); ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
            if (i + 1 < data.size()) oss << " ";
        }
        return oss.str();
    }

    inline std::string format_byte(std::uint8_t value) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(value);
        return oss.str();
    }

} // namespace ds205a
