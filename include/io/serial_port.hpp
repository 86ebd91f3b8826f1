/**
 * @file serial_port.hpp
 * @brief Abstract interface for serial port I/O operations
 * @version 0.1
 * @date 2025-11-18
 *
 * Provides abstraction for serial port operations to enable dependency injection
 * and mock-based testing. This interface only moves bytes; the command/response
 * protocol lives in DeviceSession.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <sys/types.h>

#include "../enums/protocol.hpp"

namespace ds205a {

    /**
     * @brief Line settings handed to a serial port implementation
     */
    struct SerialSettings {
        std::string device_path;
        int baud_rate = DEFAULT_BAUD_RATE;
        int data_bits = DEFAULT_DATA_BITS;
        int stop_bits = DEFAULT_STOP_BITS;
        Parity parity = DEFAULT_PARITY;
        std::uint32_t read_timeout_ms = 2000;
        std::uint32_t write_timeout_ms = 2000;
    };

    /**
     * @brief Abstract interface for serial port I/O
     *
     * Implementations:
     * - RealSerialPort: termios2/ioctl for actual hardware
     * - MockSerialPort: scripted simulation for testing
     */
    class ISerialPort {
        public:
            virtual ~ISerialPort() = default;

            /**
             * @brief Open and configure the port
             * @throws DeviceException if the port cannot be opened or configured
             */
            virtual void open() = 0;

            /**
             * @brief Close the serial port. Repeated calls are no-ops.
             */
            virtual void close() = 0;

            /**
             * @brief Write data to serial port
             * @param data Pointer to data buffer
             * @param len Number of bytes to write
             * @return ssize_t Bytes written, or -1 on error (sets errno)
             */
            virtual ssize_t write(const void* data, std::size_t len) = 0;

            /**
             * @brief Read data from serial port with timeout
             * @param data Pointer to buffer for received data
             * @param len Maximum number of bytes to read
             * @param timeout_ms Timeout in milliseconds (-1 for the configured read timeout)
             * @return ssize_t Bytes read (0 on timeout), or -1 on error (sets errno)
             */
            virtual ssize_t read(void* data, std::size_t len, int timeout_ms) = 0;

            /**
             * @brief Set the default read timeout
             */
            virtual void set_read_timeout(std::uint32_t timeout_ms) = 0;

            /**
             * @brief Set the write timeout
             */
            virtual void set_write_timeout(std::uint32_t timeout_ms) = 0;

            /**
             * @brief Check if serial port is open and ready
             */
            virtual bool is_open() const = 0;

            /**
             * @brief Get the device path (e.g., "/dev/ttyUSB0")
             */
            virtual std::string get_device_path() const = 0;
    };

} // namespace ds205a
