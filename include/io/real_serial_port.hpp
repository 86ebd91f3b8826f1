/**
 * @file real_serial_port.hpp
 * @brief Real serial port implementation using termios2/ioctl
 * @version 0.1
 * @date 2025-11-18
 */

#pragma once

#include "serial_port.hpp"
#include "../exception/ds205a_exception.hpp"

namespace ds205a {

    /**
     * @brief Real serial port implementation using Linux termios2
     *
     * Arbitrary baud rates are set through BOTHER. Reads and writes wait with
     * poll() for at most the configured timeout.
     */
    class RealSerialPort : public ISerialPort {
        private:
            SerialSettings settings_;
            int fd_ = -1;
            bool is_open_ = false;

        public:
            /**
             * @brief Construct a closed port; call open() to acquire the device
             * @param settings Device path and line settings
             */
            explicit RealSerialPort(SerialSettings settings);

            /**
             * @brief Destructor - closes port if open
             */
            ~RealSerialPort() override;

            // Disable copy
            RealSerialPort(const RealSerialPort&) = delete;
            RealSerialPort& operator=(const RealSerialPort&) = delete;

            // ISerialPort implementation
            void open() override;
            void close() override;
            ssize_t write(const void* data, std::size_t len) override;
            ssize_t read(void* data, std::size_t len, int timeout_ms) override;
            void set_read_timeout(std::uint32_t timeout_ms) override {
                settings_.read_timeout_ms = timeout_ms;
            }
            void set_write_timeout(std::uint32_t timeout_ms) override {
                settings_.write_timeout_ms = timeout_ms;
            }
            bool is_open() const override { return is_open_; }
            std::string get_device_path() const override { return settings_.device_path; }

            int get_fd() const { return fd_; }

        private:
            /**
             * @brief Configure line settings (baud, data bits, parity, stop bits)
             * @throws DeviceException on failure
             */
            void configure_port();
    };

} // namespace ds205a
