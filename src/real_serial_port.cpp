/**
 * @file real_serial_port.cpp
 * @brief Real serial port implementation
 * @version 0.1
 * @date 2025-11-18
 */

#include "../include/io/real_serial_port.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <asm/termbits.h>
#include <cerrno>
#include <cstring>

namespace ds205a {

    namespace {

        tcflag_t data_bits_flag(int data_bits) {
            switch (data_bits) {
            case 5: return CS5;
            case 6: return CS6;
            case 7: return CS7;
            default: return CS8;
            }
        }

        tcflag_t parity_flags(Parity parity) {
            switch (parity) {
            case Parity::ODD:   return PARENB | PARODD;
            case Parity::EVEN:  return PARENB;
            case Parity::MARK:  return PARENB | PARODD | CMSPAR;
            case Parity::SPACE: return PARENB | CMSPAR;
            case Parity::NONE:
            default:
                return 0;
            }
        }

        // Wait for fd readiness; returns >0 ready, 0 timeout, -1 error
        int wait_for(int fd, short events, int timeout_ms) {
            struct pollfd pfd {};
            pfd.fd = fd;
            pfd.events = events;
            int rc;
            do {
                rc = ::poll(&pfd, 1, timeout_ms);
            } while (rc < 0 && errno == EINTR);
            if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL))) {
                errno = EIO;
                return -1;
            }
            return rc;
        }

    } // namespace

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    RealSerialPort::RealSerialPort(SerialSettings settings)
        : settings_(std::move(settings)) {
    }

    RealSerialPort::~RealSerialPort() {
        close();
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    void RealSerialPort::open() {
        if (is_open_) {
            return;
        }

        fd_ = ::open(settings_.device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            Status status = (errno == ENOENT) ? Status::DNOT_FOUND : Status::DOPEN_ERROR;
            throw DeviceException(status,
                "RealSerialPort::open: " + settings_.device_path + ": " +
                std::string(std::strerror(errno)));
        }
        is_open_ = true;

        try {
            configure_port();
        } catch (const DeviceException&) {
            close();
            throw;
        }
    }

    void RealSerialPort::close() {
        if (is_open_ && fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = -1;
        is_open_ = false;
    }

    ssize_t RealSerialPort::write(const void* data, std::size_t len) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        const auto* bytes = static_cast<const std::uint8_t*>(data);
        std::size_t written = 0;
        while (written < len) {
            int ready = wait_for(fd_, POLLOUT, static_cast<int>(settings_.write_timeout_ms));
            if (ready < 0) {
                return -1;
            }
            if (ready == 0) {
                errno = ETIMEDOUT;
                return written > 0 ? static_cast<ssize_t>(written) : -1;
            }

            ssize_t n = ::write(fd_, bytes + written, len - written);
            if (n < 0) {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                    continue;
                }
                return -1;
            }
            written += static_cast<std::size_t>(n);
        }

        // Half-duplex line: wait until the frame has left the UART before reading
        if (::ioctl(fd_, TCSBRK, 1) != 0) {
            return -1;
        }
        return static_cast<ssize_t>(written);
    }

    ssize_t RealSerialPort::read(void* data, std::size_t len, int timeout_ms) {
        if (!is_open_ || fd_ < 0) {
            errno = ENOTCONN;
            return -1;
        }

        int wait_ms = timeout_ms < 0 ? static_cast<int>(settings_.read_timeout_ms) : timeout_ms;
        int ready = wait_for(fd_, POLLIN, wait_ms);
        if (ready <= 0) {
            return ready;  // 0 on timeout, -1 on error
        }

        ssize_t bytes_read = ::read(fd_, data, len);
        if (bytes_read < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return 0;  // No data available
        }

        return bytes_read;  // Returns -1 on error, errno set by read()
    }

    // ===================================================================
    // Private Methods
    // ===================================================================

    void RealSerialPort::configure_port() {
        if (!is_open_ || fd_ < 0) {
            throw DeviceException(Status::DNOT_OPEN,
                "RealSerialPort::configure_port: port not open");
        }

        struct termios2 tty {};
        if (::ioctl(fd_, TCGETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCGETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        tty.c_cflag = BOTHER                              // Use custom baud rate
            | CLOCAL | CREAD                             // Ignore modem lines, enable RX
            | data_bits_flag(settings_.data_bits)
            | parity_flags(settings_.parity)
            | (settings_.stop_bits == 2 ? CSTOPB : 0);
        tty.c_iflag = (settings_.parity == Parity::NONE) ? IGNPAR : INPCK;
        tty.c_oflag = 0;        // No output processing
        tty.c_lflag = 0;        // Non-canonical mode, no echo, no signals
        tty.c_ispeed = static_cast<speed_t>(settings_.baud_rate);
        tty.c_ospeed = static_cast<speed_t>(settings_.baud_rate);
        tty.c_cc[VTIME] = 0;    // Timeouts handled by poll()
        tty.c_cc[VMIN] = 0;

        if (::ioctl(fd_, TCSETS2, &tty) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCSETS2 failed: " +
                std::string(std::strerror(errno)));
        }

        // Drop anything the line collected before we took it over
        if (::ioctl(fd_, TCFLSH, TCIOFLUSH) != 0) {
            throw DeviceException(Status::DCONFIG_ERROR,
                "RealSerialPort::configure_port: ioctl TCFLSH failed: " +
                std::string(std::strerror(errno)));
        }
    }

} // namespace ds205a
