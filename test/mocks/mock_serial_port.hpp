/**
 * @file mock_serial_port.hpp
 * @brief Mock implementation of ISerialPort for testing
 * @version 0.1
 * @date 2025-11-18
 *
 * Provides script-based simulation of serial port I/O for testing DeviceSession
 * without hardware. The state lives in a shared MockSerialState so a test can
 * keep driving and inspecting it after the session has taken ownership of the
 * port.
 */

#pragma once

#include "../../include/io/serial_port.hpp"
#include "../../include/enums/error.hpp"
#include "../../include/exception/ds205a_exception.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ds205a {
    namespace test {

        /**
         * @brief One scripted result for a read() call
         */
        struct RxEvent {
            enum class Kind { DATA, TIMEOUT, ERROR };

            Kind kind = Kind::DATA;
            std::vector<std::uint8_t> bytes;
        };

        /**
         * @brief Shared state behind MockSerialPort
         *
         * Features:
         * - Scripted RX chunks, timeouts and read errors (empty script = timeout)
         * - TX history tracking for verification
         * - Write failure injection
         * - Open/close counters
         */
        struct MockSerialState {
            // RX simulation
            std::deque<RxEvent> rx_script;
            std::size_t read_calls = 0;

            // TX tracking
            std::vector<std::vector<std::uint8_t> > tx_history;
            std::function<void()> on_write;     // runs on every write, failed ones too

            // Error injection
            int failing_writes = 0;
            int failed_writes = 0;
            bool short_writes = false;
            bool fail_open = false;

            // Lifecycle tracking
            int open_count = 0;
            int close_count = 0;
            std::uint32_t read_timeout_ms = 0;
            std::uint32_t write_timeout_ms = 0;

            /**
             * @brief Queue bytes returned by a future read()
             */
            void inject_rx_data(const std::vector<std::uint8_t>& data) {
                rx_script.push_back(RxEvent{RxEvent::Kind::DATA, data});
            }

            void inject_timeout() {
                rx_script.push_back(RxEvent{RxEvent::Kind::TIMEOUT, {}});
            }

            void inject_read_error() {
                rx_script.push_back(RxEvent{RxEvent::Kind::ERROR, {}});
            }

            /**
             * @brief Make the next n writes fail with EIO
             */
            void fail_next_writes(int n) {
                failing_writes = n;
            }

            std::size_t write_count() const {
                return tx_history.size() + static_cast<std::size_t>(failed_writes);
            }
        };

        /**
         * @brief Mock serial port for testing
         */
        class MockSerialPort : public ISerialPort {
            public:
                /**
                 * @brief Construct mock serial port
                 * @param state Shared script and history
                 * @param device_path Simulated device path (e.g., "/dev/mock")
                 */
                MockSerialPort(std::shared_ptr<MockSerialState> state, const std::string& device_path)
                    : state_(std::move(state))
                    , device_path_(device_path) {}

                ~MockSerialPort() override {
                    close();
                }

                // === ISerialPort Interface ===

                void open() override {
                    if (state_->fail_open) {
                        throw DeviceException(Status::DNOT_FOUND,
                            "MockSerialPort::open: " + device_path_);
                    }
                    ++state_->open_count;
                    is_open_ = true;
                }

                void close() override {
                    if (is_open_) {
                        ++state_->close_count;
                    }
                    is_open_ = false;
                }

                ssize_t write(const void* data, std::size_t len) override {
                    if (!is_open_) {
                        errno = EBADF;
                        return -1;
                    }

                    if (state_->failing_writes > 0) {
                        --state_->failing_writes;
                        ++state_->failed_writes;
                        if (state_->on_write) {
                            state_->on_write();
                        }
                        errno = EIO;
                        return -1;
                    }

                    // Record transmitted data
                    const std::uint8_t* bytes = static_cast<const std::uint8_t*>(data);
                    state_->tx_history.emplace_back(bytes, bytes + len);

                    if (state_->on_write) {
                        state_->on_write();
                    }

                    if (state_->short_writes && len > 1) {
                        return static_cast<ssize_t>(len - 1);
                    }
                    return static_cast<ssize_t>(len);
                }

                ssize_t read(void* data, std::size_t len, int timeout_ms) override {
                    (void)timeout_ms;  // Mock returns immediately

                    if (!is_open_) {
                        errno = EBADF;
                        return -1;
                    }

                    ++state_->read_calls;

                    if (state_->rx_script.empty()) {
                        return 0;  // Timeout
                    }

                    RxEvent& event = state_->rx_script.front();
                    switch (event.kind) {
                    case RxEvent::Kind::TIMEOUT:
                        state_->rx_script.pop_front();
                        return 0;

                    case RxEvent::Kind::ERROR:
                        state_->rx_script.pop_front();
                        errno = EIO;
                        return -1;

                    case RxEvent::Kind::DATA:
                    default:
                        break;
                    }

                    // Chunks larger than len are split across reads
                    std::size_t bytes_to_copy = std::min(len, event.bytes.size());
                    std::memcpy(data, event.bytes.data(), bytes_to_copy);
                    if (bytes_to_copy < event.bytes.size()) {
                        event.bytes.erase(event.bytes.begin(),
                            event.bytes.begin() + static_cast<std::ptrdiff_t>(bytes_to_copy));
                    } else {
                        state_->rx_script.pop_front();
                    }

                    return static_cast<ssize_t>(bytes_to_copy);
                }

                void set_read_timeout(std::uint32_t timeout_ms) override {
                    state_->read_timeout_ms = timeout_ms;
                }

                void set_write_timeout(std::uint32_t timeout_ms) override {
                    state_->write_timeout_ms = timeout_ms;
                }

                bool is_open() const override {
                    return is_open_;
                }

                std::string get_device_path() const override {
                    return device_path_;
                }

            private:
                std::shared_ptr<MockSerialState> state_;
                std::string device_path_;
                bool is_open_ = false;
        };

    } // namespace test
} // namespace ds205a
