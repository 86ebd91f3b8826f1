/**
 * @file test_device_session.cpp
 * @brief DeviceSession tests against MockSerialPort
 * @version 0.1
 * @date 2025-11-18
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "../include/pattern/device_session.hpp"
#include "test_utils.hpp"

#include <chrono>
#include <memory>
#include <sstream>
#include <vector>

using namespace ds205a;
using namespace ds205a::test;

namespace {

    std::vector<std::uint8_t> command_bytes(std::uint8_t id, CommandCode code,
        std::vector<std::uint8_t> data = {}) {
        auto result = FrameCodec::build_command(id, code,
                span<const std::uint8_t>(data.data(), data.size()));
        const auto& bytes = result.value().bytes();
        return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
    }

} // namespace

// === Lifecycle ===

TEST_CASE("DeviceSession - Open and close", "[session][lifecycle]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);

    REQUIRE_FALSE(session->is_open());

    session->open();
    REQUIRE(session->is_open());
    REQUIRE(state->open_count == 1);
    REQUIRE(state->read_timeout_ms == 2000);
    REQUIRE(state->write_timeout_ms == 2000);

    SECTION("Second open is a no-op") {
        session->open();
        REQUIRE(state->open_count == 1);
    }

    SECTION("Close releases the port exactly once") {
        session->close();
        session->close();
        REQUIRE_FALSE(session->is_open());
        REQUIRE(state->close_count == 1);
    }

    SECTION("Session can be reopened") {
        session->close();
        session->open();
        REQUIRE(session->is_open());
        REQUIRE(state->open_count == 2);
    }
}

TEST_CASE("DeviceSession - Destructor closes an open session", "[session][lifecycle]") {
    auto state = std::make_shared<MockSerialState>();
    {
        auto session = create_session_with_mock(make_test_config(), state);
        session->open();
    }
    REQUIRE(state->close_count == 1);
}

TEST_CASE("DeviceSession - Transport open failure leaves session closed", "[session][lifecycle]") {
    auto state = std::make_shared<MockSerialState>();
    state->fail_open = true;
    auto session = create_session_with_mock(make_test_config(), state);

    REQUIRE_THROWS_AS(session->open(), DeviceException);
    REQUIRE_FALSE(session->is_open());
}

TEST_CASE("DeviceSession - Invalid configuration never reaches the transport", "[session][config]") {
    bool factory_called = false;
    SessionConfig config = make_test_config();
    config.data_bits = 9;

    REQUIRE_THROWS_AS(
        DeviceSession(config, Logger::silent(),
            [&factory_called](const SerialSettings&) -> std::unique_ptr<ISerialPort> {
                factory_called = true;
                return nullptr;
            }),
        ConfigException
    );
    REQUIRE_FALSE(factory_called);
}

TEST_CASE("DeviceSession - Commands on a closed session", "[session][error]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);

    SECTION("Never opened") {
        try {
            session->get_status();
            FAIL("Should have thrown DeviceException");
        } catch (const DeviceException& e) {
            REQUIRE(e.status() == Status::DNOT_OPEN);
        }
        REQUIRE(state->open_count == 0);
        REQUIRE(state->write_count() == 0);
        REQUIRE(state->read_calls == 0);
    }

    SECTION("Closed after use") {
        session->open();
        session->close();
        REQUIRE_THROWS_AS(session->close_gate(), DeviceException);
        REQUIRE(state->write_count() == 0);
    }
}

// === Exchange ===

TEST_CASE("DeviceSession - get_status decodes counters", "[session][status]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    state->inject_rx_data(make_response(0x01, 0x55, 300, 12, 0x02));

    auto status = session->get_status();
    REQUIRE(status.left_pedestrian_count == 300);
    REQUIRE(status.right_pedestrian_count == 12);
    REQUIRE(status.machine_number == 0x01);
    REQUIRE(status.version_number == 0x02);

    REQUIRE(state->tx_history.size() == 1);
    REQUIRE(state->tx_history[0] == command_bytes(0x01, CommandCode::GET_STATUS));
}

TEST_CASE("DeviceSession - get_device_info", "[session][status]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    state->inject_rx_data(make_response(0x01, 0x55, 0, 0, 0x05));

    auto info = session->get_device_info();
    REQUIRE(info.version[0] == 0x05);
    REQUIRE(info.machine_type == 0x01);
}

TEST_CASE("DeviceSession - Typed operations send the right frames", "[session][commands]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.device_id = 0x07;
    auto session = create_session_with_mock(config, state);
    session->open();

    auto ack = [&state]() { state->inject_rx_data(make_response(0x07)); };

    ack();
    session->left_open(0x03);
    ack();
    session->left_always_open();
    ack();
    session->right_open(0x04);
    ack();
    session->right_always_open();
    ack();
    session->close_gate();
    ack();
    session->forbid_left_passage();
    ack();
    session->forbid_right_passage();
    ack();
    session->disable_restrictions();
    ack();
    session->reset_left_counters();
    ack();
    session->reset_right_counters();
    ack();
    session->set_parameters(0x22);
    ack();
    session->restart_device();

    const std::vector<std::vector<std::uint8_t> > expected = {
        command_bytes(0x07, CommandCode::LEFT_OPEN, {0x03}),
        command_bytes(0x07, CommandCode::LEFT_ALWAYS_OPEN),
        command_bytes(0x07, CommandCode::RIGHT_OPEN, {0x04}),
        command_bytes(0x07, CommandCode::RIGHT_ALWAYS_OPEN),
        command_bytes(0x07, CommandCode::CLOSE_GATE),
        command_bytes(0x07, CommandCode::FORBID_LEFT_PASSAGE),
        command_bytes(0x07, CommandCode::FORBID_RIGHT_PASSAGE),
        command_bytes(0x07, CommandCode::DISABLE_RESTRICTIONS),
        command_bytes(0x07, CommandCode::RESET_LEFT_COUNTERS),
        command_bytes(0x07, CommandCode::RESET_RIGHT_COUNTERS),
        command_bytes(0x07, CommandCode::SET_PARAMETERS, {0x22}),
        command_bytes(0x07, CommandCode::RESTART_DEVICE, {0x60})
    };
    REQUIRE(state->tx_history == expected);
    REQUIRE(state->tx_history.back() ==
        std::vector<std::uint8_t>{0x7E, 0x00, 0x07, 0x35, 0x60, 0x00, 0x00, 0x63});
}

TEST_CASE("DeviceSession - Data larger than three bytes fails before I/O", "[session][error]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    const std::uint8_t data[] = {1, 2, 3, 4};
    try {
        session->send_command(CommandCode::SET_PARAMETERS, span<const std::uint8_t>(data, 4));
        FAIL("Should have thrown ProtocolException");
    } catch (const ProtocolException& e) {
        REQUIRE(e.status() == Status::DATA_TOO_LARGE);
        REQUIRE(e.context() ==
            "build_command(SetParameters): 4 data bytes (max 3) -> SetParameters");
    }
    REQUIRE(state->write_count() == 0);
}

// === Resynchronization ===

TEST_CASE("DeviceSession - Leading noise is discarded across reads", "[session][sync]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    auto frame = make_response(0x01, 0x55, 42, 0);
    std::vector<std::uint8_t> stream = {0x01, 0x02};
    stream.insert(stream.end(), frame.begin(), frame.end());

    state->inject_rx_data(std::vector<std::uint8_t>(stream.begin(), stream.begin() + 7));
    state->inject_timeout();
    state->inject_rx_data(std::vector<std::uint8_t>(stream.begin() + 7, stream.end()));

    auto response = session->send_command(CommandCode::GET_STATUS);
    REQUIRE(std::vector<std::uint8_t>(response.bytes().begin(), response.bytes().end()) == frame);
    REQUIRE(response.left_count() == 42);
    REQUIRE(state->tx_history.size() == 1);
}

TEST_CASE("DeviceSession - Two queued frames return the first", "[session][sync]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    auto first = make_response(0x01, 0x55, 1, 0);
    auto second = make_response(0x01, 0x55, 2, 0);
    std::vector<std::uint8_t> both = first;
    both.insert(both.end(), second.begin(), second.end());
    state->inject_rx_data(both);

    auto status = session->get_status();
    REQUIRE(status.left_pedestrian_count == 1);
}

TEST_CASE("DeviceSession - Read error after partial data is ignored", "[session][sync]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    auto frame = make_response();
    state->inject_rx_data(std::vector<std::uint8_t>(frame.begin(), frame.begin() + 5));
    state->inject_read_error();
    state->inject_rx_data(std::vector<std::uint8_t>(frame.begin() + 5, frame.end()));

    REQUIRE_NOTHROW(session->close_gate());
    REQUIRE(state->tx_history.size() == 1);
}

// === Retry ===

TEST_CASE("DeviceSession - Transient write failures are retried", "[session][retry]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 3;
    auto session = create_session_with_mock(config, state);
    session->open();

    SECTION("Succeeds on attempt k+1 after k failures") {
        state->fail_next_writes(2);
        state->inject_rx_data(make_response());

        REQUIRE_NOTHROW(session->close_gate());
        REQUIRE(state->write_count() == 3);
        REQUIRE(state->tx_history.size() == 1);
    }

    SECTION("All attempts fail") {
        state->fail_next_writes(100);
        try {
            session->close_gate();
            FAIL("Should have thrown RetryExhaustedException");
        } catch (const RetryExhaustedException& e) {
            REQUIRE(e.status() == Status::RETRY_EXHAUSTED);
            REQUIRE(e.last_status() == Status::DWRITE_ERROR);
            REQUIRE(e.attempts() == 4);
            REQUIRE_THAT(std::string(e.what()),
                Catch::Matchers::ContainsSubstring("after 4 attempts"));
        }
        REQUIRE(state->write_count() == 4);
    }
}

TEST_CASE("DeviceSession - Backoff grows linearly with the attempt", "[session][retry]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 2;
    config.retry_backoff_ms = 20;
    auto session = create_session_with_mock(config, state);
    session->open();

    // Sleeps of 1 x 20 ms then 2 x 20 ms before the second and third attempts
    state->fail_next_writes(3);
    auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(session->close_gate(), RetryExhaustedException);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    REQUIRE(elapsed.count() >= 60);
    REQUIRE(state->write_count() == 3);
}

TEST_CASE("DeviceSession - Partial write is a transient failure", "[session][retry]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 1;
    auto session = create_session_with_mock(config, state);
    session->open();

    state->short_writes = true;
    try {
        session->close_gate();
        FAIL("Should have thrown RetryExhaustedException");
    } catch (const RetryExhaustedException& e) {
        REQUIRE(e.last_status() == Status::DWRITE_ERROR);
        REQUIRE(e.attempts() == 2);
    }
}

TEST_CASE("DeviceSession - Missing response is retried", "[session][retry]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 2;
    auto session = create_session_with_mock(config, state);
    session->open();

    // The gate only answers the second transmission
    MockSerialState* raw = state.get();
    state->on_write = [raw]() {
            if (raw->tx_history.size() == 2) {
                raw->inject_rx_data(make_response());
            }
        };

    REQUIRE_NOTHROW(session->disable_restrictions());
    REQUIRE(state->tx_history.size() == 2);
    REQUIRE(state->read_calls == config.read_attempts + 1);
}

TEST_CASE("DeviceSession - Read budget exhaustion", "[session][retry]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 0;
    auto session = create_session_with_mock(config, state);
    session->open();

    SECTION("Partial bytes yield INCOMPLETE_FRAME with the bytes kept") {
        auto frame = make_response();
        state->inject_rx_data(std::vector<std::uint8_t>(frame.begin(), frame.begin() + 10));
        try {
            session->get_status();
            FAIL("Should have thrown RetryExhaustedException");
        } catch (const RetryExhaustedException& e) {
            REQUIRE(e.last_status() == Status::INCOMPLETE_FRAME);
            REQUIRE(e.attempts() == 1);
            REQUIRE(e.partial_frame() ==
                std::vector<std::uint8_t>(frame.begin(), frame.begin() + 10));
        }
        REQUIRE(state->read_calls == config.read_attempts);
    }

    SECTION("Nothing received yields NO_DATA") {
        try {
            session->get_status();
            FAIL("Should have thrown RetryExhaustedException");
        } catch (const RetryExhaustedException& e) {
            REQUIRE(e.last_status() == Status::NO_DATA);
            REQUIRE(e.partial_frame().empty());
        }
        REQUIRE(state->read_calls == config.read_attempts);
    }

    SECTION("Read error before any byte fails the attempt") {
        state->inject_read_error();
        try {
            session->get_status();
            FAIL("Should have thrown RetryExhaustedException");
        } catch (const RetryExhaustedException& e) {
            REQUIRE(e.last_status() == Status::DREAD_ERROR);
        }
        REQUIRE(state->read_calls == 1);
    }
}

TEST_CASE("DeviceSession - Rejected responses are not retried", "[session][retry][error]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 3;
    auto session = create_session_with_mock(config, state);
    session->open();

    SECTION("Device ID mismatch") {
        state->inject_rx_data(make_response(0x02));
        try {
            session->get_status();
            FAIL("Should have thrown ResponseException");
        } catch (const ResponseException& e) {
            REQUIRE(e.status() == Status::DEVICE_ID_MISMATCH);
        }
    }

    SECTION("Command failed") {
        state->inject_rx_data(make_response(0x01, 0x00));
        try {
            session->left_open(1);
            FAIL("Should have thrown ResponseException");
        } catch (const ResponseException& e) {
            REQUIRE(e.status() == Status::COMMAND_FAILED);
            REQUIRE_THAT(e.context(), Catch::Matchers::EndsWith(
                    "execution byte 0x00, expected 0x55 -> LeftOpen"));
        }
    }

    REQUIRE(state->write_count() == 1);
}

TEST_CASE("DeviceSession - Bad response checksum is accepted", "[session][checksum]") {
    auto state = std::make_shared<MockSerialState>();
    auto session = create_session_with_mock(make_test_config(), state);
    session->open();

    auto frame = make_response(0x01, 0x55, 5, 6);
    frame[ResponseLayout::CHECKSUM] = 0x00;
    state->inject_rx_data(frame);

    auto response = session->send_command(CommandCode::GET_STATUS);
    REQUIRE_FALSE(response.checksum_valid());
    REQUIRE(response.left_count() == 5);
}

// === Cancellation ===

TEST_CASE("DeviceSession - Cancellation", "[session][cancel]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.retry_count = 3;
    auto session = create_session_with_mock(config, state);
    session->open();

    CancelToken token;

    SECTION("Cancelled before the exchange") {
        token.cancel();
        REQUIRE_THROWS_AS(session->get_status(token), CancelledException);
        REQUIRE(state->write_count() == 0);
    }

    SECTION("Cancelled while waiting for the response") {
        state->on_write = [&token]() { token.cancel(); };
        try {
            session->get_status(token);
            FAIL("Should have thrown CancelledException");
        } catch (const CancelledException& e) {
            REQUIRE(e.status() == Status::CANCELLED);
        }
        REQUIRE(state->write_count() == 1);
        REQUIRE(state->read_calls == 0);
    }

    SECTION("Cancelled during the backoff before a retry") {
        state->fail_next_writes(1);
        state->on_write = [&token]() { token.cancel(); };
        try {
            session->close_gate(token);
            FAIL("Should have thrown CancelledException");
        } catch (const CancelledException& e) {
            REQUIRE(e.status() == Status::CANCELLED);
            REQUIRE_THAT(e.context(), Catch::Matchers::StartsWith("backoff:"));
        }
        REQUIRE(state->write_count() == 1);
        REQUIRE(state->tx_history.empty());
    }

    SECTION("Token reset allows the next command") {
        token.cancel();
        REQUIRE_THROWS_AS(session->close_gate(token), CancelledException);
        token.reset();
        state->inject_rx_data(make_response());
        REQUIRE_NOTHROW(session->close_gate(token));
    }
}

// === Diagnostics ===

TEST_CASE("DeviceSession - Debug logging", "[session][logging]") {
    auto state = std::make_shared<MockSerialState>();
    std::ostringstream log;
    auto logger = std::make_shared<Logger>(LogLevel::DEBUG, log);

    SessionConfig config = make_test_config();
    config.retry_count = 1;
    auto session = create_session_with_mock(config, state, logger);
    session->open();

    state->fail_next_writes(1);
    state->inject_rx_data(make_response());
    session->get_status();

    const std::string out = log.str();
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[INFO] Opened /dev/mock"));
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[WARN] GetStatus attempt 1/2 failed"));
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[DEBUG] TX: 7E 00 01 10 00 00 00 EE"));
    REQUIRE_THAT(out, Catch::Matchers::ContainsSubstring("[DEBUG] RX: 7F"));
}

TEST_CASE("DeviceSession - Logger follows the configured level", "[session][logging]") {
    auto state = std::make_shared<MockSerialState>();

    SECTION("No logger given") {
        SessionConfig config = make_test_config();
        config.log_level = LogLevel::WARN;
        auto session = create_session_with_mock(config, state);
        REQUIRE(session->get_logger() != nullptr);
        REQUIRE(session->get_logger()->level() == LogLevel::WARN);
    }

    SECTION("Explicit logger wins") {
        SessionConfig config = make_test_config();
        config.log_level = LogLevel::DEBUG;
        auto logger = std::make_shared<Logger>(LogLevel::ERROR);
        auto session = create_session_with_mock(config, state, logger);
        REQUIRE(session->get_logger() == logger);
        REQUIRE(session->get_logger()->level() == LogLevel::ERROR);
    }
}

TEST_CASE("DeviceSession - Description and config copy", "[session]") {
    auto state = std::make_shared<MockSerialState>();
    SessionConfig config = make_test_config();
    config.device_id = 0x0A;
    auto session = create_session_with_mock(config, state);

    REQUIRE(session->get_config().device_id == 0x0A);
    REQUIRE_THAT(session->to_string(), Catch::Matchers::ContainsSubstring("Open: No"));
    session->open();
    REQUIRE_THAT(session->to_string(), Catch::Matchers::ContainsSubstring("0x0A"));
    REQUIRE_THAT(session->to_string(), Catch::Matchers::ContainsSubstring("Open: Yes"));
}
