/**
 * @file ds205a_example.cpp
 * @brief Walk a DS205A turnstile through a typical passage sequence
 * @version 0.1
 * @date 2025-11-18
 *
 * Usage: ds205a_example [config.json]
 *
 * Settings come from the optional JSON file and DS205A_* environment
 * variables. A failing step is reported and the sequence carries on.
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "script_utils.hpp"
#include <csignal>
#include <thread>
#include <memory>

using namespace ds205a;

namespace {

    constexpr std::chrono::seconds PASSAGE_WAIT{20};

    CancelToken g_cancel;

    void signal_handler(int signal) {
        if (signal == SIGINT) {
            g_cancel.cancel();
        }
    }

    /**
     * @brief Run one step, turning device errors into warnings
     * @return false if the step failed
     */
    bool run_step(Logger& logger, const std::string& title, const std::function<void()>& step) {
        std::cout << "\n" << title << "...\n";
        try {
            step();
            return true;
        } catch (const CancelledException&) {
            throw;
        } catch (const DS205AException& e) {
            logger.warn(title + " failed: " + e.what());
            return false;
        }
    }

    void wait_for_passage() {
        auto deadline = std::chrono::steady_clock::now() + PASSAGE_WAIT;
        while (std::chrono::steady_clock::now() < deadline) {
            if (g_cancel.is_cancelled()) {
                throw CancelledException("wait_for_passage");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    std::cout << "DS205A Turnstile Basic Example\n";
    std::cout << "==============================\n";

    std::signal(SIGINT, signal_handler);

    try {
        std::optional<std::string> config_file;
        if (argc > 1) {
            config_file = std::string(argv[1]);
        }

        SessionConfig config = SessionConfig::load(config_file);
        // Warnings from failed steps must stay visible
        auto logger = std::make_shared<Logger>(
            config.log_level == LogLevel::SILENT ? LogLevel::WARN : config.log_level);

        DeviceSession session(config, logger);

        std::cout << "Opening connection to " << config.port << "...\n";
        session.open();

        run_step(*logger, "Getting device info", [&]() {
            std::cout << session.get_device_info(g_cancel).to_string() << "\n";
        });

        run_step(*logger, "Getting initial status", [&]() {
            std::cout << session.get_status(g_cancel).to_string() << "\n";
        });

        if (run_step(*logger, "Disabling passage restrictions", [&]() {
                session.disable_restrictions(g_cancel);
            })) {
            std::cout << "Passage restrictions disabled\n";
        }

        if (run_step(*logger, "Opening left passage", [&]() {
                session.left_open(0x01, g_cancel);
            })) {
            std::cout << "Left passage opened\n";
        }
        wait_for_passage();

        if (run_step(*logger, "Opening right passage", [&]() {
                session.right_open(0x01, g_cancel);
            })) {
            std::cout << "Right passage opened\n";
        }
        wait_for_passage();

        if (run_step(*logger, "Closing gate", [&]() {
                session.close_gate(g_cancel);
            })) {
            std::cout << "Gate closed\n";
        }

        run_step(*logger, "Getting final status", [&]() {
            DeviceStatus status = session.get_status(g_cancel);
            std::cout << "Left Pedestrian Count: " << status.left_pedestrian_count << "\n";
            std::cout << "Right Pedestrian Count: " << status.right_pedestrian_count << "\n";
        });

        session.close();
    } catch (const CancelledException& e) {
        std::cerr << "Interrupted: " << e.what() << "\n";
        return 130;
    } catch (const DS205AException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\nExample completed successfully!\n";
    return 0;
}
