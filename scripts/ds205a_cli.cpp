/**
 * @file ds205a_cli.cpp
 * @brief Send a single command to a DS205A turnstile and print the result
 * @version 0.1
 * @date 2025-11-18
 *
 * The command name is checked before the serial port is touched. Ctrl+C
 * cancels the command in flight; the session then closes the port.
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "script_utils.hpp"
#include <csignal>

using namespace ds205a;

// Shared with the signal handler; cancel() is a lock-free atomic store
static CancelToken g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.cancel();
    }
}

int main(int argc, char* argv[]) {
    ScriptConfig script;
    try {
        script = parse_arguments(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (script.command.empty()) {
        std::cerr << "Error: no command given (use -c <command>)\n\n";
        display_help(argv[0]);
        return 1;
    }

    const CliCommand* command = find_command(script.command);
    if (command == nullptr) {
        std::cerr << "Error: unknown command '" << script.command << "'\n";
        std::cerr << "Available commands:";
        for (const auto& cmd : cli_commands()) {
            std::cerr << " " << cmd.name;
        }
        std::cerr << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        SessionConfig config = build_session_config(script);

        // Logs to std::cerr at config.log_level
        DeviceSession session(config);
        session.open();
        std::cout << "[" << get_timestamp() << "] " << session.to_string() << "\n";

        command->action(session, script.value, g_cancel);

        std::cout << "[" << get_timestamp() << "] Command '" << command->name <<
            "' completed\n";
        session.close();
    } catch (const CancelledException& e) {
        std::cerr << "Cancelled: " << e.what() << "\n";
        return 130;
    } catch (const DS205AException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
