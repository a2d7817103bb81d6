/**
 * @file lanshare_daemon.cpp
 * @brief Interactive daemon built on LanshareNode
 *
 * LanShare - LAN Device Presence & Transfer Protocol Core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic LanshareNode usage:
 * - Start a node from config.json in the data directory
 * - List, add and trust devices
 * - Send files and follow their progress
 */

#include "lanshare/config.hpp"
#include "lanshare/errors.hpp"
#include "lanshare/lanshare_node.hpp"
#include "lanshare/security_config.hpp"
#include "lanshare/utilities.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace lanshare;
using namespace lanshare::utilities;

static std::atomic<bool> g_shutdown(false);

// Only sets the flag; the interrupted read ends the command loop
void signal_handler(int) {
    g_shutdown = true;
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // No SA_RESTART: a blocked getline must return
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [data_dir]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  data_dir    Data directory (optional, default: $LANSHARE_DATA_DIR or ~/.lanshare)\n\n";
    std::cout << "Settings are read from <data_dir>/config.json when present.\n\n";
}

void print_help() {
    std::cout << "\n+---------------------------------------------------------------+\n";
    std::cout << "|                      LanShare Commands                        |\n";
    std::cout << "+---------------------------------------------------------------+\n";
    std::cout << "| help                  - Show this help menu                   |\n";
    std::cout << "| info                  - Show node status and pairing code     |\n";
    std::cout << "| devices               - List known devices                    |\n";
    std::cout << "| add <addr> <port>     - Add and trust a device by address     |\n";
    std::cout << "| trust <id>            - Trust a discovered device             |\n";
    std::cout << "| forget <id>           - Remove a device                       |\n";
    std::cout << "| send <id> <path>      - Send a file                           |\n";
    std::cout << "| browse <id> [path]    - List a device's shared folder         |\n";
    std::cout << "| get <id> <path>       - Download from a shared folder         |\n";
    std::cout << "| cancel <session>      - Cancel a transfer                     |\n";
    std::cout << "| transfers             - List active and recent transfers      |\n";
    std::cout << "| quit / exit           - Shut down                             |\n";
    std::cout << "+---------------------------------------------------------------+\n\n";
}

void list_devices(const LanshareNode& node) {
    auto devices = node.list_devices();
    if (devices.empty()) {
        std::cout << "No devices known yet.\n";
        return;
    }

    for (const auto& device : devices) {
        std::cout << "  " << std::left << std::setw(28) << device.id
                  << std::setw(20) << device.display_name
                  << std::setw(22) << (device.address + ":" + std::to_string(device.port))
                  << std::setw(9) << to_string(device.status)
                  << (device.trusted ? "trusted" : "") << "\n";
    }
}

void print_transfer(const TransferSession& session) {
    std::string progress = format_file_size(session.bytes_transferred) + " / " + format_file_size(session.file_size);
    std::cout << "  " << std::left << std::setw(38) << session.session_id
              << std::setw(22) << format_time_point(session.started_at)
              << std::setw(8) << to_string(session.direction)
              << std::setw(14) << to_string(session.state)
              << std::setw(24) << progress
              << session.file_name;
    if (session.error) {
        std::cout << "  [" << to_string(*session.error) << ": " << session.reason << "]";
    }
    std::cout << "\n";
}

void list_transfers(const LanshareNode& node) {
    auto active = node.list_transfers();
    auto history = node.transfer_history();
    if (active.empty() && history.empty()) {
        std::cout << "No transfers.\n";
        return;
    }
    for (const auto& session : active) {
        print_transfer(session);
    }
    for (const auto& session : history) {
        print_transfer(session);
    }
}

bool handle_command(LanshareNode& node, const std::string& command_line) {
    if (command_line.empty()) {
        return true;
    }

    std::istringstream iss(command_line);
    std::string cmd;
    iss >> cmd;

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
    }
    else if (cmd == "info") {
        node.print_status();
        auto info = node.connection_info();
        for (const auto& address : info.addresses) {
            std::cout << "  Reachable at " << address << ":" << info.port << "\n";
        }
    }
    else if (cmd == "devices") {
        list_devices(node);
    }
    else if (cmd == "add") {
        std::string address;
        uint32_t port = 0;
        iss >> address >> port;

        if (address.empty() || iss.fail() || port == 0 || port > 65535) {
            std::cout << "Usage: add <address> <port>\n";
        } else {
            auto device = node.add_device(address, static_cast<uint16_t>(port));
            if (device) {
                std::cout << "[OK] Added " << device->id << " (" << device->display_name << ")\n";
            } else {
                std::cout << "[FAIL] No LanShare device answered at " << address << ":" << port << "\n";
            }
        }
    }
    else if (cmd == "trust") {
        std::string device_id;
        iss >> device_id;

        if (device_id.empty()) {
            std::cout << "Usage: trust <device_id>\n";
        } else if (node.trust_device(device_id)) {
            std::cout << "[OK] Trusted " << device_id << "\n";
        } else {
            std::cout << "[FAIL] Unknown device " << device_id << "\n";
        }
    }
    else if (cmd == "forget") {
        std::string device_id;
        iss >> device_id;

        if (device_id.empty()) {
            std::cout << "Usage: forget <device_id>\n";
        } else if (node.forget_device(device_id)) {
            std::cout << "[OK] Forgot " << device_id << "\n";
        } else {
            std::cout << "[FAIL] Unknown device " << device_id << "\n";
        }
    }
    else if (cmd == "send") {
        std::string device_id, file_path;
        iss >> device_id;
        std::getline(iss, file_path);
        file_path = trim_string(file_path);

        if (device_id.empty() || file_path.empty()) {
            std::cout << "Usage: send <device_id> <file_path>\n";
        } else {
            try {
                std::string session_id = node.send(device_id, file_path);
                std::cout << "[OK] Transfer " << session_id << " started\n";
            } catch (const LanshareError& e) {
                std::cout << "[FAIL] " << to_string(e.kind()) << ": " << e.what() << "\n";
            }
        }
    }
    else if (cmd == "browse") {
        std::string device_id, path;
        iss >> device_id;
        std::getline(iss, path);
        path = trim_string(path);

        if (device_id.empty()) {
            std::cout << "Usage: browse <device_id> [path]\n";
        } else {
            try {
                DirListingMessage listing = node.list_remote_dir(device_id, path);
                std::cout << "  /" << listing.path << "\n";
                for (const auto& entry : listing.entries) {
                    std::cout << "  " << std::left << std::setw(12)
                              << (entry.is_dir ? "<dir>" : format_file_size(entry.size))
                              << entry.name << (entry.is_dir ? "/" : "") << "\n";
                }
                if (listing.truncated) {
                    std::cout << "  (listing truncated)\n";
                }
            } catch (const LanshareError& e) {
                std::cout << "[FAIL] " << to_string(e.kind()) << ": " << e.what() << "\n";
            }
        }
    }
    else if (cmd == "get") {
        std::string device_id, path;
        iss >> device_id;
        std::getline(iss, path);
        path = trim_string(path);

        if (device_id.empty() || path.empty()) {
            std::cout << "Usage: get <device_id> <path>\n";
        } else {
            try {
                std::string session_id = node.download(device_id, path);
                std::cout << "[OK] Download " << session_id << " started\n";
            } catch (const LanshareError& e) {
                std::cout << "[FAIL] " << to_string(e.kind()) << ": " << e.what() << "\n";
            }
        }
    }
    else if (cmd == "cancel") {
        std::string session_id;
        iss >> session_id;

        if (session_id.empty()) {
            std::cout << "Usage: cancel <session_id>\n";
        } else if (node.cancel(session_id)) {
            std::cout << "[OK] Cancelling " << session_id << "\n";
        } else {
            std::cout << "[FAIL] No active transfer " << session_id << "\n";
        }
    }
    else if (cmd == "transfers") {
        list_transfers(node);
    }
    else if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    else {
        std::cout << "Unknown command: " << cmd << "\n";
        std::cout << "Type 'help' for available commands\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::filesystem::path data_dir = (argc == 2) ? std::filesystem::path(argv[1])
                                                     : security::get_data_directory();
        std::filesystem::create_directories(data_dir);

        NodeConfig config = load_config(data_dir / "config.json", data_dir);

        auto level = parse_log_level(config.log_level);
        initialize_logging(config.log_file, level.value_or(LogLevel::INFO));

        std::cout << "\n+---------------------------------------------------------------+\n";
        std::cout << "|                 LanShare - LAN File Sharing                   |\n";
        std::cout << "|          Copyright © 2025 Fortified Solutions Inc.            |\n";
        std::cout << "+---------------------------------------------------------------+\n\n";

        LanshareNode node(config);
        install_signal_handlers();

        if (!node.start()) {
            log_critical("Daemon: Failed to start LanShare node");
            return 1;
        }

        // Report transfer outcomes as they happen
        auto events = node.subscribe_status();
        std::thread event_printer([events]() {
            while (!events->is_closed() || events->pending() > 0) {
                auto event = events->next(std::chrono::milliseconds(500));
                if (!event) {
                    continue;
                }
                if (event->type == StatusEventType::TransferCompleted ||
                    event->type == StatusEventType::TransferAborted ||
                    event->type == StatusEventType::DeviceDiscovered ||
                    event->type == StatusEventType::DeviceOffline) {
                    std::cout << "\n>>> " << to_string(event->type);
                    if (event->transfer) {
                        std::cout << " " << event->transfer->file_name;
                        if (!event->transfer->reason.empty()) {
                            std::cout << " (" << event->transfer->reason << ")";
                        }
                    }
                    if (event->device) {
                        std::cout << " " << event->device->id;
                    }
                    std::cout << "\n> ";
                    std::cout.flush();
                }
            }
        });

        node.print_status();
        print_help();

        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            if (!handle_command(node, line)) {
                break;
            }
        }

        std::cout << "\nShutting down...\n";
        node.stop();
        events->close();

        if (event_printer.joinable()) {
            event_printer.join();
        }

        std::cout << "LanShare stopped\n";

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
