#include "chat_node.h"
#include "config_manager.h"
#include "logger.h"
#include "terminal_cli.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <signal.h>

using namespace peerlink;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE     Path to configuration file (default: config.json)\n"
              << "  --name NAME       Display name (default: stored profile)\n"
              << "  --status TEXT     Profile status line\n"
              << "  --transport KIND  lan|loopback (default: transport.kind from config)\n"
              << "  --log-level LVL   debug|info|warning|error|none (default: logging.level)\n"
              << "  --daemon          Run without reading stdin\n"
              << "  --help            Show this help message\n"
              << "\nLoopback mode starts an in-process echo peer, useful without a network.\n"
              << std::endl;
}

void on_terminate_signal(int) {
    request_shutdown();
}

void install_signal_handlers() {
    // Ignore SIGPIPE so a dropped TCP session cannot kill the process.
    signal(SIGPIPE, SIG_IGN);

    // No SA_RESTART: a blocked stdin read returns so the prompt loop can exit.
    struct sigaction sa = {};
    sa.sa_handler = on_terminate_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

} // namespace

int main(int argc, char* argv[]) {
    install_signal_handlers();

    std::string config_path = "config.json";
    std::string display_name;
    std::string status;
    std::string transport_kind;
    std::string log_level_arg;
    bool daemon_mode = false;

    auto need_value = [&](int& i, const std::string& flag, std::string& out) -> bool {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << flag << " requires an argument" << std::endl;
            return false;
        }
        out = argv[++i];
        return true;
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (!need_value(i, arg, config_path)) return 1;
        } else if (arg == "--name") {
            if (!need_value(i, arg, display_name)) return 1;
        } else if (arg == "--status") {
            if (!need_value(i, arg, status)) return 1;
        } else if (arg == "--transport") {
            if (!need_value(i, arg, transport_kind)) return 1;
            if (transport_kind != "lan" && transport_kind != "loopback") {
                std::cerr << "Error: --transport must be lan or loopback" << std::endl;
                return 1;
            }
        } else if (arg == "--log-level") {
            if (!need_value(i, arg, log_level_arg)) return 1;
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Config errors go to stderr until the CLI takes over the log sink.
    set_log_level(LogLevel::WARNING);

    // Useful when running from build/bin.
    std::vector<std::string> candidates;
    candidates.push_back(config_path);
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");

    std::error_code ec;
    std::filesystem::path exe_dir = std::filesystem::absolute(argv[0], ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
        candidates.push_back((exe_dir / "../../config.json").lexically_normal().string());
    }

    ConfigManager config;
    std::string chosen_config;
    for (const auto& c : candidates) {
        if (config.loadConfig(c)) {
            chosen_config = c;
            break;
        }
    }
    if (chosen_config.empty()) {
        std::cerr << "Warning: no configuration file found, using built-in defaults. Tried:" << std::endl;
        for (const auto& c : candidates) {
            std::cerr << "  - " << c << std::endl;
        }
    }

    const std::string level = log_level_arg.empty() ? config.getLogLevel() : log_level_arg;
    set_log_level(parse_log_level(level, LogLevel::INFO));
    setSessionId(generate_session_id(6));
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }

    if (transport_kind.empty()) {
        transport_kind = config.getTransportKind();
    }

    ChatNode node(config);

    // The CLI registers its log sink before the node starts so startup logs show up.
    int exit_code = 0;
    {
        TerminalCLI cli(node, daemon_mode);

        if (!node.start(display_name, status, transport_kind)) {
            std::cerr << "Error: Failed to start node" << std::endl;
            exit_code = 1;
        } else {
            cli.run();
            node.stop();
        }
    }

    if (is_async_logging_enabled()) {
        disable_async_logging();
    }
    return exit_code;
}
