#include "terminal_cli.h"
#include "chat_node.h"
#include "logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

#include <unistd.h>

// ANSI colors
#define C_RESET      "\033[0m"
#define C_DIM        "\033[2m"
#define C_RED        "\033[31m"
#define C_GREEN      "\033[32m"
#define C_YELLOW     "\033[33m"
#define C_MAGENTA    "\033[35m"
#define C_CYAN       "\033[36m"
#define C_BRED       "\033[91m"
#define C_BGREEN     "\033[92m"
#define C_BYELLOW    "\033[93m"

namespace peerlink {

namespace {

std::atomic<bool> g_shutdown_requested{false};

std::string safe_substr(const std::string& s, size_t pos, size_t len = std::string::npos) {
    if (pos >= s.length()) return "";
    return s.substr(pos, std::min(len, s.length() - pos));
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":"
        << std::setw(2) << tm.tm_min << ":" << std::setw(2) << tm.tm_sec;
    return oss.str();
}

std::string format_time(const Timestamp& ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm;
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << tm.tm_hour << ":" << std::setw(2) << tm.tm_min;
    return oss.str();
}

std::string rest_of_line(std::istringstream& iss) {
    std::string text;
    std::getline(iss, text);
    if (!text.empty() && text[0] == ' ') text = text.substr(1);
    return text;
}

const char* state_color(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connected: return C_BGREEN;
        case ConnectionState::Connecting: return C_YELLOW;
        default: return C_DIM;
    }
}

} // namespace

void request_shutdown() {
    g_shutdown_requested.store(true);
}

TerminalCLI::TerminalCLI(ChatNode& chat_node, bool daemon_mode)
    : node(chat_node)
    , daemon_mode_(daemon_mode)
    , running(false)
{
    // Route log lines through the CLI before the node starts.
    setLogCallback([this](const std::string& msg) {
        this->on_log_message(msg);
    });

    ChatNodeEvents events;
    events.onMessage = [this](const ChatMessage& m, const PeerIdentity& from) { on_message_received(m, from); };
    events.onPeerState = [this](const PeerIdentity& p, ConnectionState s) { on_peer_state(p, s); };
    events.onProfile = [this](const UserProfile& p, const PeerIdentity& from) { on_profile_received(p, from); };
    events.onMessageStatus = [this](const std::string& id, MessageStatus s) { on_message_status(id, s); };
    node.setEventCallbacks(std::move(events));
}

TerminalCLI::~TerminalCLI() {
    // Prevent callbacks into a destroyed CLI.
    node.clearEventCallbacks();
    setLogCallback({});
}

void TerminalCLI::run() {
    running = true;
    if (daemon_mode_) {
        run_daemon();
    } else {
        run_plain();
    }
}

void TerminalCLI::stop() {
    running = false;
}

void TerminalCLI::run_plain() {
    print("PeerLink (plain mode). Type 'help' for commands. Ctrl-D/Ctrl-C to exit.");

    std::string line;
    while (running && !g_shutdown_requested.load()) {
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "peerlink> " << std::flush;
        }
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (!process_command(line)) {
            break;
        }
    }

    print("Goodbye!");
}

void TerminalCLI::run_daemon() {
    // No stdin; the node runs on its own threads.
    print("PeerLink daemon mode started. Use 'kill -TERM " + std::to_string(getpid()) + "' to stop.");
    print("Peer ID: " + node.identity().id);

    while (running && !g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    print("Goodbye!");
}

void TerminalCLI::print(const std::string& line) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// NODE CALLBACKS
// ═══════════════════════════════════════════════════════════════════════════

void TerminalCLI::on_log_message(const std::string& message) {
    print(std::string(C_DIM) + "[" + get_timestamp() + "] " + message + C_RESET);
}

void TerminalCLI::on_message_received(const ChatMessage& message, const PeerIdentity& from) {
    print(C_CYAN "[" + format_time(message.timestamp) + "] " C_BYELLOW "← " + message.sender + " (" +
          safe_substr(from.id, 0, 8) + "): " C_RESET + message.displayText());
}

void TerminalCLI::on_peer_state(const PeerIdentity& peer, ConnectionState state) {
    print(std::string(state_color(state)) + "● " + peer.describe() + " " + connection_state_to_string(state) + C_RESET);
}

void TerminalCLI::on_profile_received(const UserProfile& profile, const PeerIdentity& from) {
    print(C_MAGENTA "Profile from " + safe_substr(from.id, 0, 8) + ": " + profile.displayName + " [" +
          profile.initials() + "] \"" + profile.status + "\"" C_RESET);
}

void TerminalCLI::on_message_status(const std::string& message_id, MessageStatus status) {
    if (status == MessageStatus::FAILED) {
        print(C_BRED "✗ Message " + safe_substr(message_id, 0, 8) + " could not be delivered" C_RESET);
    } else {
        print(C_DIM "✓ Message " + safe_substr(message_id, 0, 8) + " " + message_status_to_string(status) + C_RESET);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// COMMANDS
// ═══════════════════════════════════════════════════════════════════════════

bool TerminalCLI::process_command(const std::string& input) {
    std::istringstream iss(input);
    std::string cmd;
    iss >> cmd;
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    } else if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        cmd_quit();
        return false;
    } else if (cmd == "peers" || cmd == "list" || cmd == "ls") {
        cmd_list_peers();
    } else if (cmd == "send" || cmd == "msg" || cmd == "m") {
        std::string peer;
        iss >> peer;
        cmd_send(peer, rest_of_line(iss));
    } else if (cmd == "broadcast" || cmd == "bc") {
        cmd_broadcast(rest_of_line(iss));
    } else if (cmd == "profile" || cmd == "p") {
        std::string peer;
        iss >> peer;
        cmd_profile(peer);
    } else if (cmd == "whoami") {
        cmd_whoami();
    } else if (cmd == "name") {
        cmd_name(rest_of_line(iss));
    } else if (cmd == "status") {
        cmd_status(rest_of_line(iss));
    } else if (cmd == "mode") {
        std::string mode;
        iss >> mode;
        cmd_mode(mode);
    } else if (cmd == "history" || cmd == "hist") {
        std::string peer;
        iss >> peer;
        cmd_history(peer);
    } else if (cmd == "stats") {
        cmd_stats();
    } else if (cmd == "log" || cmd == "logfilter" || cmd == "lf") {
        std::string level;
        iss >> level;
        cmd_log_filter(level);
    } else if (!cmd.empty()) {
        print(C_YELLOW "Unknown: " + cmd + " (type 'help')" C_RESET);
    }
    return true;
}

void TerminalCLI::cmd_help() {
    print(C_CYAN "═══════════ COMMANDS ═══════════" C_RESET);
    print(C_GREEN "help" C_RESET "            Show this help");
    print(C_GREEN "peers" C_RESET "           Known peers and their state");
    print(C_GREEN "send" C_RESET " id text    Send a message (id prefix or name)");
    print(C_GREEN "broadcast" C_RESET " text  Send to every connected peer");
    print(C_GREEN "profile" C_RESET " id      Show or request a peer's profile");
    print(C_GREEN "whoami" C_RESET "          Show local identity and profile");
    print(C_GREEN "name" C_RESET " n          Change display name (reconnects)");
    print(C_GREEN "status" C_RESET " text     Change profile status");
    print(C_GREEN "mode" C_RESET " fg|bg      Foreground or background sweep");
    print(C_GREEN "history" C_RESET " id      Stored conversation with a peer");
    print(C_GREEN "stats" C_RESET "           Telemetry snapshot");
    print(C_YELLOW "log" C_RESET " l          error/warn/info/debug/none");
    print(C_RED "quit" C_RESET "            Exit");
}

void TerminalCLI::cmd_quit() {
    print("Shutting down...");
    running = false;
}

bool TerminalCLI::resolve(const std::string& query, PeerIdentity& out) {
    if (query.empty()) {
        print(C_YELLOW "A peer id prefix or name is required" C_RESET);
        return false;
    }
    std::vector<std::string> matches;
    auto resolved = node.resolvePeer(query, &matches);
    if (resolved) {
        out = *resolved;
        return true;
    }
    if (matches.empty()) {
        print(C_YELLOW "No match for: " + query + C_RESET);
        print(C_DIM "Try: peers" C_RESET);
    } else {
        print(C_YELLOW "Ambiguous peer id prefix. Matches:" C_RESET);
        for (const auto& m : matches) print("- " + m);
    }
    return false;
}

void TerminalCLI::cmd_list_peers() {
    auto peers = node.knownPeers();
    print(C_CYAN "═══════════ PEERS ═══════════" C_RESET);
    print(C_CYAN "Known: " + std::to_string(peers.size()) + " peer(s)" C_RESET);
    for (const auto& p : peers) {
        const ConnectionState state = node.connectionState(p);
        std::string line = p.id + "  " + p.displayName + "  [" + std::string(state_color(state)) +
                           connection_state_to_string(state) + C_RESET "]";
        if (auto profile = node.profileOf(p)) {
            line += "  \"" + profile->status + "\"";
        }
        print(line);
    }
}

void TerminalCLI::cmd_send(const std::string& peer, const std::string& message) {
    if (peer.empty() || message.empty()) {
        print(C_YELLOW "Usage: send <peer> <message>" C_RESET);
        return;
    }
    PeerIdentity target;
    if (!resolve(peer, target)) return;

    auto sent = node.sendTo(target, message);
    if (!sent) {
        print(C_YELLOW + target.describe() + " is not connected" C_RESET);
        return;
    }
    print(C_CYAN "[" + format_time(sent->timestamp) + "] " C_BYELLOW "→ " + target.displayName + ": " C_RESET + message);
}

void TerminalCLI::cmd_broadcast(const std::string& message) {
    if (message.empty()) {
        print(C_YELLOW "Usage: broadcast <message>" C_RESET);
        return;
    }
    const size_t count = node.broadcast(message);
    if (count == 0) {
        print(C_YELLOW "No connected peers" C_RESET);
        return;
    }
    print(C_MAGENTA "[BC] " C_RESET + message);
    print(C_BGREEN "✓ Broadcast to " + std::to_string(count) + " peer(s)" C_RESET);
}

void TerminalCLI::cmd_profile(const std::string& peer) {
    PeerIdentity target;
    if (!resolve(peer, target)) return;

    if (auto profile = node.profileOf(target)) {
        print(profile->displayName + " [" + profile->initials() + "]");
        print("  status: " + profile->status);
        print(std::string("  avatar: ") + (profile->avatarData ? std::to_string(profile->avatarData->size()) + " bytes" : "none"));
        return;
    }
    if (node.connectionState(target) != ConnectionState::Connected) {
        print(C_YELLOW + target.describe() + " is not connected" C_RESET);
        return;
    }
    node.requestProfile(target);
    print(C_DIM "Profile requested from " + target.describe() + C_RESET);
}

void TerminalCLI::cmd_whoami() {
    const PeerIdentity me = node.identity();
    print("Peer ID:   " + me.id);
    print("Name:      " + me.displayName);
    if (auto profile = node.localProfile()) {
        print("Status:    " + profile->status);
    }
    print("Transport: " + node.transportKind());
    print("Connected: " + std::to_string(node.connectedPeers().size()) + " peer(s)");
}

void TerminalCLI::cmd_name(const std::string& name) {
    if (name.empty()) {
        print(C_YELLOW "Usage: name <new display name>" C_RESET);
        return;
    }
    const PeerIdentity fresh = node.rename(name);
    print(C_BGREEN "✓ Now " + fresh.describe() + ", reconnecting" C_RESET);
}

void TerminalCLI::cmd_status(const std::string& status) {
    node.setStatus(status);
    if (auto profile = node.localProfile()) {
        print(C_BGREEN "✓ Status: " + profile->status + C_RESET);
    }
}

void TerminalCLI::cmd_mode(const std::string& mode) {
    std::string m = mode;
    std::transform(m.begin(), m.end(), m.begin(), ::tolower);
    if (m == "fg" || m == "foreground") {
        node.setAppMode(AppMode::Foreground);
        print(C_BGREEN "✓ Foreground" C_RESET);
    } else if (m == "bg" || m == "background") {
        node.setAppMode(AppMode::Background);
        print(C_BGREEN "✓ Background" C_RESET);
    } else {
        print(C_YELLOW "Usage: mode fg|bg" C_RESET);
    }
}

void TerminalCLI::cmd_history(const std::string& peer) {
    PeerIdentity target;
    if (!resolve(peer, target)) return;

    auto thread = node.history(target.id);
    if (!thread || thread->messages.empty()) {
        print(C_DIM "No messages with " + target.describe() + C_RESET);
        return;
    }
    print(C_CYAN "═══════════ " + thread->title + " ═══════════" C_RESET);
    for (const auto& m : thread->messages) {
        print("[" + format_time(m.timestamp) + "] " + m.sender + ": " + m.displayText() + C_DIM "  (" +
              message_status_to_string(m.status) + ")" C_RESET);
    }
}

void TerminalCLI::cmd_stats() {
    const std::string raw = node.statsJson();
    try {
        print(nlohmann::json::parse(raw).dump(2));
    } catch (const nlohmann::json::exception&) {
        print(raw);
    }
}

void TerminalCLI::cmd_log_filter(const std::string& level) {
    if (level.empty()) {
        print(std::string("Current: ") + log_level_to_string(get_log_level()));
        return;
    }
    const LogLevel parsed = parse_log_level(level, get_log_level());
    set_log_level(parsed);
    print(C_BGREEN "✓ Log level: " + std::string(log_level_to_string(parsed)) + C_RESET);
}

} // namespace peerlink
