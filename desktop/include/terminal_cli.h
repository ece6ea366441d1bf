/**
 * terminal_cli.h - line-oriented chat shell
 *
 * Two modes:
 *   plain   prompt on stdin, command results and chat lines on stdout
 *   daemon  no stdin; logs and chat lines only, until stop() or a signal
 */

#ifndef PEERLINK_TERMINAL_CLI_H
#define PEERLINK_TERMINAL_CLI_H

#include "chat_models.h"
#include "connection_state.h"
#include "peer_identity.h"

#include <atomic>
#include <mutex>
#include <string>

namespace peerlink {

class ChatNode;

// Async-signal-safe; makes run() return at the next poll.
void request_shutdown();

class TerminalCLI {
public:
    explicit TerminalCLI(ChatNode& node, bool daemon_mode = false);
    ~TerminalCLI();

    void run();
    void stop();

    // Exposed for the shell's tests; returns false once "quit" was processed.
    bool process_command(const std::string& input);

    // Callbacks from the node
    void on_log_message(const std::string& message);
    void on_message_received(const ChatMessage& message, const PeerIdentity& from);
    void on_peer_state(const PeerIdentity& peer, ConnectionState state);
    void on_profile_received(const UserProfile& profile, const PeerIdentity& from);
    void on_message_status(const std::string& message_id, MessageStatus status);

private:
    ChatNode& node;
    bool daemon_mode_;
    std::atomic<bool> running;

    std::mutex output_mutex;

    void run_plain();
    void run_daemon();

    void print(const std::string& line);

    // Resolves an id prefix or display name; prints why when it fails.
    bool resolve(const std::string& query, PeerIdentity& out);

    // Command handlers
    void cmd_help();
    void cmd_quit();
    void cmd_list_peers();
    void cmd_send(const std::string& peer, const std::string& message);
    void cmd_broadcast(const std::string& message);
    void cmd_profile(const std::string& peer);
    void cmd_whoami();
    void cmd_name(const std::string& name);
    void cmd_status(const std::string& status);
    void cmd_mode(const std::string& mode);
    void cmd_history(const std::string& peer);
    void cmd_stats();
    void cmd_log_filter(const std::string& level);
};

} // namespace peerlink

#endif // PEERLINK_TERMINAL_CLI_H
