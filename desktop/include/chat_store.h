#pragma once

#include "chat_models.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

/**
 * @brief JSON-file store for the desktop shell: chat threads (most recently
 * active first) and the user's own profile.
 *
 * Every mutating call rewrites the file. The coordinator never touches the
 * store; the shell feeds it from coordinator callbacks.
 */
class ChatStore {
public:
    explicit ChatStore(std::string path);

    // A missing file is an empty store. Returns false on unreadable or
    // malformed content (the in-memory store is left empty).
    bool load();

    std::vector<ChatThread> loadThreads() const;
    bool saveThreads(const std::vector<ChatThread>& threads);

    // Existing thread for the peer, or a new empty one (not yet persisted).
    ChatThread threadForPeer(const std::string& peer_id, const std::string& title);

    // Creates the thread on first use and moves it to the front.
    bool appendMessage(const std::string& peer_id, const std::string& title, const ChatMessage& message);
    bool deleteThread(const std::string& thread_id);
    // Updates every stored copy; false when no stored message has that id.
    bool updateMessageStatus(const std::string& message_id, MessageStatus status);

    std::optional<UserProfile> loadProfile() const;
    bool saveProfile(const UserProfile& profile);

    const std::string& path() const { return m_path; }

private:
    bool persistLocked() const;

    mutable std::mutex m_mutex;
    std::string m_path;
    std::vector<ChatThread> m_threads;
    std::optional<UserProfile> m_profile;
};

} // namespace peerlink
