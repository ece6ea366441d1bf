#include "chat_store.h"
#include "chat_json.h"
#include "logger.h"

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace peerlink {

using json = nlohmann::json;

ChatStore::ChatStore(std::string path) : m_path(std::move(path)) {}

bool ChatStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_threads.clear();
    m_profile.reset();

    std::ifstream in(m_path);
    if (!in.is_open()) {
        LOG_INFO("Store: no store at " + m_path + ", starting empty");
        return true;
    }

    try {
        json doc = json::parse(in);
        if (!doc.is_object()) {
            LOG_ERROR("Store: top level of " + m_path + " is not an object");
            return false;
        }

        std::vector<ChatThread> threads;
        if (doc.contains("threads")) {
            for (const auto& t : doc.at("threads")) {
                threads.push_back(thread_from_json(t));
            }
        }
        std::optional<UserProfile> profile;
        if (doc.contains("profile") && !doc.at("profile").is_null()) {
            profile = profile_from_json(doc.at("profile"));
        }

        m_threads = std::move(threads);
        m_profile = std::move(profile);
    } catch (const json::exception& e) {
        LOG_ERROR("Store: " + m_path + " is malformed: " + e.what());
        return false;
    } catch (const DecodeError& e) {
        LOG_ERROR("Store: " + m_path + " has an invalid record: " + e.what());
        return false;
    }

    LOG_INFO("Store: loaded " + std::to_string(m_threads.size()) + " thread(s) from " + m_path);
    return true;
}

std::vector<ChatThread> ChatStore::loadThreads() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_threads;
}

bool ChatStore::saveThreads(const std::vector<ChatThread>& threads) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_threads = threads;
    return persistLocked();
}

ChatThread ChatStore::threadForPeer(const std::string& peer_id, const std::string& title) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_threads.begin(), m_threads.end(),
                           [&](const ChatThread& t) { return t.peerID == peer_id; });
    if (it != m_threads.end()) {
        return *it;
    }
    ChatThread thread;
    thread.id = generate_uuid();
    thread.peerID = peer_id;
    thread.title = title;
    return thread;
}

bool ChatStore::appendMessage(const std::string& peer_id, const std::string& title, const ChatMessage& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_threads.begin(), m_threads.end(),
                           [&](const ChatThread& t) { return t.peerID == peer_id; });

    ChatThread thread;
    if (it != m_threads.end()) {
        thread = std::move(*it);
        m_threads.erase(it);
    } else {
        thread.id = generate_uuid();
        thread.peerID = peer_id;
    }
    if (!title.empty()) thread.title = title;
    thread.messages.push_back(message);
    m_threads.insert(m_threads.begin(), std::move(thread));
    return persistLocked();
}

bool ChatStore::deleteThread(const std::string& thread_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_threads.begin(), m_threads.end(),
                             [&](const ChatThread& t) { return t.id == thread_id; });
    if (it == m_threads.end()) return false;
    m_threads.erase(it, m_threads.end());
    return persistLocked();
}

bool ChatStore::updateMessageStatus(const std::string& message_id, MessageStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);
    // A broadcast stores the same message in several threads.
    bool found = false;
    for (auto& thread : m_threads) {
        for (auto& message : thread.messages) {
            if (message.id == message_id) {
                message.status = status;
                found = true;
            }
        }
    }
    return found && persistLocked();
}

std::optional<UserProfile> ChatStore::loadProfile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profile;
}

bool ChatStore::saveProfile(const UserProfile& profile) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_profile = profile;
    return persistLocked();
}

// Writes to "<path>.tmp" and renames over the store.
bool ChatStore::persistLocked() const {
    json doc = json::object();
    json threads = json::array();
    for (const auto& t : m_threads) {
        threads.push_back(thread_to_json(t));
    }
    doc["threads"] = std::move(threads);
    doc["profile"] = m_profile ? profile_to_json(*m_profile) : json(nullptr);

    const std::string tmp_path = m_path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("Store: cannot write " + tmp_path);
            return false;
        }
        out << doc.dump(2);
        if (!out.good()) {
            LOG_ERROR("Store: write to " + tmp_path + " failed");
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), m_path.c_str()) != 0) {
        LOG_ERROR("Store: cannot replace " + m_path);
        return false;
    }
    return true;
}

} // namespace peerlink
