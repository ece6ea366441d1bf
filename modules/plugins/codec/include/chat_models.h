#ifndef PEERLINK_CHAT_MODELS_H
#define PEERLINK_CHAT_MODELS_H

#include "codec_utils.h"

#include <optional>
#include <string>
#include <vector>

namespace peerlink {

enum class MessageType {
    TEXT,
    IMAGE,
    VIDEO,
    AUDIO,
    FILE,
    LOCATION,
    CONTACT
};

enum class MessageStatus {
    SENDING,
    SENT,
    DELIVERED,
    READ,
    FAILED
};

const char* message_type_to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& value);
const char* message_status_to_string(MessageStatus status);
std::optional<MessageStatus> message_status_from_string(const std::string& value);

struct MediaAttachment {
    std::string filename;
    std::string mimeType;
    Bytes data;
    std::optional<Bytes> thumbnailData;

    bool operator==(const MediaAttachment& other) const {
        return filename == other.filename && mimeType == other.mimeType && data == other.data &&
               thumbnailData == other.thumbnailData;
    }
    bool operator!=(const MediaAttachment& other) const { return !(*this == other); }
};

struct ChatMessage {
    std::string id;      // UUID, upper-case
    std::string sender;  // sender's display name
    std::string text;
    Timestamp timestamp;
    MessageType messageType = MessageType::TEXT;
    std::optional<MediaAttachment> attachment;
    MessageStatus status = MessageStatus::SENDING;
    std::optional<std::string> replyToMessageID;

    // New outgoing text message with a fresh id, stamped now, status SENDING.
    static ChatMessage compose(const std::string& sender, const std::string& text);

    bool operator==(const ChatMessage& other) const {
        return id == other.id && sender == other.sender && text == other.text && timestamp == other.timestamp &&
               messageType == other.messageType && attachment == other.attachment && status == other.status &&
               replyToMessageID == other.replyToMessageID;
    }
    bool operator!=(const ChatMessage& other) const { return !(*this == other); }

    // Text shown in thread previews; media messages without text get a label.
    std::string displayText() const;
};

struct UserProfile {
    std::string displayName;
    std::string status;
    std::optional<Bytes> avatarData;
    Timestamp createdAt;

    static UserProfile create(const std::string& display_name, const std::string& status);

    bool operator==(const UserProfile& other) const {
        return displayName == other.displayName && status == other.status && avatarData == other.avatarData &&
               createdAt == other.createdAt;
    }
    bool operator!=(const UserProfile& other) const { return !(*this == other); }

    // Up to two upper-case initials of the display name.
    std::string initials() const;
};

struct ChatThread {
    std::string id;
    std::string peerID;
    std::string title;
    std::vector<ChatMessage> messages;

    bool operator==(const ChatThread& other) const {
        return id == other.id && peerID == other.peerID && title == other.title && messages == other.messages;
    }
};

} // namespace peerlink

#endif // PEERLINK_CHAT_MODELS_H
