#include "chat_models.h"
#include "constants.h"

#include <cctype>
#include <sstream>

namespace peerlink {

const char* message_type_to_string(MessageType type) {
    switch (type) {
        case MessageType::TEXT: return "text";
        case MessageType::IMAGE: return "image";
        case MessageType::VIDEO: return "video";
        case MessageType::AUDIO: return "audio";
        case MessageType::FILE: return "file";
        case MessageType::LOCATION: return "location";
        case MessageType::CONTACT: return "contact";
    }
    return "text";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
    if (value == "text") return MessageType::TEXT;
    if (value == "image") return MessageType::IMAGE;
    if (value == "video") return MessageType::VIDEO;
    if (value == "audio") return MessageType::AUDIO;
    if (value == "file") return MessageType::FILE;
    if (value == "location") return MessageType::LOCATION;
    if (value == "contact") return MessageType::CONTACT;
    return std::nullopt;
}

const char* message_status_to_string(MessageStatus status) {
    switch (status) {
        case MessageStatus::SENDING: return "sending";
        case MessageStatus::SENT: return "sent";
        case MessageStatus::DELIVERED: return "delivered";
        case MessageStatus::READ: return "read";
        case MessageStatus::FAILED: return "failed";
    }
    return "sending";
}

std::optional<MessageStatus> message_status_from_string(const std::string& value) {
    if (value == "sending") return MessageStatus::SENDING;
    if (value == "sent") return MessageStatus::SENT;
    if (value == "delivered") return MessageStatus::DELIVERED;
    if (value == "read") return MessageStatus::READ;
    if (value == "failed") return MessageStatus::FAILED;
    return std::nullopt;
}

ChatMessage ChatMessage::compose(const std::string& sender, const std::string& text) {
    ChatMessage msg;
    msg.id = generate_uuid();
    msg.sender = sender;
    msg.text = text;
    msg.timestamp = now_timestamp();
    return msg;
}

std::string ChatMessage::displayText() const {
    if (!text.empty()) return text;
    switch (messageType) {
        case MessageType::IMAGE: return "[Photo]";
        case MessageType::FILE: return "[" + (attachment ? attachment->filename : std::string("File")) + "]";
        case MessageType::LOCATION: return "[Location]";
        case MessageType::CONTACT: return "[Contact]";
        default: return text;
    }
}

UserProfile UserProfile::create(const std::string& display_name, const std::string& status) {
    UserProfile profile;
    profile.displayName = display_name;
    profile.status = status.empty() ? DEFAULT_PROFILE_STATUS : status;
    profile.createdAt = now_timestamp();
    return profile;
}

std::string UserProfile::initials() const {
    std::istringstream words(displayName);
    std::string word;
    std::string out;
    while (out.size() < 2 && words >> word) {
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(word[0]))));
    }
    return out;
}

} // namespace peerlink
