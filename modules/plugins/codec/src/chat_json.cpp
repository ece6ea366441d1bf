#include "chat_json.h"

namespace peerlink {

using json = nlohmann::json;

namespace {

const json& require(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        throw DecodeError(std::string("missing key \"") + key + "\"");
    }
    return *it;
}

std::string require_string(const json& j, const char* key) {
    const json& v = require(j, key);
    if (!v.is_string()) {
        throw DecodeError(std::string("\"") + key + "\" is not a string");
    }
    return v.get<std::string>();
}

std::string require_uuid(const json& j, const char* key) {
    std::string value = require_string(j, key);
    if (!is_uuid(value)) {
        throw DecodeError(std::string("\"") + key + "\" is not a UUID");
    }
    return value;
}

Bytes require_bytes(const json& j, const char* key) {
    auto decoded = base64_decode(require_string(j, key));
    if (!decoded) {
        throw DecodeError(std::string("\"") + key + "\" is not valid base64");
    }
    return std::move(*decoded);
}

bool has(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

json date_to_json(Timestamp ts, DateEncoding dates) {
    if (dates == DateEncoding::REFERENCE_SECONDS) {
        return to_reference_seconds(ts);
    }
    return format_iso8601(ts);
}

Timestamp require_date(const json& j, const char* key, DateEncoding dates) {
    const json& v = require(j, key);
    if (dates == DateEncoding::REFERENCE_SECONDS) {
        if (!v.is_number()) {
            throw DecodeError(std::string("\"") + key + "\" is not a number");
        }
        return from_reference_seconds(v.get<double>());
    }
    if (!v.is_string()) {
        throw DecodeError(std::string("\"") + key + "\" is not a date string");
    }
    auto ts = parse_iso8601(v.get<std::string>());
    if (!ts) {
        throw DecodeError(std::string("\"") + key + "\" is not an ISO-8601 date");
    }
    return *ts;
}

json attachment_to_json(const MediaAttachment& a) {
    json j = {
        {"filename", a.filename},
        {"mimeType", a.mimeType},
        {"data", base64_encode(a.data)}
    };
    if (a.thumbnailData) {
        j["thumbnailData"] = base64_encode(*a.thumbnailData);
    }
    return j;
}

MediaAttachment attachment_from_json(const json& j) {
    if (!j.is_object()) {
        throw DecodeError("\"attachment\" is not an object");
    }
    MediaAttachment a;
    a.filename = require_string(j, "filename");
    a.mimeType = require_string(j, "mimeType");
    a.data = require_bytes(j, "data");
    if (has(j, "thumbnailData")) {
        a.thumbnailData = require_bytes(j, "thumbnailData");
    }
    return a;
}

} // namespace

json message_to_json(const ChatMessage& message, DateEncoding dates) {
    json j = {
        {"id", message.id},
        {"sender", message.sender},
        {"text", message.text},
        {"timestamp", date_to_json(message.timestamp, dates)},
        {"messageType", message_type_to_string(message.messageType)},
        {"status", message_status_to_string(message.status)}
    };
    if (message.attachment) {
        j["attachment"] = attachment_to_json(*message.attachment);
    }
    if (message.replyToMessageID) {
        j["replyToMessageID"] = *message.replyToMessageID;
    }
    return j;
}

ChatMessage message_from_json(const json& j, DateEncoding dates) {
    if (!j.is_object()) {
        throw DecodeError("chat message is not an object");
    }
    ChatMessage message;
    message.id = require_uuid(j, "id");
    message.sender = require_string(j, "sender");
    message.text = require_string(j, "text");
    message.timestamp = require_date(j, "timestamp", dates);

    const std::string type = require_string(j, "messageType");
    auto parsed_type = message_type_from_string(type);
    if (!parsed_type) {
        throw DecodeError("unknown messageType \"" + type + "\"");
    }
    message.messageType = *parsed_type;

    const std::string status = require_string(j, "status");
    auto parsed_status = message_status_from_string(status);
    if (!parsed_status) {
        throw DecodeError("unknown status \"" + status + "\"");
    }
    message.status = *parsed_status;

    if (has(j, "attachment")) {
        message.attachment = attachment_from_json(j.at("attachment"));
    }
    if (has(j, "replyToMessageID")) {
        message.replyToMessageID = require_uuid(j, "replyToMessageID");
    }
    return message;
}

json profile_to_json(const UserProfile& profile, DateEncoding dates) {
    json j = {
        {"displayName", profile.displayName},
        {"status", profile.status},
        {"createdAt", date_to_json(profile.createdAt, dates)}
    };
    if (profile.avatarData) {
        j["avatarData"] = base64_encode(*profile.avatarData);
    }
    return j;
}

UserProfile profile_from_json(const json& j, DateEncoding dates) {
    if (!j.is_object()) {
        throw DecodeError("profile is not an object");
    }
    UserProfile profile;
    profile.displayName = require_string(j, "displayName");
    profile.status = require_string(j, "status");
    profile.createdAt = require_date(j, "createdAt", dates);
    if (has(j, "avatarData")) {
        profile.avatarData = require_bytes(j, "avatarData");
    }
    return profile;
}

json thread_to_json(const ChatThread& thread) {
    json messages = json::array();
    for (const auto& m : thread.messages) {
        messages.push_back(message_to_json(m));
    }
    return json{
        {"id", thread.id},
        {"peerID", thread.peerID},
        {"title", thread.title},
        {"messages", std::move(messages)}
    };
}

ChatThread thread_from_json(const json& j) {
    if (!j.is_object()) {
        throw DecodeError("thread is not an object");
    }
    ChatThread thread;
    thread.id = require_uuid(j, "id");
    thread.peerID = require_string(j, "peerID");
    thread.title = require_string(j, "title");
    const json& messages = require(j, "messages");
    if (!messages.is_array()) {
        throw DecodeError("\"messages\" is not an array");
    }
    for (const auto& m : messages) {
        thread.messages.push_back(message_from_json(m));
    }
    return thread;
}

} // namespace peerlink
