#ifndef PEERLINK_CHAT_JSON_H
#define PEERLINK_CHAT_JSON_H

#include "chat_models.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace peerlink {

// Raised by the *_from_json helpers when a document does not have the
// expected shape. EnvelopeCodec::decode turns it into a reason string.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Envelopes and the chat store write ISO-8601 strings; bare messages from
// older peers carry seconds since 2001-01-01 as a number.
enum class DateEncoding {
    ISO8601,
    REFERENCE_SECONDS
};

// Optional fields are omitted when absent.
nlohmann::json message_to_json(const ChatMessage& message, DateEncoding dates = DateEncoding::ISO8601);
ChatMessage message_from_json(const nlohmann::json& j, DateEncoding dates = DateEncoding::ISO8601);

nlohmann::json profile_to_json(const UserProfile& profile, DateEncoding dates = DateEncoding::ISO8601);
UserProfile profile_from_json(const nlohmann::json& j, DateEncoding dates = DateEncoding::ISO8601);

nlohmann::json thread_to_json(const ChatThread& thread);
ChatThread thread_from_json(const nlohmann::json& j);

} // namespace peerlink

#endif // PEERLINK_CHAT_JSON_H
