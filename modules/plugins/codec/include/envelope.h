#ifndef PEERLINK_ENVELOPE_H
#define PEERLINK_ENVELOPE_H

#include "chat_models.h"

#include <variant>

namespace peerlink {

// Asks the receiving peer to reply with its profile.
struct ProfileRequest {
    bool operator==(const ProfileRequest&) const { return true; }
};

using EnvelopePayload = std::variant<ChatMessage, UserProfile, ProfileRequest>;

enum class EnvelopeKind {
    CHAT,
    PROFILE,
    PROFILE_REQUEST
};

// What goes over the wire between two peers. `timestamp` is the envelope's
// creation time and is unrelated to timestamps inside the payload.
struct Envelope {
    EnvelopePayload payload;
    Timestamp timestamp;

    static Envelope chat(const ChatMessage& message) { return Envelope{message, now_timestamp()}; }
    static Envelope profile(const UserProfile& profile) { return Envelope{profile, now_timestamp()}; }
    static Envelope profileRequest() { return Envelope{ProfileRequest{}, now_timestamp()}; }

    EnvelopeKind kind() const { return static_cast<EnvelopeKind>(payload.index()); }

    bool operator==(const Envelope& other) const {
        return payload == other.payload && timestamp == other.timestamp;
    }
    bool operator!=(const Envelope& other) const { return !(*this == other); }
};

const char* envelope_kind_to_string(EnvelopeKind kind);

} // namespace peerlink

#endif // PEERLINK_ENVELOPE_H
