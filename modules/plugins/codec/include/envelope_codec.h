#ifndef PEERLINK_ENVELOPE_CODEC_H
#define PEERLINK_ENVELOPE_CODEC_H

#include "envelope.h"

#include <optional>
#include <string>

namespace peerlink {

/**
 * @brief JSON encoding of Envelope.
 *
 *   {"type": "chat" | "profile" | "profile_request",
 *    "chatMessage": {...}, "profile": {...}, "timestamp": "<ISO-8601>"}
 *
 * Only the sub-object matching "type" is written. Binary fields are base64.
 */
class EnvelopeCodec {
public:
    struct DecodeResult {
        std::optional<Envelope> envelope;
        bool legacy = false;  // decoded through the bare-message fallback
        std::string error;    // reason when envelope is empty
    };

    static std::string encode(const Envelope& envelope);

    // Never throws. Tries the envelope format first, then a bare ChatMessage
    // as written by older peers (dates in seconds since 2001-01-01).
    static DecodeResult decode(const std::string& data);

    // Legacy wire shape, kept for interoperability tests.
    static std::string encodeLegacyMessage(const ChatMessage& message);
};

} // namespace peerlink

#endif // PEERLINK_ENVELOPE_CODEC_H
