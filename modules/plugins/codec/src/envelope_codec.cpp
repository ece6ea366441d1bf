#include "envelope_codec.h"
#include "chat_json.h"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace peerlink {

using json = nlohmann::json;

const char* envelope_kind_to_string(EnvelopeKind kind) {
    switch (kind) {
        case EnvelopeKind::CHAT: return "chat";
        case EnvelopeKind::PROFILE: return "profile";
        case EnvelopeKind::PROFILE_REQUEST: return "profile_request";
    }
    return "unknown";
}

namespace {

Envelope decode_envelope(const json& j) {
    if (!j.is_object()) {
        throw DecodeError("envelope is not an object");
    }
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        throw DecodeError("missing envelope type");
    }
    const std::string type = type_it->get<std::string>();

    auto ts_it = j.find("timestamp");
    if (ts_it == j.end() || !ts_it->is_string()) {
        throw DecodeError("missing envelope timestamp");
    }
    auto ts = parse_iso8601(ts_it->get<std::string>());
    if (!ts) {
        throw DecodeError("bad envelope timestamp");
    }

    if (type == "chat") {
        if (!j.contains("chatMessage")) throw DecodeError("chat envelope without chatMessage");
        return Envelope{message_from_json(j.at("chatMessage")), *ts};
    }
    if (type == "profile") {
        if (!j.contains("profile")) throw DecodeError("profile envelope without profile");
        return Envelope{profile_from_json(j.at("profile")), *ts};
    }
    if (type == "profile_request") {
        return Envelope{ProfileRequest{}, *ts};
    }
    throw DecodeError("unknown envelope type \"" + type + "\"");
}

} // namespace

std::string EnvelopeCodec::encode(const Envelope& envelope) {
    json j;
    j["type"] = envelope_kind_to_string(envelope.kind());
    std::visit([&j](const auto& payload) {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, ChatMessage>) {
            j["chatMessage"] = message_to_json(payload);
        } else if constexpr (std::is_same_v<T, UserProfile>) {
            j["profile"] = profile_to_json(payload);
        }
    }, envelope.payload);
    j["timestamp"] = format_iso8601(envelope.timestamp);
    return j.dump();
}

EnvelopeCodec::DecodeResult EnvelopeCodec::decode(const std::string& data) {
    DecodeResult result;

    json doc;
    try {
        doc = json::parse(data);
    } catch (const json::exception& e) {
        result.error = std::string("not JSON: ") + e.what();
        return result;
    }

    try {
        result.envelope = decode_envelope(doc);
        return result;
    } catch (const DecodeError& e) {
        result.error = e.what();
    } catch (const json::exception& e) {
        result.error = e.what();
    }

    // Older peers send the bare message without a wrapper.
    try {
        ChatMessage legacy = message_from_json(doc, DateEncoding::REFERENCE_SECONDS);
        result.envelope = Envelope{std::move(legacy), now_timestamp()};
        result.legacy = true;
        result.error.clear();
    } catch (const DecodeError& e) {
        result.error += std::string("; legacy: ") + e.what();
    } catch (const json::exception& e) {
        result.error += std::string("; legacy: ") + e.what();
    }
    return result;
}

std::string EnvelopeCodec::encodeLegacyMessage(const ChatMessage& message) {
    return message_to_json(message, DateEncoding::REFERENCE_SECONDS).dump();
}

} // namespace peerlink
