#include "wire_codec.h"

namespace peerlink {
namespace wire {

namespace {
bool is_valid_frame_type(uint8_t raw) {
    switch (static_cast<FrameType>(raw)) {
        case FrameType::HELLO:
        case FrameType::HELLO_ACK:
        case FrameType::HELLO_REJECT:
        case FrameType::DATA:
        case FrameType::BYE:
            return true;
    }
    return false;
}

uint32_t read_be32(std::string_view data, size_t offset) {
    return (static_cast<uint32_t>(static_cast<uint8_t>(data[offset])) << 24) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 2])) << 8) |
           static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 3]));
}
} // namespace

const char* frame_type_to_string(FrameType type) {
    switch (type) {
        case FrameType::HELLO: return "HELLO";
        case FrameType::HELLO_ACK: return "HELLO_ACK";
        case FrameType::HELLO_REJECT: return "HELLO_REJECT";
        case FrameType::DATA: return "DATA";
        case FrameType::BYE: return "BYE";
    }
    return "UNKNOWN";
}

std::string encode_frame(FrameType type, std::string_view payload) {
    const uint32_t length = static_cast<uint32_t>(payload.size());

    std::string encoded;
    encoded.reserve(kHeaderSize + length);
    encoded.push_back(static_cast<char>(type));
    encoded.push_back(static_cast<char>((length >> 24) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 16) & 0xFF));
    encoded.push_back(static_cast<char>((length >> 8) & 0xFF));
    encoded.push_back(static_cast<char>(length & 0xFF));
    encoded.append(payload.data(), payload.size());
    return encoded;
}

bool decode_frame(std::string_view data, FrameType& type, std::string_view& payload, size_t& consumed) {
    if (data.size() < kHeaderSize) {
        return false;
    }

    const uint8_t raw_type = static_cast<uint8_t>(data[0]);
    if (!is_valid_frame_type(raw_type)) {
        return false;
    }

    const uint32_t length = read_be32(data, 1);
    if (length > kMaxFrameSize) {
        return false;
    }
    if (data.size() < kHeaderSize + static_cast<size_t>(length)) {
        return false;
    }

    type = static_cast<FrameType>(raw_type);
    payload = data.substr(kHeaderSize, length);
    consumed = kHeaderSize + length;
    return true;
}

bool FrameReader::feed(const char* data, size_t len, std::vector<Frame>& out) {
    if (m_failed) {
        return false;
    }
    m_buffer.append(data, len);

    size_t offset = 0;
    while (m_buffer.size() - offset >= kHeaderSize) {
        std::string_view view(m_buffer.data() + offset, m_buffer.size() - offset);
        const uint8_t raw_type = static_cast<uint8_t>(view[0]);
        const uint32_t length = read_be32(view, 1);
        if (!is_valid_frame_type(raw_type) || length > kMaxFrameSize) {
            m_failed = true;
            m_buffer.clear();
            return false;
        }
        if (view.size() < kHeaderSize + static_cast<size_t>(length)) {
            break;  // wait for the rest of the frame
        }
        out.push_back(Frame{static_cast<FrameType>(raw_type), std::string(view.substr(kHeaderSize, length))});
        offset += kHeaderSize + length;
    }

    m_buffer.erase(0, offset);
    return true;
}

} // namespace wire
} // namespace peerlink
