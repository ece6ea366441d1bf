#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace peerlink {
namespace wire {

enum class FrameType : uint8_t {
    HELLO = 0x01,         // payload: JSON {"id","name"} of the inviting side
    HELLO_ACK = 0x02,     // payload: JSON {"id","name"} of the accepting side
    HELLO_REJECT = 0x03,  // payload: reason text
    DATA = 0x10,          // payload: opaque application bytes
    BYE = 0x1F,           // payload: empty
};

const char* frame_type_to_string(FrameType type);

// Maximum allowed frame payload (16 MB). Larger frames are treated as corruption.
inline constexpr uint32_t kMaxFrameSize = 16u * 1024u * 1024u;
inline constexpr size_t kHeaderSize = 5;

// [type: 1 byte][length: 4 bytes big-endian][payload: length bytes]
std::string encode_frame(FrameType type, std::string_view payload);

// Decodes exactly one frame at the start of `data`. Returns false if the
// header is malformed, the type is unknown, the length is over the limit or
// the frame is incomplete. `consumed` receives the full frame length on success.
bool decode_frame(std::string_view data, FrameType& type, std::string_view& payload, size_t& consumed);

struct Frame {
    FrameType type;
    std::string payload;
};

// Reassembles frames from a byte stream delivered in arbitrary chunks.
class FrameReader {
public:
    // Appends bytes and moves every complete frame into `out`.
    // Returns false once the stream is corrupt; the reader stays failed.
    bool feed(const char* data, size_t len, std::vector<Frame>& out);

    bool failed() const { return m_failed; }
    size_t buffered() const { return m_buffer.size(); }

private:
    std::string m_buffer;
    bool m_failed = false;
};

} // namespace wire
} // namespace peerlink
