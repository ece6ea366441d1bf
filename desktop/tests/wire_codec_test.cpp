#include "wire_codec.h"

#include <iostream>
#include <string>
#include <vector>

using namespace peerlink;

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

bool test_frame_layout() {
    std::cout << "Testing frame layout..." << std::endl;

    const std::string frame = wire::encode_frame(wire::FrameType::DATA, "abc");
    TEST_ASSERT(frame.size() == wire::kHeaderSize + 3, "Header plus payload expected");
    TEST_ASSERT(static_cast<uint8_t>(frame[0]) == 0x10, "Type byte first");
    TEST_ASSERT(frame[1] == 0 && frame[2] == 0 && frame[3] == 0 && frame[4] == 3, "Big-endian length");
    TEST_ASSERT(frame.substr(5) == "abc", "Payload follows the header");

    wire::FrameType type;
    std::string_view payload;
    size_t consumed = 0;
    TEST_ASSERT(wire::decode_frame(frame + "trailing", type, payload, consumed), "Frame must decode");
    TEST_ASSERT(type == wire::FrameType::DATA, "Type must match");
    TEST_ASSERT(payload == "abc", "Payload must match");
    TEST_ASSERT(consumed == frame.size(), "Only the frame is consumed");

    const std::string bye = wire::encode_frame(wire::FrameType::BYE, "");
    TEST_ASSERT(wire::decode_frame(bye, type, payload, consumed) && payload.empty(), "Empty payload allowed");

    std::cout << "Frame layout Passed!" << std::endl;
    return true;
}

bool test_decode_rejects() {
    std::cout << "Testing rejected frames..." << std::endl;

    wire::FrameType type;
    std::string_view payload;
    size_t consumed = 0;

    TEST_ASSERT(!wire::decode_frame(std::string("\x10\x00\x00", 3), type, payload, consumed), "Short header");

    const std::string partial = wire::encode_frame(wire::FrameType::HELLO, "hello").substr(0, 7);
    TEST_ASSERT(!wire::decode_frame(partial, type, payload, consumed), "Incomplete payload");

    std::string unknown = wire::encode_frame(wire::FrameType::DATA, "x");
    unknown[0] = 0x7E;
    TEST_ASSERT(!wire::decode_frame(unknown, type, payload, consumed), "Unknown type");

    const std::string huge("\x10\x7F\xFF\xFF\xFF", 5);
    TEST_ASSERT(!wire::decode_frame(huge, type, payload, consumed), "Oversized length");

    std::cout << "Rejected frames Passed!" << std::endl;
    return true;
}

bool test_reader_reassembles_chunks() {
    std::cout << "Testing stream reassembly..." << std::endl;

    const std::string stream = wire::encode_frame(wire::FrameType::HELLO, R"({"id":"A","name":"Alice"})") +
                               wire::encode_frame(wire::FrameType::DATA, std::string(1000, 'x')) +
                               wire::encode_frame(wire::FrameType::BYE, "");

    wire::FrameReader reader;
    std::vector<wire::Frame> frames;
    // One byte at a time.
    for (char c : stream) {
        TEST_ASSERT(reader.feed(&c, 1, frames), "Valid stream must not fail");
    }
    TEST_ASSERT(frames.size() == 3, "Three frames expected, got " << frames.size());
    TEST_ASSERT(frames[0].type == wire::FrameType::HELLO, "First frame is HELLO");
    TEST_ASSERT(frames[1].payload.size() == 1000, "DATA payload must be complete");
    TEST_ASSERT(frames[2].type == wire::FrameType::BYE, "Last frame is BYE");
    TEST_ASSERT(reader.buffered() == 0, "Nothing may stay buffered");

    // Everything at once.
    wire::FrameReader bulk;
    std::vector<wire::Frame> all;
    TEST_ASSERT(bulk.feed(stream.data(), stream.size(), all) && all.size() == 3, "Bulk feed must yield three frames");

    std::cout << "Stream reassembly Passed!" << std::endl;
    return true;
}

bool test_reader_fails_on_corruption() {
    std::cout << "Testing corrupt streams..." << std::endl;

    wire::FrameReader reader;
    std::vector<wire::Frame> frames;
    const std::string good = wire::encode_frame(wire::FrameType::DATA, "ok");
    TEST_ASSERT(reader.feed(good.data(), good.size(), frames), "Good frame accepted");

    const std::string garbage("\x55garbage", 8);
    TEST_ASSERT(!reader.feed(garbage.data(), garbage.size(), frames), "Garbage must fail the reader");
    TEST_ASSERT(reader.failed(), "Reader must stay failed");
    TEST_ASSERT(!reader.feed(good.data(), good.size(), frames), "A failed reader accepts nothing");
    TEST_ASSERT(frames.size() == 1, "Only the good frame was produced");

    std::cout << "Corrupt streams Passed!" << std::endl;
    return true;
}

int main() {
    std::cout << "Running WireCodec Tests..." << std::endl;

    test_frame_layout();
    test_decode_rejects();
    test_reader_reassembles_chunks();
    test_reader_fails_on_corruption();

    if (tests_failed == 0) {
        std::cout << "ALL WIRE CODEC TESTS PASSED" << std::endl;
        return 0;
    } else {
        std::cerr << tests_failed << " TESTS FAILED" << std::endl;
        return 1;
    }
}
