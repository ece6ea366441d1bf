#ifndef PEERLINK_CODEC_UTILS_H
#define PEERLINK_CODEC_UTILS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {

using Bytes = std::vector<uint8_t>;

// Wall-clock time at millisecond resolution, the precision carried on the wire.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp now_timestamp();

// Seconds between 1970-01-01 and 2001-01-01, the epoch of legacy peers.
constexpr int64_t kReferenceDateUnixSeconds = 978307200;

// "2026-10-18T09:41:07.250Z"
std::string format_iso8601(Timestamp ts);
// Accepts an optional fractional part and a "Z" or "+hh:mm"/"-hh:mm" suffix.
std::optional<Timestamp> parse_iso8601(const std::string& text);

double to_reference_seconds(Timestamp ts);
Timestamp from_reference_seconds(double seconds);

// Random (version 4) UUID in upper-case canonical form.
std::string generate_uuid();
bool is_uuid(const std::string& value);

// Standard base64 alphabet with padding.
std::string base64_encode(const Bytes& data);
std::optional<Bytes> base64_decode(const std::string& text);

} // namespace peerlink

#endif // PEERLINK_CODEC_UTILS_H
