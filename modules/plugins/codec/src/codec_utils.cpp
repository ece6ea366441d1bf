#include "codec_utils.h"
#include "logger.h"

#include <sodium.h>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>

namespace peerlink {

namespace {

void ensure_sodium() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) {
            nativeLog("Libsodium initialization failed!");
            throw std::runtime_error("Libsodium init failed");
        }
    });
}

} // namespace

Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::string format_iso8601(Timestamp ts) {
    const int64_t total_ms = ts.time_since_epoch().count();
    int64_t secs = total_ms / 1000;
    int64_t ms = total_ms % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }

    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm_utc.tm_year + 1900,
                  tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                  static_cast<int>(ms));
    return buf;
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6 ||
        consumed != 19) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    int64_t ms = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            // Digits past milliseconds are dropped.
            if (digits < 3) ms = ms * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) ms *= 10;
    }

    int64_t offset_sec = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2 || text.size() != pos + 6) {
            return std::nullopt;
        }
        offset_sec = (oh * 3600 + om * 60) * (text[pos] == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    const int64_t secs = static_cast<int64_t>(timegm(&tm_utc)) - offset_sec;
    return Timestamp(std::chrono::milliseconds(secs * 1000 + ms));
}

double to_reference_seconds(Timestamp ts) {
    return static_cast<double>(ts.time_since_epoch().count()) / 1000.0 -
           static_cast<double>(kReferenceDateUnixSeconds);
}

Timestamp from_reference_seconds(double seconds) {
    const double unix_ms = (seconds + static_cast<double>(kReferenceDateUnixSeconds)) * 1000.0;
    return Timestamp(std::chrono::milliseconds(static_cast<int64_t>(std::llround(unix_ms))));
}

std::string generate_uuid() {
    ensure_sodium();
    unsigned char raw[16];
    randombytes_buf(raw, sizeof(raw));
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);  // version 4
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);  // RFC 4122 variant

    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < sizeof(raw); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[raw[i] >> 4]);
        out.push_back(kHex[raw[i] & 0x0F]);
    }
    return out;
}

bool is_uuid(const std::string& value) {
    if (value.size() != 36) return false;
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (value[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

std::string base64_encode(const Bytes& data) {
    ensure_sodium();
    const size_t encoded_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], out.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1);  // drop the terminating NUL
    return out;
}

std::optional<Bytes> base64_decode(const std::string& text) {
    ensure_sodium();
    Bytes out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(), nullptr, &bin_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0) {
        return std::nullopt;
    }
    out.resize(bin_len);
    return out;
}

} // namespace peerlink
