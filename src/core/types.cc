#include "types.hh"
#include <ctime>

namespace qx {

// ============================================================================
// Time Formatting
// ============================================================================

std::string format_utc(system_time_t t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf{};
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf, n);
}

// ============================================================================
// Append Helpers
// ============================================================================

void append_u32(bytes_t& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(bytes_t& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_string(bytes_t& out, std::string_view str) {
    append_u32(out, static_cast<std::uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<bytes_t> hex_to_bytes(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    bytes_t result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

}  // namespace qx
