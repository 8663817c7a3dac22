#pragma once

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>

namespace relay::byte_utils {

inline std::string format_bytes(std::int64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};

    if (bytes < 0)
        return "?";

    int unit_index = 0;
    std::uint64_t scale = 1ULL;
    std::uint64_t value = static_cast<std::uint64_t>(bytes);
    while (unit_index < 5 && value >= scale * 1024ULL) {
        scale *= 1024ULL;
        ++unit_index;
    }

    double in_unit = static_cast<double>(value) / static_cast<double>(scale);

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(in_unit < 10.0 ? 2 : (in_unit < 100.0 ? 1 : 0));
    }

    oss << in_unit << ' ' << units[unit_index];
    return oss.str();
}

// Decodes standard base64, skipping whitespace. Returns nullopt on any other invalid character.
inline std::optional<std::string> base64_decode(const std::string& input) {
    auto value_of = [](unsigned char c) -> int {
        if (c >= 'A' && c <= 'Z')
            return c - 'A';
        if (c >= 'a' && c <= 'z')
            return c - 'a' + 26;
        if (c >= '0' && c <= '9')
            return c - '0' + 52;
        if (c == '+')
            return 62;
        if (c == '/')
            return 63;
        return -1;
    };

    std::string out;
    out.reserve(input.size() * 3 / 4);
    std::uint32_t accumulator = 0;
    int bits = 0;
    bool padding = false;
    for (unsigned char c : input) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
            continue;
        if (c == '=') {
            padding = true;
            continue;
        }
        int v = value_of(c);
        if (v < 0 || padding)
            return std::nullopt;
        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((accumulator >> bits) & 0xFF));
        }
    }
    return out;
}

} // namespace relay::byte_utils
