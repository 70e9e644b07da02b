/**
 * @file hex.cpp
 * @brief Hex codec implementation.
 */

#include "core/hex.hpp"

namespace cluster_exec::hex {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

constexpr int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string encode(const Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0F]);
    }
    return out;
}

Result<Bytes> decode(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Error{ErrorCode::Unknown, "Odd-length hex string"};
    }

    Bytes out;
    out.reserve(text.size() / 2);
    for (size_t i = 0; i < text.size(); i += 2) {
        int hi = digit_value(text[i]);
        int lo = digit_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::Unknown, "Invalid hex digit at offset " + std::to_string(i)};
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

}  // namespace cluster_exec::hex
