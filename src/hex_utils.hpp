#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>
#include <stdexcept>

namespace slipconv {

// Hex helpers for version bytes in messages and for test vectors
class HexUtils {
public:
    // Throws std::invalid_argument on odd length or a non-hex character
    static std::vector<uint8_t> decode(const std::string& hex) {
        if (hex.size() % 2 != 0) {
            throw std::invalid_argument("Odd hex string length " + std::to_string(hex.size()));
        }

        std::vector<uint8_t> bytes(hex.size() / 2);
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(nibble(hex[2 * i]) << 4 | nibble(hex[2 * i + 1]));
        }
        return bytes;
    }

    // Lowercase, two characters per byte
    static std::string encode(std::span<const uint8_t> data) {
        static const char digits[] = "0123456789abcdef";

        std::string result;
        result.reserve(data.size() * 2);
        for (uint8_t byte : data) {
            result += digits[byte >> 4];
            result += digits[byte & 0x0f];
        }
        return result;
    }

private:
    static uint8_t nibble(char c) {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument(std::string("Invalid hex character '") + c + "'");
    }
};

} // namespace slipconv
