#pragma once

#include <string>
#include <vector>
#include <span>
#include <cstdint>

namespace slipconv {

// Base58 is a utility class for Base58 encoding and decoding.
//
// Base58 is the binary-to-text encoding used for Bitcoin addresses and extended
// keys. Its 58-character alphabet leaves out the easily confused 0, O, I and l.
// Checksums are not handled here, see KeyCodec.
class Base58 {
public:
    // Decodes a Base58-encoded string into bytes
    static std::vector<uint8_t> decode(const std::string& encoded);

    // Encodes bytes as a Base58 string
    static std::string encode(std::span<const uint8_t> data);

    // True when every character of s belongs to the Base58 alphabet
    static bool is_base58(const std::string& s);

private:
    Base58() = delete;
};

} // namespace slipconv
