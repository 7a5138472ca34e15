#include "base58.hpp"
#include "error.hpp"
#include <algorithm>

namespace slipconv {

namespace {

const std::string BASE58_CHARS =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

} // namespace

// Decodes a Base58-encoded string into bytes.
//
// The decoding process:
// 1. Converts each Base58 character to its corresponding value
// 2. Builds the result by multiplying existing value by 58 and adding new digits
// 3. Restores leading '1' characters as leading zero bytes
//
// Throws:
//   ConvertError(InvalidBase58) if a character is outside the alphabet
std::vector<uint8_t> Base58::decode(const std::string& base58_string) {
    std::vector<uint8_t> result;
    for (char c : base58_string) {
        auto digit = BASE58_CHARS.find(c);
        if (digit == std::string::npos) {
            throw ConvertError(ConvertError::ErrorType::InvalidBase58,
                std::string("Invalid base58 character '") + c + "'");
        }

        // Multiply existing result by 58 and add new digit
        size_t carry = digit;
        for (auto it = result.rbegin(); it != result.rend(); ++it) {
            carry += static_cast<size_t>(*it) * 58;
            *it = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }

        while (carry > 0) {
            result.insert(result.begin(), static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    // Leading '1' characters stand for leading 0x00 bytes
    auto zeros = std::find_if(base58_string.begin(), base58_string.end(),
        [](char c) { return c != '1'; }) - base58_string.begin();
    result.insert(result.begin(), static_cast<size_t>(zeros), 0);
    return result;
}

// Encodes bytes as Base58 by repeated division of the big-endian number by 58.
// Leading zero bytes map to leading '1' characters.
std::string Base58::encode(std::span<const uint8_t> data) {
    auto zeros = std::find_if(data.begin(), data.end(),
        [](uint8_t b) { return b != 0; }) - data.begin();

    // Base58 digits, most significant first
    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (auto it = data.begin() + zeros; it != data.end(); ++it) {
        size_t carry = *it;
        for (auto d = digits.rbegin(); d != digits.rend(); ++d) {
            carry += static_cast<size_t>(*d) << 8;
            *d = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.insert(digits.begin(), static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(static_cast<size_t>(zeros), '1');
    result.reserve(result.size() + digits.size());
    for (uint8_t d : digits) {
        result.push_back(BASE58_CHARS[d]);
    }
    return result;
}

bool Base58::is_base58(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](char c) { return BASE58_CHARS.find(c) != std::string::npos; });
}

} // namespace slipconv
