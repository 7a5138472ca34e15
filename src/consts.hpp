#pragma once

#include <cstddef>
#include <cstdint>

namespace slipconv {

    // Serialized extended key layout (BIP32)
    constexpr size_t VERSION_SIZE = 4;
    constexpr size_t KEY_BODY_SIZE = 74;          // depth .. key material
    constexpr size_t SERIALIZED_KEY_SIZE = 78;    // version + body
    constexpr size_t CHECKSUM_SIZE = 4;
    constexpr size_t ENCODED_KEY_SIZE = 82;       // version + body + checksum

    // Offsets inside the 74-byte body
    constexpr size_t DEPTH_OFFSET = 0;
    constexpr size_t FINGERPRINT_OFFSET = 1;
    constexpr size_t CHILD_NUMBER_OFFSET = 5;
    constexpr size_t CHAINCODE_OFFSET = 9;
    constexpr size_t KEY_OFFSET = 41;

    constexpr size_t FINGERPRINT_SIZE = 4;
    constexpr size_t CHILD_NUMBER_SIZE = 4;
    constexpr size_t CHAINCODE_SIZE = 32;
    constexpr size_t KEY_MATERIAL_SIZE = 33;      // compressed pubkey or 0x00 || scalar
    constexpr size_t PRIVATE_SCALAR_SIZE = 32;

    constexpr uint8_t PRIVATE_KEY_PREFIX = 0x00;
    constexpr uint8_t EVEN_PUBKEY_PREFIX = 0x02;
    constexpr uint8_t ODD_PUBKEY_PREFIX = 0x03;

    // Multisig limits of an Electrum wallet
    constexpr unsigned MAX_MULTISIG_KEYS = 255;

    // Derivation branches appended to every descriptor key
    constexpr auto RECEIVE_SUFFIX = "/0/*";
    constexpr auto CHANGE_SUFFIX = "/1/*";

} // namespace slipconv
