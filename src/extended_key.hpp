#pragma once

#include <array>
#include <cstdint>
#include "consts.hpp"

namespace slipconv {

// 4-byte version prefix of a serialized extended key
using VersionBytes = std::array<uint8_t, VERSION_SIZE>;

// Serialized extended key without version and checksum
using KeyBody = std::array<uint8_t, KEY_BODY_SIZE>;

enum class Network {
    Mainnet,
    Testnet   // also used by signet and regtest
};

enum class KeyKind {
    Public,
    Private
};

// Extended key structure used in BIP32 hierarchical deterministic wallets
struct ExtendedKey {
    Network network;
    KeyKind kind;
    uint8_t depth;                                        // Depth in the derivation path (0 for master keys)
    std::array<uint8_t, FINGERPRINT_SIZE> finger_print;   // First 4 bytes of the parent key's identifier
    std::array<uint8_t, CHILD_NUMBER_SIZE> child_number;  // Index of the key in relation to its parent
    std::array<uint8_t, CHAINCODE_SIZE> chaincode;        // Extra entropy used in child key derivation
    std::array<uint8_t, KEY_MATERIAL_SIZE> key;           // Compressed public key, or 0x00 || private scalar

    bool is_private() const { return kind == KeyKind::Private; }

    bool operator==(const ExtendedKey&) const = default;
};

} // namespace slipconv
