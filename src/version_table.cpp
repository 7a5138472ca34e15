#include "version_table.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <map>

namespace slipconv {

namespace {

// Electrum constants.py XPUB_HEADERS / XPRV_HEADERS
const std::map<VersionBytes, VersionEntry> VERSION_TABLE = {
    // mainnet public
    {{0x04, 0x88, 0xb2, 0x1e}, {Network::Mainnet, std::nullopt, KeyKind::Public}},                      // xpub
    {{0x04, 0x9d, 0x7c, 0xb2}, {Network::Mainnet, ScriptType::P2shP2wpkh, KeyKind::Public}},             // ypub
    {{0x02, 0x95, 0xb4, 0x3f}, {Network::Mainnet, ScriptType::P2shP2wshMultisig, KeyKind::Public}},      // Ypub
    {{0x04, 0xb2, 0x47, 0x46}, {Network::Mainnet, ScriptType::P2wpkh, KeyKind::Public}},                 // zpub
    {{0x02, 0xaa, 0x7e, 0xd3}, {Network::Mainnet, ScriptType::P2wshMultisig, KeyKind::Public}},          // Zpub
    // mainnet private
    {{0x04, 0x88, 0xad, 0xe4}, {Network::Mainnet, std::nullopt, KeyKind::Private}},                     // xprv
    {{0x04, 0x9d, 0x78, 0x78}, {Network::Mainnet, ScriptType::P2shP2wpkh, KeyKind::Private}},            // yprv
    {{0x02, 0x95, 0xb0, 0x05}, {Network::Mainnet, ScriptType::P2shP2wshMultisig, KeyKind::Private}},     // Yprv
    {{0x04, 0xb2, 0x43, 0x0c}, {Network::Mainnet, ScriptType::P2wpkh, KeyKind::Private}},                // zprv
    {{0x02, 0xaa, 0x7a, 0x99}, {Network::Mainnet, ScriptType::P2wshMultisig, KeyKind::Private}},         // Zprv
    // testnet public
    {{0x04, 0x35, 0x87, 0xcf}, {Network::Testnet, std::nullopt, KeyKind::Public}},                      // tpub
    {{0x04, 0x4a, 0x52, 0x62}, {Network::Testnet, ScriptType::P2shP2wpkh, KeyKind::Public}},             // upub
    {{0x02, 0x42, 0x89, 0xef}, {Network::Testnet, ScriptType::P2shP2wshMultisig, KeyKind::Public}},      // Upub
    {{0x04, 0x5f, 0x1c, 0xf6}, {Network::Testnet, ScriptType::P2wpkh, KeyKind::Public}},                 // vpub
    {{0x02, 0x57, 0x54, 0x83}, {Network::Testnet, ScriptType::P2wshMultisig, KeyKind::Public}},          // Vpub
    // testnet private
    {{0x04, 0x35, 0x83, 0x94}, {Network::Testnet, std::nullopt, KeyKind::Private}},                     // tprv
    {{0x04, 0x4a, 0x4e, 0x28}, {Network::Testnet, ScriptType::P2shP2wpkh, KeyKind::Private}},            // uprv
    {{0x02, 0x42, 0x85, 0xb5}, {Network::Testnet, ScriptType::P2shP2wshMultisig, KeyKind::Private}},     // Uprv
    {{0x04, 0x5f, 0x18, 0xbc}, {Network::Testnet, ScriptType::P2wpkh, KeyKind::Private}},                // vprv
    {{0x02, 0x57, 0x50, 0x48}, {Network::Testnet, ScriptType::P2wshMultisig, KeyKind::Private}},         // Vprv
};

} // namespace

VersionEntry VersionByteTable::lookup(const VersionBytes& version) {
    auto it = VERSION_TABLE.find(version);
    if (it == VERSION_TABLE.end()) {
        throw ConvertError(ConvertError::ErrorType::UnknownVersionByte,
            "Unknown extended key version 0x" + HexUtils::encode(version));
    }
    return it->second;
}

VersionBytes VersionByteTable::reverse_lookup(Network network, ScriptType type, KeyKind key_kind) {
    for (const auto& [version, entry] : VERSION_TABLE) {
        if (entry.network == network && entry.key_kind == key_kind && entry.script_type == type) {
            return version;
        }
    }
    throw ConvertError(ConvertError::ErrorType::NoCanonicalVersion,
        std::string("No SLIP-0132 version defined for script type ") + script_type_name(type));
}

VersionBytes VersionByteTable::canonicalize(const VersionBytes& version) {
    auto entry = lookup(version);
    return generic_version(entry.network, entry.key_kind);
}

VersionBytes VersionByteTable::generic_version(Network network, KeyKind key_kind) {
    for (const auto& [version, entry] : VERSION_TABLE) {
        if (entry.network == network && entry.key_kind == key_kind && !entry.script_type) {
            return version;
        }
    }
    // Every (network, key kind) pair has a generic entry above
    throw ConvertError(ConvertError::ErrorType::NoCanonicalVersion, "No generic version for key");
}

} // namespace slipconv
