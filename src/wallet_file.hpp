#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "extended_key.hpp"
#include "script_kind.hpp"

namespace slipconv {

// Keys and script kind held by an Electrum wallet file
struct WalletContents {
    ExtendedKey key;                       // first keystore (keystore or x1/)
    ScriptKind kind;
    std::vector<ExtendedKey> cosigners;    // x2/ .. xn/ in index order
};

// WalletFileAdapter maps the decoded JSON of an Electrum wallet file to and
// from keys plus script kind.
//
// Layout:
//   wallet_type  "standard" or "<m>of<n>"
//   keystore     {type, xpub, xprv} for standard wallets
//   x1/ .. xn/   one keystore per cosigner for multisig wallets
//   txin_type    optional explicit script type (p2pkh, p2wpkh-p2sh, ...)
//   addresses    {receiving, change}, kept for Electrum but not interpreted
class WalletFileAdapter {
public:
    // Throws ConvertError(UnsupportedWalletType | InvalidWalletFile | MissingCosignerKey)
    static WalletContents parse(const nlohmann::json& fields);

    // Keystores are written with the Electrum version for kind, xpub is
    // derived from xprv for private keys.
    static nlohmann::json build(const ExtendedKey& key, const ScriptKind& kind,
                                const std::vector<ExtendedKey>& cosigners = {});

    // Throws ConvertError(IoError) if the file cannot be read, InvalidWalletFile
    // if it is not JSON
    static nlohmann::json load_from_file(const std::string& path);

    static void save_to_file(const std::string& path, const nlohmann::json& fields);

private:
    static ExtendedKey parse_keystore(const nlohmann::json& keystore, const std::string& field,
                                      std::optional<ScriptType>& script_type);
    static nlohmann::json build_keystore(const ExtendedKey& key, ScriptType type);
};

} // namespace slipconv
