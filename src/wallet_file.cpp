#include "wallet_file.hpp"
#include "bip32_util.hpp"
#include "key_codec.hpp"
#include "version_table.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <optional>

namespace slipconv {

using json = nlohmann::json;

namespace {

constexpr auto DEFAULT_KEYSTORE_TYPE = "bip32";

[[noreturn]] void invalid(const std::string& message) {
    throw ConvertError(ConvertError::ErrorType::InvalidWalletFile, message);
}

bool all_digits(const std::string& s) {
    return !s.empty() && s.size() <= 3 &&
        std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Index of a multisig keystore field "x<i>/", empty for any other field
std::optional<unsigned> keystore_index(const std::string& field) {
    if (field.size() < 3 || field.front() != 'x' || field.back() != '/') {
        return std::nullopt;
    }
    std::string digits = field.substr(1, field.size() - 2);
    if (!all_digits(digits)) {
        return std::nullopt;
    }
    return static_cast<unsigned>(std::stoul(digits));
}

// Electrum writes plain xpub/xprv headers for p2pkh and p2sh, SLIP-0132
// headers for everything else
VersionBytes electrum_version(Network network, ScriptType type, KeyKind kind) {
    if (type == ScriptType::P2pkh || type == ScriptType::P2shMultisig) {
        return VersionByteTable::generic_version(network, kind);
    }
    return VersionByteTable::reverse_lookup(network, type, kind);
}

// Script type implied by a key prefix in a wallet of the given shape
ScriptType implied_script_type(const std::optional<ScriptType>& prefix_type, bool multisig) {
    if (!prefix_type) {
        return multisig ? ScriptType::P2shMultisig : ScriptType::P2pkh;
    }
    if (is_multisig(*prefix_type) != multisig) {
        invalid(std::string("Key prefix for ") + script_type_name(*prefix_type) +
            (multisig ? " cannot be used in a multisig wallet" : " needs a multisig wallet"));
    }
    return *prefix_type;
}

} // namespace

WalletContents WalletFileAdapter::parse(const json& fields) {
    if (!fields.is_object()) {
        invalid("Wallet file must be a JSON object");
    }

    // wallet_type: "standard" (default) or "<m>of<n>"
    std::string wallet_type = "standard";
    if (fields.contains("wallet_type")) {
        if (!fields["wallet_type"].is_string()) {
            invalid("wallet_type must be a string");
        }
        wallet_type = fields["wallet_type"].get<std::string>();
    }

    bool multisig = false;
    unsigned threshold = 0;
    unsigned signers = 1;
    if (wallet_type != "standard") {
        auto of = wallet_type.find("of");
        std::string m = wallet_type.substr(0, of);
        std::string n = of == std::string::npos ? "" : wallet_type.substr(of + 2);
        if (!all_digits(m) || !all_digits(n)) {
            throw ConvertError(ConvertError::ErrorType::UnsupportedWalletType,
                "Unsupported wallet type: " + wallet_type);
        }
        multisig = true;
        threshold = static_cast<unsigned>(std::stoul(m));
        signers = static_cast<unsigned>(std::stoul(n));
        if (threshold == 0 || threshold > signers || signers > MAX_MULTISIG_KEYS) {
            invalid("Invalid multisig wallet type " + wallet_type);
        }
    }

    std::optional<ScriptType> txin_type;
    if (fields.contains("txin_type")) {
        if (!fields["txin_type"].is_string()) {
            invalid("txin_type must be a string");
        }
        auto name = fields["txin_type"].get<std::string>();
        txin_type = script_type_from_name(name);
        if (!txin_type) {
            throw ConvertError(ConvertError::ErrorType::UnsupportedWalletType,
                "Unsupported script type: " + name);
        }
        if (is_multisig(*txin_type) != multisig) {
            invalid("Script type " + name + " does not match wallet type " + wallet_type);
        }
    }

    // Keystore fields in cosigner order
    std::vector<std::string> keystore_fields;
    if (!multisig) {
        if (!fields.contains("keystore")) {
            invalid("Wallet file has no keystore");
        }
        keystore_fields.push_back("keystore");
    } else {
        // Keystores are exactly x1/ .. xn/
        std::map<unsigned, std::string> indexed;
        for (const auto& [name, value] : fields.items()) {
            auto index = keystore_index(name);
            if (!index) {
                continue;
            }
            if (*index == 0 || *index > signers || name != "x" + std::to_string(*index) + "/") {
                invalid("Keystore " + name + " is not one of x1/ .. x" + std::to_string(signers) +
                    "/ of a " + wallet_type + " wallet");
            }
            indexed.emplace(*index, name);
        }
        for (unsigned index = 1; index <= signers; ++index) {
            if (!indexed.contains(index)) {
                throw ConvertError(ConvertError::ErrorType::MissingCosignerKey,
                    wallet_type + " wallet has no keystore x" + std::to_string(index) + "/");
            }
            keystore_fields.push_back(indexed[index]);
        }
    }

    std::vector<ExtendedKey> keys;
    std::optional<ScriptType> wallet_script_type = txin_type;
    for (const auto& name : keystore_fields) {
        std::optional<ScriptType> prefix_type;
        keys.push_back(parse_keystore(fields[name], name, prefix_type));

        // An explicit txin_type wins over plain xpub/tpub headers, SLIP-0132
        // headers must agree with it
        ScriptType key_type = txin_type && !prefix_type ? *txin_type
                                                        : implied_script_type(prefix_type, multisig);
        if (wallet_script_type && *wallet_script_type != key_type) {
            invalid("Keystore " + name + " is for " + script_type_name(key_type) +
                ", wallet is " + script_type_name(*wallet_script_type));
        }
        wallet_script_type = key_type;

        if (keys.back().network != keys.front().network) {
            invalid("Keystore " + name + " belongs to a different network");
        }
    }

    WalletContents contents{
        keys.front(),
        multisig ? ScriptKind::multisig(*wallet_script_type, threshold, signers)
                 : ScriptKind::single(*wallet_script_type),
        std::vector<ExtendedKey>(keys.begin() + 1, keys.end())
    };
    return contents;
}

ExtendedKey WalletFileAdapter::parse_keystore(const json& keystore, const std::string& field,
                                              std::optional<ScriptType>& script_type) {
    if (!keystore.is_object()) {
        invalid("Keystore " + field + " must be an object");
    }

    std::string type = DEFAULT_KEYSTORE_TYPE;
    if (keystore.contains("type")) {
        if (!keystore["type"].is_string()) {
            invalid("Keystore " + field + " type must be a string");
        }
        type = keystore["type"].get<std::string>();
    }
    if (type != "bip32" && type != "hardware") {
        throw ConvertError(ConvertError::ErrorType::UnsupportedWalletType,
            "Keystore " + field + " of type " + type + " has no extended key");
    }

    auto key_string = [&](const char* name) -> std::optional<std::string> {
        if (!keystore.contains(name) || keystore[name].is_null()) {
            return std::nullopt;
        }
        if (!keystore[name].is_string()) {
            invalid("Keystore " + field + " field " + name + " must be a string");
        }
        return keystore[name].get<std::string>();
    };

    auto xpub = key_string("xpub");
    auto xprv = key_string("xprv");
    if (!xpub && !xprv) {
        invalid("Keystore " + field + " has no xpub");
    }

    const std::string& encoded = xprv ? *xprv : *xpub;
    auto version = KeyCodec::decode(encoded).version;
    script_type = VersionByteTable::lookup(version).script_type;
    auto key = KeyCodec::decode_key(encoded);

    if (xprv && !key.is_private()) {
        invalid("Keystore " + field + " xprv holds a public key");
    }
    if (xprv && xpub) {
        auto public_key = KeyCodec::decode_key(*xpub);
        if (public_key.is_private() || public_key != Bip32Util::to_public(key)) {
            invalid("Keystore " + field + " xpub does not belong to its xprv");
        }
        if (VersionByteTable::lookup(KeyCodec::decode(*xpub).version).script_type != script_type) {
            invalid("Keystore " + field + " xpub and xprv prefixes name different script types");
        }
    }
    return key;
}

json WalletFileAdapter::build(const ExtendedKey& key, const ScriptKind& kind,
                              const std::vector<ExtendedKey>& cosigners) {
    json fields = {
        {"addresses", {{"change", json::array()}, {"receiving", json::array()}}}
    };

    if (!kind.is_multisig()) {
        fields["wallet_type"] = "standard";
        fields["keystore"] = build_keystore(key, kind.type);
        return fields;
    }

    auto checked = ScriptKind::multisig(kind.type, kind.threshold, kind.signers);
    if (cosigners.size() + 1 < checked.signers) {
        throw ConvertError(ConvertError::ErrorType::MissingCosignerKey,
            "Multisig wallet needs " + std::to_string(checked.signers) + " keys, got " +
            std::to_string(cosigners.size() + 1));
    }
    if (cosigners.size() + 1 > checked.signers) {
        throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
            "Multisig wallet takes " + std::to_string(checked.signers) + " keys, got " +
            std::to_string(cosigners.size() + 1));
    }

    fields["wallet_type"] = std::to_string(checked.threshold) + "of" + std::to_string(checked.signers);
    fields["x1/"] = build_keystore(key, kind.type);
    for (size_t i = 0; i < cosigners.size(); ++i) {
        fields["x" + std::to_string(i + 2) + "/"] = build_keystore(cosigners[i], kind.type);
    }
    return fields;
}

json WalletFileAdapter::build_keystore(const ExtendedKey& key, ScriptType type) {
    auto public_key = Bip32Util::to_public(key);
    json keystore = {
        {"type", DEFAULT_KEYSTORE_TYPE},
        {"xpub", KeyCodec::encode_key(electrum_version(key.network, type, KeyKind::Public), public_key)},
        {"xprv", nullptr}
    };
    if (key.is_private()) {
        keystore["xprv"] = KeyCodec::encode_key(electrum_version(key.network, type, KeyKind::Private), key);
    }
    return keystore;
}

json WalletFileAdapter::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConvertError(ConvertError::ErrorType::IoError, "Failed to open " + path + " for reading");
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        invalid("Wallet file " + path + " is not JSON (encrypted wallets are not supported): " + e.what());
    }
}

void WalletFileAdapter::save_to_file(const std::string& path, const json& fields) {
    std::ofstream file(path);
    if (!file) {
        throw ConvertError(ConvertError::ErrorType::IoError, "Failed to open " + path + " for writing");
    }
    file << fields.dump(4) << '\n';
    if (!file) {
        throw ConvertError(ConvertError::ErrorType::IoError, "Failed to write " + path);
    }
}

} // namespace slipconv
