#include "converter.hpp"
#include "descriptor_parser.hpp"
#include "key_codec.hpp"
#include "key_deserializer.hpp"
#include "version_table.hpp"
#include "wallet_file.hpp"
#include "error.hpp"

namespace slipconv {

using json = nlohmann::json;

DescriptorPair Converter::key_to_descriptors(const std::string& key,
                                             const std::vector<std::string>& cosigners,
                                             unsigned threshold,
                                             KeyOrdering ordering) {
    auto decoded = KeyCodec::decode(key);
    auto entry = VersionByteTable::lookup(decoded.version);
    auto subject = KeyDeserializer::deserialize(decoded.body, entry.network, entry.key_kind);

    ScriptType type = entry.script_type.value_or(
        cosigners.empty() ? ScriptType::P2pkh : ScriptType::P2shMultisig);

    // Descriptors carry the script in their wrapping functions, never in the key prefix
    std::string canonical = KeyCodec::encode(VersionByteTable::canonicalize(decoded.version), decoded.body);

    if (!is_multisig(type)) {
        if (!cosigners.empty()) {
            throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
                std::string("A ") + script_type_name(type) + " key takes no cosigner keys");
        }
        return DescriptorBuilder::build(canonical, ScriptKind::single(type));
    }

    if (cosigners.empty()) {
        throw ConvertError(ConvertError::ErrorType::MissingCosignerKey,
            std::string("A ") + script_type_name(type) +
            " multisig key needs its cosigner keys and threshold; convert the wallet file instead");
    }

    std::vector<std::string> canonical_cosigners;
    for (const auto& cosigner : cosigners) {
        auto cosigner_type = VersionByteTable::lookup(KeyCodec::decode(cosigner).version).script_type;
        if (cosigner_type && *cosigner_type != type) {
            throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
                std::string("Cosigner key prefix is for ") + script_type_name(*cosigner_type) +
                ", not " + script_type_name(type));
        }
        auto cosigner_key = KeyCodec::decode_key(cosigner);
        if (cosigner_key.network != subject.network) {
            throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
                "Cosigner key belongs to a different network");
        }
        canonical_cosigners.push_back(canonical_key(cosigner_key));
    }

    auto kind = ScriptKind::multisig(type, threshold, static_cast<unsigned>(cosigners.size() + 1));
    return DescriptorBuilder::build(canonical, kind, canonical_cosigners, ordering);
}

DescriptorPair Converter::wallet_to_descriptors(const json& fields, KeyOrdering ordering) {
    auto contents = WalletFileAdapter::parse(fields);

    std::vector<std::string> cosigners;
    cosigners.reserve(contents.cosigners.size());
    for (const auto& cosigner : contents.cosigners) {
        cosigners.push_back(canonical_key(cosigner));
    }
    return DescriptorBuilder::build(canonical_key(contents.key), contents.kind, cosigners, ordering);
}

json Converter::descriptor_to_wallet(const std::string& descriptor) {
    auto parsed = DescriptorParser::parse(descriptor);

    // Electrum derives both branches from the account key, so the key must be
    // given with one of them
    if (parsed.branch == Branch::Unspecified) {
        throw ConvertError(ConvertError::ErrorType::MalformedDescriptor,
            "Descriptor keys need a /0/* or /1/* suffix to describe a wallet");
    }
    if (parsed.kind.is_multisig() && parsed.ordering != KeyOrdering::Sorted) {
        throw ConvertError(ConvertError::ErrorType::UnsupportedDescriptorGrammar,
            "Electrum multisig wallets sort cosigner keys; use sortedmulti() instead of multi()");
    }

    auto keys = decode_descriptor_keys(parsed.keys);
    std::vector<ExtendedKey> cosigners(keys.begin() + 1, keys.end());
    return WalletFileAdapter::build(keys.front(), parsed.kind, cosigners);
}

std::string Converter::descriptor_to_key(const std::string& descriptor) {
    auto parsed = DescriptorParser::parse(descriptor);
    if (parsed.kind.is_multisig()) {
        throw ConvertError(ConvertError::ErrorType::UnsupportedDescriptorGrammar,
            "A multisig descriptor does not map to a single SLIP-0132 key");
    }

    auto key = decode_descriptor_keys(parsed.keys).front();
    auto version = VersionByteTable::reverse_lookup(key.network, parsed.kind.type, key.kind);
    return KeyCodec::encode_key(version, key);
}

std::string Converter::canonical_key(const ExtendedKey& key) {
    return KeyCodec::encode_key(VersionByteTable::generic_version(key.network, key.kind), key);
}

// Keys embedded in descriptors must be plain BIP32 keys of a single network
std::vector<ExtendedKey> Converter::decode_descriptor_keys(const std::vector<std::string>& keys) {
    std::vector<ExtendedKey> result;
    result.reserve(keys.size());
    for (const auto& encoded : keys) {
        auto decoded = KeyCodec::decode(encoded);
        auto entry = VersionByteTable::lookup(decoded.version);
        if (entry.script_type) {
            throw ConvertError(ConvertError::ErrorType::MalformedDescriptor,
                "Descriptor key " + encoded + " carries a SLIP-0132 prefix");
        }
        result.push_back(KeyDeserializer::deserialize(decoded.body, entry.network, entry.key_kind));
        if (result.back().network != result.front().network) {
            throw ConvertError(ConvertError::ErrorType::MalformedDescriptor,
                "Descriptor mixes keys of different networks");
        }
    }
    return result;
}

} // namespace slipconv
