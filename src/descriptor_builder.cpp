#include "descriptor_builder.hpp"
#include "consts.hpp"
#include "error.hpp"

namespace slipconv {

// Single signature templates:
//   P2PKH        pkh(KEY/b/*)
//   P2SH-P2WPKH  sh(wpkh(KEY/b/*))
//   P2WPKH       wpkh(KEY/b/*)
// Multisig templates, with multi replaced by sortedmulti for KeyOrdering::Sorted:
//   P2SH         sh(multi(m,K1/b/*,...,Kn/b/*))
//   P2SH-P2WSH   sh(wsh(multi(m,...)))
//   P2WSH        wsh(multi(m,...))
DescriptorPair DescriptorBuilder::build(const std::string& key, const ScriptKind& kind,
                                        const std::vector<std::string>& cosigners,
                                        KeyOrdering ordering) {
    std::vector<std::string> keys{key};

    if (kind.is_multisig()) {
        // Re-validates m and n for kinds built without ScriptKind::multisig
        ScriptKind::multisig(kind.type, kind.threshold, kind.signers);

        size_t expected = kind.signers - 1;
        if (cosigners.size() < expected) {
            throw ConvertError(ConvertError::ErrorType::MissingCosignerKey,
                std::to_string(kind.threshold) + "-of-" + std::to_string(kind.signers) +
                " multisig needs " + std::to_string(expected) + " cosigner keys, got " +
                std::to_string(cosigners.size()));
        }
        if (cosigners.size() > expected) {
            throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
                "Too many cosigner keys for " + std::to_string(kind.threshold) + "-of-" +
                std::to_string(kind.signers) + " multisig: " + std::to_string(cosigners.size()));
        }
        keys.insert(keys.end(), cosigners.begin(), cosigners.end());
    }

    return DescriptorPair{
        build_branch(keys, kind, ordering, RECEIVE_SUFFIX),
        build_branch(keys, kind, ordering, CHANGE_SUFFIX)
    };
}

std::string DescriptorBuilder::build_branch(const std::vector<std::string>& keys, const ScriptKind& kind,
                                            KeyOrdering ordering, const std::string& suffix) {
    const std::string& key = keys.front();

    switch (kind.type) {
        case ScriptType::P2pkh:
            return "pkh(" + key + suffix + ")";
        case ScriptType::P2shP2wpkh:
            return "sh(wpkh(" + key + suffix + "))";
        case ScriptType::P2wpkh:
            return "wpkh(" + key + suffix + ")";
        case ScriptType::P2shMultisig:
        case ScriptType::P2shP2wshMultisig:
        case ScriptType::P2wshMultisig:
            break;
    }

    std::string multi = ordering == KeyOrdering::Sorted ? "sortedmulti(" : "multi(";
    multi += std::to_string(kind.threshold);
    for (const auto& k : keys) {
        multi += "," + k + suffix;
    }
    multi += ")";

    switch (kind.type) {
        case ScriptType::P2shMultisig:
            return "sh(" + multi + ")";
        case ScriptType::P2shP2wshMultisig:
            return "sh(wsh(" + multi + "))";
        default:
            return "wsh(" + multi + ")";
    }
}

} // namespace slipconv
