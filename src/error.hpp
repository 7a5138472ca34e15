#pragma once

#include <stdexcept>
#include <string>

namespace slipconv {

class ConvertError : public std::runtime_error {
public:
    enum class ErrorType {
        InvalidBase58,
        InvalidChecksum,
        InvalidLength,
        UnknownVersionByte,
        NoCanonicalVersion,
        InvalidKeyMaterial,
        UnsupportedDescriptorGrammar,
        MalformedDescriptor,
        UnsupportedWalletType,
        InvalidWalletFile,
        MissingCosignerKey,
        InvalidMultisigParameters,
        IoError
    };

    ConvertError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? "Conversion error" : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

private:
    ErrorType type_;
};

// Name of an error kind as printed by the command line tool
inline const char* error_type_name(ConvertError::ErrorType type) {
    using ErrorType = ConvertError::ErrorType;
    switch (type) {
        case ErrorType::InvalidBase58: return "InvalidBase58";
        case ErrorType::InvalidChecksum: return "InvalidChecksum";
        case ErrorType::InvalidLength: return "InvalidLength";
        case ErrorType::UnknownVersionByte: return "UnknownVersionByte";
        case ErrorType::NoCanonicalVersion: return "NoCanonicalVersion";
        case ErrorType::InvalidKeyMaterial: return "InvalidKeyMaterial";
        case ErrorType::UnsupportedDescriptorGrammar: return "UnsupportedDescriptorGrammar";
        case ErrorType::MalformedDescriptor: return "MalformedDescriptor";
        case ErrorType::UnsupportedWalletType: return "UnsupportedWalletType";
        case ErrorType::InvalidWalletFile: return "InvalidWalletFile";
        case ErrorType::MissingCosignerKey: return "MissingCosignerKey";
        case ErrorType::InvalidMultisigParameters: return "InvalidMultisigParameters";
        case ErrorType::IoError: return "IoError";
    }
    return "Unknown";
}

} // namespace slipconv
