#pragma once

#include <stdexcept>
#include <string>

namespace hdwif {

class DeriveError : public std::runtime_error {
public:
    enum class ErrorType {
        Base58DecodeError,
        ChecksumMismatch,
        InvalidKeyFormat,
        InvalidPathSegment,
        IndexOverflow,
        MissingCodec,
        DerivationError
    };

    DeriveError(ErrorType type, const std::string& message = "")
        : std::runtime_error(message.empty() ? default_message(type) : message)
        , type_(type)
    {}

    ErrorType type() const { return type_; }

    // Malformed base58, checksum mismatch or wrong payload length
    bool is_decode_error() const {
        return type_ == ErrorType::Base58DecodeError ||
               type_ == ErrorType::ChecksumMismatch ||
               type_ == ErrorType::InvalidKeyFormat;
    }

    // Non-numeric segment or index out of range
    bool is_path_error() const {
        return type_ == ErrorType::InvalidPathSegment ||
               type_ == ErrorType::IndexOverflow;
    }

private:
    static std::string default_message(ErrorType type) {
        switch (type) {
            case ErrorType::Base58DecodeError: return "Invalid base58 string";
            case ErrorType::ChecksumMismatch: return "Base58check checksum mismatch";
            case ErrorType::InvalidKeyFormat: return "Invalid extended key length";
            case ErrorType::InvalidPathSegment: return "Invalid derivation path segment";
            case ErrorType::IndexOverflow: return "Derivation index out of range";
            case ErrorType::MissingCodec: return "No base58 codec configured";
            case ErrorType::DerivationError: return "Key derivation failed";
        }
        return "Derivation error";
    }

    ErrorType type_;
};

class DecodeError : public DeriveError {
public:
    explicit DecodeError(ErrorType type = ErrorType::Base58DecodeError, const std::string& message = "")
        : DeriveError(type, message)
    {}
};

class PathError : public DeriveError {
public:
    explicit PathError(ErrorType type = ErrorType::InvalidPathSegment, const std::string& message = "")
        : DeriveError(type, message)
    {}
};

} // namespace hdwif
