#pragma once
#include <string>
#include <string_view>
namespace arisen::vault {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class VaultFailureType {
    Generic,
    InvalidInput,
    MissingIdentity,
    Encode,
    Decode,
    KeyMismatch,
    Export,
    Serialization
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};
class VaultFailure {
public:
    VaultFailureType type;
    std::string message;
    VaultFailure(const VaultFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static VaultFailure Generic(std::string msg) {
        return {VaultFailureType::Generic, std::move(msg)};
    }
    static VaultFailure InvalidInput(std::string msg) {
        return {VaultFailureType::InvalidInput, std::move(msg)};
    }
    static VaultFailure MissingIdentity(std::string msg) {
        return {VaultFailureType::MissingIdentity, std::move(msg)};
    }
    static VaultFailure Encode(std::string msg) {
        return {VaultFailureType::Encode, std::move(msg)};
    }
    static VaultFailure Decode(std::string msg) {
        return {VaultFailureType::Decode, std::move(msg)};
    }
    static VaultFailure KeyMismatch(std::string msg) {
        return {VaultFailureType::KeyMismatch, std::move(msg)};
    }
    static VaultFailure Export(std::string msg) {
        return {VaultFailureType::Export, std::move(msg)};
    }
    static VaultFailure Serialization(std::string msg) {
        return {VaultFailureType::Serialization, std::move(msg)};
    }
    static VaultFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
};
inline const char* ToString(const VaultFailureType type) {
    switch (type) {
        case VaultFailureType::Generic:
            return "Generic";
        case VaultFailureType::InvalidInput:
            return "InvalidInput";
        case VaultFailureType::MissingIdentity:
            return "MissingIdentity";
        case VaultFailureType::Encode:
            return "Encode";
        case VaultFailureType::Decode:
            return "Decode";
        case VaultFailureType::KeyMismatch:
            return "KeyMismatch";
        case VaultFailureType::Export:
            return "Export";
        case VaultFailureType::Serialization:
            return "Serialization";
        default:
            return "Unknown";
    }
}
}
