// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng
//
// VaultError.h - Error types for vault and TOTP operations
// C++23 std::expected-based error handling

#ifndef TOTPVAULT_VAULT_ERROR_H
#define TOTPVAULT_VAULT_ERROR_H

#include <expected>
#include <string_view>

namespace TotpVault {

enum class VaultError {
    // File operations
    FileNotFound,
    FilePermissionDenied,
    FileReadFailed,
    FileWriteFailed,
    AlreadyExists,

    // Vault state
    VaultNotOpen,

    // Container format
    CorruptedFile,
    UnsupportedVersion,
    InvalidProtobuf,
    SerializationFailed,

    // Cryptography
    KeyDerivationFailed,
    EncryptionFailed,
    IntegrityCheckFailed,
    WrongPasswordOrCorrupt,
    CryptoError,

    // Entries
    InvalidEntry,
    DuplicateName,
    NotFound
};

inline constexpr std::string_view to_string(VaultError error) noexcept {
    switch (error) {
        case VaultError::FileNotFound:
            return "File not found";
        case VaultError::FilePermissionDenied:
            return "Permission denied";
        case VaultError::FileReadFailed:
            return "Failed to read file";
        case VaultError::FileWriteFailed:
            return "Failed to write file";
        case VaultError::AlreadyExists:
            return "A vault already exists at this path";
        case VaultError::VaultNotOpen:
            return "Vault is locked";
        case VaultError::CorruptedFile:
            return "Vault file is not a valid container";
        case VaultError::UnsupportedVersion:
            return "Unsupported vault format version";
        case VaultError::InvalidProtobuf:
            return "Vault contents could not be parsed";
        case VaultError::SerializationFailed:
            return "Failed to serialize vault contents";
        case VaultError::KeyDerivationFailed:
            return "Invalid key derivation parameters";
        case VaultError::EncryptionFailed:
            return "Encryption failed";
        case VaultError::IntegrityCheckFailed:
            return "Authentication tag mismatch";
        case VaultError::WrongPasswordOrCorrupt:
            // Same text for a wrong password and a tampered file
            return "Could not open vault";
        case VaultError::CryptoError:
            return "Cryptographic operation failed";
        case VaultError::InvalidEntry:
            return "Invalid entry";
        case VaultError::DuplicateName:
            return "An entry with this name already exists";
        case VaultError::NotFound:
            return "Entry not found";
    }
    return "Unknown error";
}

/// True for errors raised while parsing container or payload structure
[[nodiscard]] inline constexpr bool is_format_error(VaultError error) noexcept {
    return error == VaultError::CorruptedFile ||
           error == VaultError::UnsupportedVersion ||
           error == VaultError::InvalidProtobuf;
}

/// True for filesystem failures
[[nodiscard]] inline constexpr bool is_io_error(VaultError error) noexcept {
    return error == VaultError::FileNotFound ||
           error == VaultError::FilePermissionDenied ||
           error == VaultError::FileReadFailed ||
           error == VaultError::FileWriteFailed;
}

template<typename T = void>
using VaultResult = std::expected<T, VaultError>;

} // namespace TotpVault

#endif // TOTPVAULT_VAULT_ERROR_H
