// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SecretEntry.h
 * @brief One authenticator account: name, shared secret and TOTP parameters
 */

#ifndef TOTPVAULT_SECRET_ENTRY_H
#define TOTPVAULT_SECRET_ENTRY_H

#include "VaultError.h"
#include "../utils/SecureMemory.h"
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace TotpVault {

inline constexpr size_t MAX_ENTRY_NAME_LENGTH = 256;   ///< Maximum entry name length (bytes)
inline constexpr uint32_t MIN_DIGITS = 6;
inline constexpr uint32_t MAX_DIGITS = 10;
inline constexpr uint32_t DEFAULT_DIGITS = 6;
inline constexpr uint32_t DEFAULT_PERIOD = 30;
inline constexpr uint64_t MAX_T0 = static_cast<uint64_t>(INT64_MAX);  ///< Largest t0 comparable with Unix time

/**
 * @brief HMAC digest used for code generation (RFC 6238 section 1.2)
 */
enum class DigestAlgorithm : uint8_t {
    SHA1 = 0,     ///< RFC 4226 default, the only one most authenticator apps support
    SHA256 = 1,
    SHA512 = 2
};

[[nodiscard]] inline constexpr std::string_view to_string(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:   return "SHA-1";
        case DigestAlgorithm::SHA256: return "SHA-256";
        case DigestAlgorithm::SHA512: return "SHA-512";
    }
    return "Unknown";
}

/**
 * @brief Validated, immutable TOTP account
 *
 * Only create() builds one, so every SecretEntry in memory satisfies:
 * non-empty name of at most MAX_ENTRY_NAME_LENGTH bytes, non-empty secret,
 * digits in [MIN_DIGITS, MAX_DIGITS], period > 0, t0 <= MAX_T0.
 *
 * The secret lives in a SecureVector and is wiped when the entry goes away.
 */
class SecretEntry {
public:
    /**
     * @brief Validate fields and build an entry
     *
     * @param name Unique account name within the vault
     * @param secret Raw shared-secret bytes (already Base32-decoded)
     * @param algorithm HMAC digest
     * @param digits Code length
     * @param period Time step in seconds
     * @param t0 Unix time at which step 0 begins
     * @return Entry, or VaultError::InvalidEntry
     */
    [[nodiscard]] static VaultResult<SecretEntry> create(
        std::string_view name,
        std::span<const uint8_t> secret,
        DigestAlgorithm algorithm = DigestAlgorithm::SHA1,
        uint32_t digits = DEFAULT_DIGITS,
        uint32_t period = DEFAULT_PERIOD,
        uint64_t t0 = 0);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::span<const uint8_t> secret() const noexcept { return secret_; }
    [[nodiscard]] DigestAlgorithm algorithm() const noexcept { return algorithm_; }
    [[nodiscard]] uint32_t digits() const noexcept { return digits_; }
    [[nodiscard]] uint32_t period() const noexcept { return period_; }
    [[nodiscard]] uint64_t t0() const noexcept { return t0_; }

    bool operator==(const SecretEntry& other) const;

private:
    SecretEntry() = default;

    std::string name_;
    SecureVector<uint8_t> secret_;
    DigestAlgorithm algorithm_ = DigestAlgorithm::SHA1;
    uint32_t digits_ = DEFAULT_DIGITS;
    uint32_t period_ = DEFAULT_PERIOD;
    uint64_t t0_ = 0;
};

/// Decrypted vault contents keyed by entry name (iterates in lexicographic order)
using EntryMap = std::map<std::string, SecretEntry, std::less<>>;

} // namespace TotpVault

#endif // TOTPVAULT_SECRET_ENTRY_H
