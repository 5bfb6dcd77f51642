// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyDerivation.h
 * @brief Password-based derivation of the vault encryption key
 *
 * Responsibilities:
 * - Derive the 256-bit vault key from a password with Argon2id
 * - Validate KDF parameters read from untrusted container headers
 * - Generate fresh parameters (new salt) for create and rotate
 *
 * NOT responsible for:
 * - Encryption (see VaultCrypto)
 * - Storing parameters (see VaultFormat)
 *
 * Security Properties:
 * - RFC 9106 Argon2id, version 0x13
 * - Memory-hard, GPU/ASIC resistant
 * - Every parameter is persisted with the container, so raising the
 *   defaults later never locks out an existing vault
 */

#pragma once

#include "../VaultError.h"
#include "../VaultConfig.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace TotpVault {

/**
 * @brief Key derivation algorithm identifier stored in the container
 */
enum class KdfAlgorithm : uint8_t {
    ARGON2ID = 0x05
};

/**
 * @brief Everything needed to re-derive a vault key, minus the password
 */
struct KdfParameters {
    KdfAlgorithm algorithm = KdfAlgorithm::ARGON2ID;
    std::vector<uint8_t> salt;      ///< Unique per container, regenerated on password change
    uint32_t time_cost = 0;         ///< Argon2 passes
    uint32_t memory_kb = 0;         ///< Argon2 memory in KiB
    uint32_t parallelism = 0;       ///< Argon2 lanes

    bool operator==(const KdfParameters&) const = default;
};

/**
 * @class KeyDerivation
 * @brief Stateless Argon2id key derivation
 *
 * @code
 * auto params = KeyDerivation::generate_parameters(config);
 * auto key = KeyDerivation::derive_key(password.view(), params);
 * if (!key) {
 *     return std::unexpected(key.error());
 * }
 * // key->data() is 32 bytes, wiped when *key is destroyed
 * @endcode
 */
class KeyDerivation {
public:
    static constexpr size_t KEY_LENGTH = 32;

    /// Hard limits for parameters read back from disk
    static constexpr size_t MIN_SALT_LENGTH = 16;
    static constexpr size_t MAX_SALT_LENGTH = 64;
    static constexpr uint32_t MAX_TIME_COST = 64;
    static constexpr uint32_t MAX_MEMORY_KB = 4u * 1024 * 1024;  // 4 GiB
    static constexpr uint32_t MAX_PARALLELISM = 64;

    /**
     * @brief Derive a 256-bit key
     *
     * Deterministic: the same password and parameters always give the same
     * key. The password content is never validated.
     *
     * @param password Password bytes (UTF-8 by convention)
     * @param params Algorithm, salt and cost parameters
     * @return Key in secure memory, or VaultError::KeyDerivationFailed
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> derive_key(
        std::string_view password,
        const KdfParameters& params) noexcept;

    /**
     * @brief Check parameters without running the KDF
     * @return true if derive_key() would accept them
     */
    [[nodiscard]] static bool validate(const KdfParameters& params) noexcept;

    /**
     * @brief New parameters with a random salt, costs taken from @p config
     *
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] static KdfParameters generate_parameters(const VaultConfig& config);

    [[nodiscard]] static constexpr std::string_view algorithm_to_string(KdfAlgorithm algorithm) noexcept {
        switch (algorithm) {
            case KdfAlgorithm::ARGON2ID: return "Argon2id";
        }
        return "Unknown";
    }

    KeyDerivation() = delete;
    ~KeyDerivation() = delete;
    KeyDerivation(const KeyDerivation&) = delete;
    KeyDerivation& operator=(const KeyDerivation&) = delete;
    KeyDerivation(KeyDerivation&&) = delete;
    KeyDerivation& operator=(KeyDerivation&&) = delete;

private:
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> derive_argon2id(
        std::string_view password,
        std::span<const uint8_t> salt,
        uint32_t time_cost,
        uint32_t memory_kb,
        uint32_t parallelism) noexcept;
};

} // namespace TotpVault
