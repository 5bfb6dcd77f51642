// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2024 Travis E. Hansen

#ifndef TOTPVAULT_VAULT_CRYPTO_H
#define TOTPVAULT_VAULT_CRYPTO_H

#include "../VaultError.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>
#include <vector>

namespace TotpVault {

/**
 * @brief Authenticated encryption for vault contents
 *
 * - ChaCha20-Poly1305 AEAD (RFC 8439) through OpenSSL EVP
 * - 256-bit key, 96-bit nonce, 128-bit tag
 * - Optional associated data authenticated but not encrypted
 * - Cryptographically secure random generation
 *
 * This class is stateless. All methods are static.
 *
 * @section usage Usage Example
 * @code
 * auto nonce = VaultCrypto::generate_nonce();
 * auto sealed = VaultCrypto::seal(key, nonce, plaintext, header);
 * if (!sealed) {
 *     // Handle error
 * }
 *
 * auto opened = VaultCrypto::open(key, nonce, *sealed, header);
 * if (!opened) {
 *     // Wrong key or tampered data: VaultError::IntegrityCheckFailed
 * }
 * @endcode
 */
class VaultCrypto {
public:
    static constexpr size_t KEY_LENGTH = 32;        ///< ChaCha20 key length (256 bits)
    static constexpr size_t NONCE_LENGTH = 12;      ///< IETF ChaCha20-Poly1305 nonce (96 bits)
    static constexpr size_t TAG_LENGTH = 16;        ///< Poly1305 tag length (128 bits)

    /**
     * @brief Encrypt and authenticate
     *
     * @param key Encryption key (must be KEY_LENGTH bytes)
     * @param nonce Must be NONCE_LENGTH bytes and never reused with @p key
     * @param plaintext Data to encrypt (may be empty)
     * @param associated_data Authenticated, not encrypted (may be empty)
     * @return ciphertext || tag, or VaultError::EncryptionFailed
     *
     * @warning Reusing a nonce under the same key breaks confidentiality.
     */
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /**
     * @brief Verify and decrypt
     *
     * The tag is checked by OpenSSL in constant time, so a wrong key and a
     * modified ciphertext fail the same way.
     *
     * @param key Decryption key (must be KEY_LENGTH bytes)
     * @param nonce Nonce used by seal()
     * @param ciphertext ciphertext || tag
     * @param associated_data Same bytes passed to seal()
     * @return Plaintext in secure memory, or VaultError::IntegrityCheckFailed
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> associated_data = {});

    /**
     * @brief Generate cryptographically secure random bytes
     *
     * @note Uses OpenSSL RAND_bytes()
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::vector<uint8_t> generate_random_bytes(size_t length);

    /**
     * @brief Fresh random 96-bit nonce for one seal() call
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::vector<uint8_t> generate_nonce() {
        return generate_random_bytes(NONCE_LENGTH);
    }

    VaultCrypto() = delete;
    ~VaultCrypto() = delete;
    VaultCrypto(const VaultCrypto&) = delete;
    VaultCrypto& operator=(const VaultCrypto&) = delete;
    VaultCrypto(VaultCrypto&&) = delete;
    VaultCrypto& operator=(VaultCrypto&&) = delete;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULT_CRYPTO_H
