// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultManager.h
 * @brief Encrypted TOTP secret vault management with ChaCha20-Poly1305
 *
 * This file contains the VaultManager class which creates, unlocks, edits
 * and re-keys vault files, and computes TOTP codes for their entries.
 */

#ifndef TOTPVAULT_VAULT_MANAGER_H
#define TOTPVAULT_VAULT_MANAGER_H

#include "VaultConfig.h"
#include "VaultError.h"
#include "VaultHandle.h"
#include "SecretEntry.h"
#include "totp/TotpGenerator.h"
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TotpVault {

/**
 * @brief Manages encrypted vaults of TOTP shared secrets
 *
 * VaultManager itself holds only configuration. All per-vault state lives
 * in the VaultHandle returned by unlock_vault(), which the caller owns.
 *
 * @section features Features
 * - Argon2id key derivation with parameters stored in the file
 * - ChaCha20-Poly1305 authenticated encryption, header bound as associated data
 * - Fresh random nonce on every write
 * - Atomic file replacement (temp file, fsync, rename, directory fsync)
 * - Secrets and keys held in zeroizing buffers
 *
 * @section consistency Consistency
 * Every mutation is applied to a copy of the entries, written to disk,
 * and only then swapped into the handle. A failed write leaves both the
 * file and the handle at the last committed state.
 *
 * @section errors Errors
 * A wrong password and a tampered file are indistinguishable and both
 * produce VaultError::WrongPasswordOrCorrupt. Operations on a locked
 * handle return VaultError::VaultNotOpen.
 *
 * @section threading Thread Safety
 * Not thread-safe. Use one thread per handle; there is no inter-process
 * locking, so concurrent writers from different processes race and the
 * last rename wins.
 *
 * @section usage Usage Example
 * @code
 * VaultManager manager;
 *
 * if (auto created = manager.create_vault("/path/to/codes.vault", password.view()); !created) {
 *     std::cerr << to_string(created.error()) << '\n';
 * }
 *
 * auto handle = manager.unlock_vault("/path/to/codes.vault", password.view());
 * if (!handle) {
 *     return;
 * }
 *
 * auto added = manager.add_entry(*handle, "github", "JBSWY3DPEHPK3PXP", true);
 * auto code = manager.show_code(*handle, "github");
 * manager.lock_vault(*handle);
 * @endcode
 */
class VaultManager {
public:
    /**
     * @param config KDF defaults for create_vault() and rotate_password(),
     *               clamped to approved ranges
     */
    explicit VaultManager(const VaultConfig& config = {});

    [[nodiscard]] const VaultConfig& config() const noexcept { return config_; }

    // Vault lifecycle

    /**
     * @brief Create a new, empty vault
     * @param path Location of the new vault file
     * @param password Master password (any content, including empty)
     * @return Success, or:
     *         - VaultError::AlreadyExists if anything occupies @p path
     *         - VaultError::KeyDerivationFailed / CryptoError on crypto failure
     *         - VaultError::FileWriteFailed / FilePermissionDenied on I/O failure
     *
     * @note File permissions set to 0600 (owner read/write only)
     * @note Does not unlock; call unlock_vault() afterwards
     */
    [[nodiscard]] VaultResult<> create_vault(const std::filesystem::path& path,
                                             std::string_view password);

    /**
     * @brief Open and decrypt an existing vault
     * @return Unlocked handle, or:
     *         - VaultError::FileNotFound / FilePermissionDenied / FileReadFailed
     *         - VaultError::CorruptedFile / UnsupportedVersion (header unusable)
     *         - VaultError::WrongPasswordOrCorrupt (authentication failed)
     *         - VaultError::InvalidProtobuf (authentic but unreadable payload)
     *
     * Key derivation uses the parameters stored in the file, not config().
     */
    [[nodiscard]] VaultResult<VaultHandle> unlock_vault(const std::filesystem::path& path,
                                                        std::string_view password);

    /**
     * @brief Wipe the handle's key and entries
     *
     * Safe to call on an already locked handle.
     */
    void lock_vault(VaultHandle& handle) noexcept;

    /**
     * @brief Change the master password
     *
     * A new salt is generated with the current config(), the entries are
     * re-encrypted under a fresh nonce and the file is replaced atomically.
     * The handle switches to the new key only once the replacement has
     * committed; if anything fails, the old password keeps working.
     *
     * @return Success, or:
     *         - VaultError::VaultNotOpen
     *         - VaultError::WrongPasswordOrCorrupt if @p old_password does not
     *           derive the handle's current key
     *         - any key derivation, crypto or write error
     */
    [[nodiscard]] VaultResult<> rotate_password(VaultHandle& handle,
                                                std::string_view old_password,
                                                std::string_view new_password);

    // Entry management

    /**
     * @brief Add a new entry and persist the vault
     *
     * @param handle Unlocked vault
     * @param name Unique entry name
     * @param secret_input Base32 text if @p encoded, raw secret bytes otherwise
     * @param encoded Whether to Base32-decode @p secret_input (RFC 4648,
     *                case-insensitive, spaces and '=' padding ignored)
     * @param algorithm HMAC digest
     * @param digits Code length, 6 to 10
     * @param period Time step in seconds
     * @param t0 Unix time at which step 0 begins
     * @return Success, or:
     *         - VaultError::VaultNotOpen
     *         - VaultError::InvalidEntry (bad Base32 or field out of range)
     *         - VaultError::DuplicateName
     *         - any write error (the entry is then not added)
     */
    [[nodiscard]] VaultResult<> add_entry(VaultHandle& handle,
                                          std::string_view name,
                                          std::string_view secret_input,
                                          bool encoded,
                                          DigestAlgorithm algorithm = DigestAlgorithm::SHA1,
                                          uint32_t digits = DEFAULT_DIGITS,
                                          uint32_t period = DEFAULT_PERIOD,
                                          uint64_t t0 = 0);

    /**
     * @brief Remove an entry and persist the vault
     * @return Success, or VaultError::VaultNotOpen / NotFound / write error
     */
    [[nodiscard]] VaultResult<> remove_entry(VaultHandle& handle, std::string_view name);

    /**
     * @brief Entry names in lexicographic order
     *
     * Empty for a locked handle.
     */
    [[nodiscard]] std::vector<std::string> list_entries(const VaultHandle& handle) const;

    // Code generation

    /**
     * @brief TOTP code for @p name at Unix time @p now
     * @return Code and seconds until it changes, or VaultError::VaultNotOpen / NotFound
     */
    [[nodiscard]] VaultResult<TotpCode> current_code(const VaultHandle& handle,
                                                     std::string_view name,
                                                     int64_t now) const;

    /**
     * @brief TOTP code for @p name at the current system time
     */
    [[nodiscard]] VaultResult<TotpCode> show_code(const VaultHandle& handle,
                                                  std::string_view name) const;

private:
    [[nodiscard]] static VaultResult<> persist(const std::filesystem::path& path,
                                               std::span<const uint8_t> key,
                                               const KdfParameters& kdf,
                                               VaultContents& contents);

    [[nodiscard]] VaultResult<KdfParameters> fresh_parameters() const;

    VaultConfig config_;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULT_MANAGER_H
