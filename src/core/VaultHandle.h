// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultHandle.h
 * @brief Unlocked-vault session state owned by the caller
 */

#ifndef TOTPVAULT_VAULT_HANDLE_H
#define TOTPVAULT_VAULT_HANDLE_H

#include "crypto/KeyDerivation.h"
#include "serialization/VaultSerialization.h"
#include "../utils/SecureMemory.h"
#include <cstdint>
#include <filesystem>

namespace TotpVault {

class VaultManager;

/**
 * @brief One open vault: its path, derived key, KDF parameters and entries
 *
 * Only VaultManager::unlock_vault() produces an unlocked handle. The handle
 * is move-only; a moved-from handle is locked. lock() and the destructor
 * wipe the key and every secret, after which all VaultManager operations
 * on the handle fail with VaultError::VaultNotOpen.
 *
 * Several handles (for different vault files) may be alive at once.
 */
class VaultHandle {
public:
    VaultHandle() = default;
    ~VaultHandle();

    VaultHandle(const VaultHandle&) = delete;
    VaultHandle& operator=(const VaultHandle&) = delete;
    VaultHandle(VaultHandle&& other) noexcept;
    VaultHandle& operator=(VaultHandle&& other) noexcept;

    [[nodiscard]] bool is_unlocked() const noexcept { return unlocked_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] size_t entry_count() const noexcept { return contents_.entries.size(); }

    /// Decrypted entries; empty once locked
    [[nodiscard]] const EntryMap& entries() const noexcept { return contents_.entries; }

    /// Unix time recorded when the vault was created
    [[nodiscard]] int64_t created_at() const noexcept { return contents_.created_at; }

    /// Unix time of the last write committed through this handle or before unlock
    [[nodiscard]] int64_t last_modified() const noexcept { return contents_.last_modified; }

    /// Wipe key and entries. Idempotent.
    void lock() noexcept;

private:
    friend class VaultManager;

    VaultHandle(std::filesystem::path path,
                SecureVector<uint8_t> key,
                KdfParameters kdf,
                VaultContents contents);

    void take(VaultHandle& other) noexcept;

    std::filesystem::path path_;
    SecureVector<uint8_t> key_;
    KdfParameters kdf_;
    VaultContents contents_;
    bool unlocked_ = false;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULT_HANDLE_H
