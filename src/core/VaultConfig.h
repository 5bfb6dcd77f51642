// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef TOTPVAULT_VAULT_CONFIG_H
#define TOTPVAULT_VAULT_CONFIG_H

#include "../utils/SettingsValidator.h"
#include <cstdint>

namespace TotpVault {

/**
 * @brief Defaults used when a new salt and key are generated
 *
 * Applies to create_vault() and rotate_password(). Unlocking always uses
 * the parameters stored in the container, so changing these never makes
 * an existing vault unreadable.
 *
 * @code
 * VaultConfig config;
 * config.argon2_memory_kb = 262144;  // 256 MB
 * VaultManager manager{config};
 * @endcode
 */
struct VaultConfig {
    uint32_t salt_length = SettingsValidator::DEFAULT_SALT_LENGTH;
    uint32_t argon2_time_cost = SettingsValidator::DEFAULT_ARGON2_TIME_COST;
    uint32_t argon2_memory_kb = SettingsValidator::DEFAULT_ARGON2_MEMORY_KB;
    uint32_t argon2_parallelism = SettingsValidator::DEFAULT_ARGON2_PARALLELISM;

    /// Copy with every field clamped into its approved range
    [[nodiscard]] constexpr VaultConfig validated() const noexcept {
        VaultConfig out;
        out.salt_length = SettingsValidator::clamp_salt_length(salt_length);
        out.argon2_time_cost = SettingsValidator::clamp_time_cost(argon2_time_cost);
        out.argon2_memory_kb = SettingsValidator::clamp_memory_kb(argon2_memory_kb);
        out.argon2_parallelism = SettingsValidator::clamp_parallelism(argon2_parallelism);
        return out;
    }
};

} // namespace TotpVault

#endif // TOTPVAULT_VAULT_CONFIG_H
