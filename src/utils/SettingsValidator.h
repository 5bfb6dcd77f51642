// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef TOTPVAULT_SETTINGS_VALIDATOR_H
#define TOTPVAULT_SETTINGS_VALIDATOR_H

#include <algorithm>
#include <cstdint>

namespace TotpVault {

/**
 * @brief Clamps key-derivation settings to security-approved ranges
 *
 * Whatever a caller puts into VaultConfig, new containers are never written
 * with a KDF weaker than the minimums below. Existing containers keep the
 * parameters stored in their header; only new salts/keys go through here.
 *
 * @note Static utility class, cannot be instantiated.
 */
class SettingsValidator final {
public:
    static inline constexpr uint32_t MIN_SALT_LENGTH{16};
    static inline constexpr uint32_t MAX_SALT_LENGTH{64};
    static inline constexpr uint32_t DEFAULT_SALT_LENGTH{16};

    static inline constexpr uint32_t MIN_ARGON2_TIME_COST{1};
    static inline constexpr uint32_t MAX_ARGON2_TIME_COST{10};
    static inline constexpr uint32_t DEFAULT_ARGON2_TIME_COST{3};

    static inline constexpr uint32_t MIN_ARGON2_MEMORY_KB{8192};        // 8 MB
    static inline constexpr uint32_t MAX_ARGON2_MEMORY_KB{1048576};     // 1 GB
    static inline constexpr uint32_t DEFAULT_ARGON2_MEMORY_KB{65536};   // 64 MB

    static inline constexpr uint32_t MIN_ARGON2_PARALLELISM{1};
    static inline constexpr uint32_t MAX_ARGON2_PARALLELISM{16};
    static inline constexpr uint32_t DEFAULT_ARGON2_PARALLELISM{4};

    [[nodiscard]] static constexpr uint32_t clamp_salt_length(uint32_t value) noexcept {
        return std::clamp(value, MIN_SALT_LENGTH, MAX_SALT_LENGTH);
    }

    [[nodiscard]] static constexpr uint32_t clamp_time_cost(uint32_t value) noexcept {
        return std::clamp(value, MIN_ARGON2_TIME_COST, MAX_ARGON2_TIME_COST);
    }

    [[nodiscard]] static constexpr uint32_t clamp_memory_kb(uint32_t value) noexcept {
        return std::clamp(value, MIN_ARGON2_MEMORY_KB, MAX_ARGON2_MEMORY_KB);
    }

    [[nodiscard]] static constexpr uint32_t clamp_parallelism(uint32_t value) noexcept {
        return std::clamp(value, MIN_ARGON2_PARALLELISM, MAX_ARGON2_PARALLELISM);
    }

private:
    SettingsValidator() = delete;
    ~SettingsValidator() = delete;
    SettingsValidator(const SettingsValidator&) = delete;
    SettingsValidator& operator=(const SettingsValidator&) = delete;
    SettingsValidator(SettingsValidator&&) = delete;
    SettingsValidator& operator=(SettingsValidator&&) = delete;
};

} // namespace TotpVault

#endif // TOTPVAULT_SETTINGS_VALIDATOR_H
