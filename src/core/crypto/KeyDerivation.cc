// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KeyDerivation.h"
#include "VaultCrypto.h"
#include "../../utils/Log.h"
#include <argon2.h>

namespace TotpVault {

bool KeyDerivation::validate(const KdfParameters& params) noexcept {
    if (params.algorithm != KdfAlgorithm::ARGON2ID) {
        Log::error("KeyDerivation: Unsupported algorithm: {}",
                   static_cast<int>(params.algorithm));
        return false;
    }
    if (params.salt.size() < MIN_SALT_LENGTH || params.salt.size() > MAX_SALT_LENGTH) {
        Log::error("KeyDerivation: Salt length {} outside [{}, {}]",
                   params.salt.size(), MIN_SALT_LENGTH, MAX_SALT_LENGTH);
        return false;
    }
    if (params.time_cost < 1 || params.time_cost > MAX_TIME_COST) {
        Log::error("KeyDerivation: Time cost {} out of range", params.time_cost);
        return false;
    }
    if (params.parallelism < 1 || params.parallelism > MAX_PARALLELISM) {
        Log::error("KeyDerivation: Parallelism {} out of range", params.parallelism);
        return false;
    }
    // Argon2 needs at least 8 KiB per lane
    if (params.memory_kb < 8 * params.parallelism || params.memory_kb > MAX_MEMORY_KB) {
        Log::error("KeyDerivation: Memory cost {} KiB out of range for {} lanes",
                   params.memory_kb, params.parallelism);
        return false;
    }
    return true;
}

VaultResult<SecureVector<uint8_t>>
KeyDerivation::derive_key(std::string_view password, const KdfParameters& params) noexcept {
    if (!validate(params)) {
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    switch (params.algorithm) {
        case KdfAlgorithm::ARGON2ID:
            return derive_argon2id(password, params.salt,
                                   params.time_cost, params.memory_kb, params.parallelism);
    }
    return std::unexpected(VaultError::KeyDerivationFailed);
}

KdfParameters KeyDerivation::generate_parameters(const VaultConfig& config) {
    const VaultConfig safe = config.validated();

    KdfParameters params;
    params.algorithm = KdfAlgorithm::ARGON2ID;
    params.salt = VaultCrypto::generate_random_bytes(safe.salt_length);
    params.time_cost = safe.argon2_time_cost;
    params.memory_kb = safe.argon2_memory_kb;
    params.parallelism = safe.argon2_parallelism;
    return params;
}

VaultResult<SecureVector<uint8_t>>
KeyDerivation::derive_argon2id(
    std::string_view password,
    std::span<const uint8_t> salt,
    uint32_t time_cost,
    uint32_t memory_kb,
    uint32_t parallelism) noexcept {

    SecureVector<uint8_t> key(KEY_LENGTH);

    int result = argon2id_hash_raw(
        time_cost,
        memory_kb,
        parallelism,
        password.data(),
        password.size(),
        salt.data(),
        salt.size(),
        key.data(),
        key.size()
    );

    if (result != ARGON2_OK) {
        Log::error("KeyDerivation: Argon2id derivation failed: {}",
                   argon2_error_message(result));
        return std::unexpected(VaultError::KeyDerivationFailed);
    }

    Log::debug("KeyDerivation: Argon2id key derived ({} KiB memory, {} passes, {} lanes)",
               memory_kb, time_cost, parallelism);
    return key;
}

} // namespace TotpVault
