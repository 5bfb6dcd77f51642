// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "SecretEntry.h"
#include "../utils/Log.h"
#include <algorithm>

namespace TotpVault {

VaultResult<SecretEntry> SecretEntry::create(
    std::string_view name,
    std::span<const uint8_t> secret,
    DigestAlgorithm algorithm,
    uint32_t digits,
    uint32_t period,
    uint64_t t0) {

    if (name.empty() || name.size() > MAX_ENTRY_NAME_LENGTH) {
        Log::warning("SecretEntry: Rejected name of length {}", name.size());
        return std::unexpected(VaultError::InvalidEntry);
    }
    if (secret.empty()) {
        Log::warning("SecretEntry: Rejected empty secret");
        return std::unexpected(VaultError::InvalidEntry);
    }
    if (digits < MIN_DIGITS || digits > MAX_DIGITS) {
        Log::warning("SecretEntry: Rejected digits={} (allowed {}-{})", digits, MIN_DIGITS, MAX_DIGITS);
        return std::unexpected(VaultError::InvalidEntry);
    }
    if (period == 0) {
        Log::warning("SecretEntry: Rejected zero period");
        return std::unexpected(VaultError::InvalidEntry);
    }
    if (t0 > MAX_T0) {
        Log::warning("SecretEntry: Rejected t0={} (max {})", t0, MAX_T0);
        return std::unexpected(VaultError::InvalidEntry);
    }
    switch (algorithm) {
        case DigestAlgorithm::SHA1:
        case DigestAlgorithm::SHA256:
        case DigestAlgorithm::SHA512:
            break;
        default:
            Log::warning("SecretEntry: Rejected digest id {}", static_cast<int>(algorithm));
            return std::unexpected(VaultError::InvalidEntry);
    }

    SecretEntry entry;
    entry.name_.assign(name);
    entry.secret_.assign(secret.begin(), secret.end());
    entry.algorithm_ = algorithm;
    entry.digits_ = digits;
    entry.period_ = period;
    entry.t0_ = t0;
    return entry;
}

bool SecretEntry::operator==(const SecretEntry& other) const {
    return name_ == other.name_ &&
           std::ranges::equal(secret_, other.secret_) &&
           algorithm_ == other.algorithm_ &&
           digits_ == other.digits_ &&
           period_ == other.period_ &&
           t0_ == other.t0_;
}

} // namespace TotpVault
