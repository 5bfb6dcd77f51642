// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "TotpGenerator.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <array>
#include <cstdint>
#include <format>

namespace TotpVault {

namespace {

const EVP_MD* digest_for(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:   return EVP_sha1();
        case DigestAlgorithm::SHA256: return EVP_sha256();
        case DigestAlgorithm::SHA512: return EVP_sha512();
    }
    return nullptr;
}

constexpr uint64_t pow10(uint32_t exponent) noexcept {
    uint64_t value = 1;
    for (uint32_t i = 0; i < exponent; ++i) {
        value *= 10;
    }
    return value;
}

}  // namespace

VaultResult<uint32_t> TotpGenerator::hotp(
    std::span<const uint8_t> secret,
    DigestAlgorithm algorithm,
    uint64_t counter,
    uint32_t digits) {

    const EVP_MD* md = digest_for(algorithm);
    if (md == nullptr) {
        return std::unexpected(VaultError::InvalidEntry);
    }

    std::array<uint8_t, 8> message{};
    for (int i = 7; i >= 0; --i) {
        message[static_cast<size_t>(i)] = static_cast<uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> hs{};
    unsigned int hs_len = 0;
    if (HMAC(md, secret.data(), static_cast<int>(secret.size()),
             message.data(), message.size(), hs.data(), &hs_len) == nullptr) {
        Log::error("TotpGenerator: HMAC-{} failed", to_string(algorithm));
        return std::unexpected(VaultError::CryptoError);
    }

    // Dynamic truncation (RFC 4226 section 5.3)
    const size_t offset = hs[hs_len - 1] & 0x0F;
    const uint32_t bin_code =
        (static_cast<uint32_t>(hs[offset] & 0x7F) << 24) |
        (static_cast<uint32_t>(hs[offset + 1]) << 16) |
        (static_cast<uint32_t>(hs[offset + 2]) << 8) |
        static_cast<uint32_t>(hs[offset + 3]);

    OPENSSL_cleanse(hs.data(), hs.size());

    return static_cast<uint32_t>(bin_code % pow10(digits));
}

uint64_t TotpGenerator::time_step(const SecretEntry& entry, int64_t unix_time) noexcept {
    const auto t0 = static_cast<int64_t>(entry.t0());
    if (unix_time <= t0) {
        return 0;
    }
    // Both non-negative here, so the difference cannot overflow
    return (static_cast<uint64_t>(unix_time) - entry.t0()) / entry.period();
}

uint32_t TotpGenerator::seconds_remaining(const SecretEntry& entry, int64_t unix_time) noexcept {
    const auto t0 = static_cast<int64_t>(entry.t0());
    if (unix_time < t0) {
        // Step 0 has not started yet; it ends one period after t0.
        // Modular subtraction gives the exact gap even for negative times.
        const uint64_t gap = entry.t0() - static_cast<uint64_t>(unix_time);
        if (gap >= UINT32_MAX - entry.period()) {
            return UINT32_MAX;
        }
        return static_cast<uint32_t>(gap) + entry.period();
    }
    const uint64_t elapsed = static_cast<uint64_t>(unix_time) - entry.t0();
    return entry.period() - static_cast<uint32_t>(elapsed % entry.period());
}

std::string TotpGenerator::format_code(uint32_t value, uint32_t digits) {
    return std::format("{:0>{}}", value, digits);
}

VaultResult<TotpCode> TotpGenerator::generate(const SecretEntry& entry, int64_t unix_time) {
    auto value = hotp(entry.secret(), entry.algorithm(),
                      time_step(entry, unix_time), entry.digits());
    if (!value) {
        return std::unexpected(value.error());
    }

    return TotpCode{
        .code = format_code(*value, entry.digits()),
        .seconds_remaining = seconds_remaining(entry, unix_time)
    };
}

} // namespace TotpVault
