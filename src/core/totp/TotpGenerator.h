// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file TotpGenerator.h
 * @brief RFC 6238 time-based one-time passwords (over RFC 4226 HOTP)
 */

#ifndef TOTPVAULT_TOTP_GENERATOR_H
#define TOTPVAULT_TOTP_GENERATOR_H

#include "../SecretEntry.h"
#include "../VaultError.h"
#include <cstdint>
#include <span>
#include <string>

namespace TotpVault {

/**
 * @brief A generated code and how long it stays valid
 */
struct TotpCode {
    std::string code;             ///< Zero-padded, exactly entry.digits() characters
    uint32_t seconds_remaining;   ///< Seconds until the next time step

    bool operator==(const TotpCode&) const = default;
};

/**
 * @class TotpGenerator
 * @brief Stateless code generation
 *
 * Algorithm for an entry E at Unix time t:
 * 1. counter = floor((t - E.t0) / E.period), encoded as 8 bytes big-endian
 * 2. hs = HMAC-<E.algorithm>(E.secret, counter)
 * 3. offset = hs[last] & 0x0f; bin = hs[offset..offset+3] & 0x7fffffff
 * 4. code = bin mod 10^E.digits, left-padded with '0'
 *
 * Times before t0 are treated as step 0.
 *
 * @code
 * auto code = TotpGenerator::generate(entry, std::time(nullptr));
 * if (code) {
 *     std::cout << code->code << " (" << code->seconds_remaining << "s)\n";
 * }
 * @endcode
 */
class TotpGenerator {
public:
    /**
     * @brief Code for @p entry at Unix time @p unix_time
     * @return Code and remaining seconds, or VaultError::CryptoError if
     *         OpenSSL's HMAC fails internally
     */
    [[nodiscard]] static VaultResult<TotpCode> generate(const SecretEntry& entry, int64_t unix_time);

    /**
     * @brief RFC 4226 HOTP value for an explicit counter
     * @return Truncated value already reduced modulo 10^digits
     */
    [[nodiscard]] static VaultResult<uint32_t> hotp(
        std::span<const uint8_t> secret,
        DigestAlgorithm algorithm,
        uint64_t counter,
        uint32_t digits);

    /// Time step index for @p unix_time
    [[nodiscard]] static uint64_t time_step(const SecretEntry& entry, int64_t unix_time) noexcept;

    /// Seconds until the code for @p unix_time expires
    [[nodiscard]] static uint32_t seconds_remaining(const SecretEntry& entry, int64_t unix_time) noexcept;

    /// Left-pad @p value with zeros to @p digits characters
    [[nodiscard]] static std::string format_code(uint32_t value, uint32_t digits);

    TotpGenerator() = delete;
    ~TotpGenerator() = delete;
    TotpGenerator(const TotpGenerator&) = delete;
    TotpGenerator& operator=(const TotpGenerator&) = delete;
};

} // namespace TotpVault

#endif // TOTPVAULT_TOTP_GENERATOR_H
