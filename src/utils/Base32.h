// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#ifndef TOTPVAULT_BASE32_H
#define TOTPVAULT_BASE32_H

#include "SecureMemory.h"
#include <optional>
#include <string_view>

namespace TotpVault::Base32 {

/**
 * @brief Decode an RFC 4648 Base32 string (authenticator "secret=" format)
 *
 * Accepts upper or lower case, ignores spaces and trailing '=' padding.
 * Rejects characters outside the alphabet, padding followed by more data,
 * and lengths that cannot come from a whole number of bytes (1, 3 or 6
 * symbols in the final group).
 *
 * @param encoded Base32 text
 * @return Decoded bytes in wiped-on-free storage, or std::nullopt if invalid
 */
[[nodiscard]] std::optional<SecureVector<uint8_t>> decode(std::string_view encoded);

} // namespace TotpVault::Base32

#endif // TOTPVAULT_BASE32_H
