// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "Base32.h"
#include <openssl/crypto.h>

namespace TotpVault::Base32 {

namespace {

// Value of an RFC 4648 alphabet symbol, or -1
constexpr int symbol_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    if (c >= '2' && c <= '7') {
        return c - '2' + 26;
    }
    return -1;
}

}  // namespace

std::optional<SecureVector<uint8_t>> decode(std::string_view encoded) {
    SecureVector<uint8_t> out;
    out.reserve(encoded.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    size_t symbols = 0;
    bool padding_seen = false;

    for (char c : encoded) {
        if (c == ' ') {
            continue;
        }
        if (c == '=') {
            padding_seen = true;
            continue;
        }
        int value = padding_seen ? -1 : symbol_value(c);
        if (value < 0) {
            OPENSSL_cleanse(&buffer, sizeof(buffer));
            return std::nullopt;
        }

        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        ++symbols;

        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    // A final group of 1, 3 or 6 symbols leaves a partial byte
    switch (symbols % 8) {
        case 1:
        case 3:
        case 6:
            OPENSSL_cleanse(&buffer, sizeof(buffer));
            return std::nullopt;
        default:
            break;
    }

    OPENSSL_cleanse(&buffer, sizeof(buffer));
    return out;
}

} // namespace TotpVault::Base32
