// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025 TJDev
/**
 * @file VaultFormat.h
 * @brief On-disk vault container encoding and parsing
 */

#ifndef TOTPVAULT_VAULT_FORMAT_H
#define TOTPVAULT_VAULT_FORMAT_H

#include "../VaultError.h"
#include "../crypto/KeyDerivation.h"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace TotpVault {

/**
 * @struct VaultContainer
 * @brief Parsed form of a vault file
 *
 * Everything except the ciphertext is public metadata; all of it is bound
 * to the ciphertext as AEAD associated data (see VaultFormat::header_bytes).
 */
struct VaultContainer {
    uint32_t format_version = 0;
    KdfParameters kdf;
    std::vector<uint8_t> nonce;        ///< Fresh for every write
    std::vector<uint8_t> ciphertext;   ///< ChaCha20-Poly1305 output, tag appended

    bool operator==(const VaultContainer&) const = default;
};

/**
 * @class VaultFormat
 * @brief Static utility class for the vault container format
 *
 * ## Container Format (version 1)
 *
 * All integers big-endian.
 * ```
 * [magic "TOTV"(4)][format_version(4)]
 * [kdf_algorithm(1)][time_cost(4)][memory_kb(4)][parallelism(4)]
 * [salt_len(1)][salt]
 * [nonce_len(1)][nonce]
 * [ciphertext_len(4)][ciphertext + tag]
 * ```
 *
 * The header (everything before ciphertext_len) is authenticated as
 * associated data when the payload is sealed.
 *
 * ## Versioning
 * decode() reads the version right after the magic and refuses anything it
 * does not know with VaultError::UnsupportedVersion before touching the
 * rest of the file.
 *
 * ## Thread Safety
 * All methods are pure functions of their arguments.
 *
 * @code
 * auto container = VaultFormat::decode(file_bytes);
 * if (!container) {
 *     // CorruptedFile or UnsupportedVersion
 * }
 * auto aad = VaultFormat::header_bytes(*container);
 * @endcode
 */
class VaultFormat {
public:
    static constexpr std::array<uint8_t, 4> MAGIC = {'T', 'O', 'T', 'V'};
    static constexpr uint32_t CURRENT_VERSION = 1;

    /// Upper bound on ciphertext size accepted by decode()
    static constexpr size_t MAX_CIPHERTEXT_SIZE = 32 * 1024 * 1024;

    /**
     * @brief Serialize a container to file bytes
     *
     * @pre container.kdf.salt and container.nonce fit in one length byte
     */
    [[nodiscard]] static std::vector<uint8_t> encode(const VaultContainer& container);

    /**
     * @brief Parse file bytes
     *
     * @return Container, or:
     *         - VaultError::UnsupportedVersion: magic matches but the version is unknown
     *         - VaultError::CorruptedFile: bad magic, truncation, trailing bytes,
     *           or a length field out of bounds
     */
    [[nodiscard]] static VaultResult<VaultContainer> decode(std::span<const uint8_t> file_data);

    /**
     * @brief Associated data for sealing/opening this container's payload
     *
     * Identical to the leading bytes encode() writes before ciphertext_len.
     */
    [[nodiscard]] static std::vector<uint8_t> header_bytes(const VaultContainer& container);

private:
    /// magic + version + algorithm + 3 costs + salt_len + nonce_len + ciphertext_len
    static constexpr size_t MIN_FILE_SIZE = 4 + 4 + 1 + 12 + 1 + 1 + 4;

    VaultFormat() = delete;
    ~VaultFormat() = delete;
    VaultFormat(const VaultFormat&) = delete;
    VaultFormat& operator=(const VaultFormat&) = delete;
    VaultFormat(VaultFormat&&) = delete;
    VaultFormat& operator=(VaultFormat&&) = delete;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULT_FORMAT_H
