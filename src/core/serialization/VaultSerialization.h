// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025 TJDev
/**
 * @file VaultSerialization.h
 * @brief Entry collection <-> protobuf plaintext
 *
 * Converts the in-memory EntryMap into the bytes that get encrypted, and
 * back. The container envelope around the ciphertext is VaultFormat's job.
 */

#ifndef TOTPVAULT_VAULT_SERIALIZATION_H
#define TOTPVAULT_VAULT_SERIALIZATION_H

#include "../VaultError.h"
#include "../SecretEntry.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>

namespace TotpVault {

/**
 * @brief Decrypted vault contents plus bookkeeping from the payload
 */
struct VaultContents {
    EntryMap entries;
    int64_t created_at = 0;      ///< Unix time the vault was created
    int64_t last_modified = 0;   ///< Unix time of the last committed write
};

/**
 * @class VaultSerialization
 * @brief Static protobuf (de)serialization of VaultContents
 *
 * Schema versions:
 * - **v1**: VaultData { metadata, repeated SecretRecord entries }
 *
 * A payload with a schema_version newer than CURRENT_SCHEMA_VERSION is
 * refused with VaultError::UnsupportedVersion instead of being read with
 * fields silently dropped.
 *
 * Secret bytes copied into protobuf messages are wiped before the
 * messages are destroyed.
 */
class VaultSerialization {
public:
    static constexpr int32_t CURRENT_SCHEMA_VERSION = 1;

    /// Maximum plaintext size accepted by deserialize()
    static constexpr size_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024;

    /**
     * @brief Serialize contents to protobuf bytes
     *
     * @param contents Entries and timestamps (last_modified is written as given)
     * @return Plaintext bytes in secure memory, or VaultError::SerializationFailed
     */
    [[nodiscard]] static VaultResult<SecureVector<uint8_t>> serialize(const VaultContents& contents);

    /**
     * @brief Parse protobuf bytes back into contents
     *
     * @return Contents, or:
     *         - VaultError::InvalidProtobuf: unparsable, oversized, invalid or duplicate entries
     *         - VaultError::UnsupportedVersion: schema newer than this build understands
     */
    [[nodiscard]] static VaultResult<VaultContents> deserialize(std::span<const uint8_t> data);

private:
    VaultSerialization() = delete;
    ~VaultSerialization() = delete;
    VaultSerialization(const VaultSerialization&) = delete;
    VaultSerialization& operator=(const VaultSerialization&) = delete;
    VaultSerialization(VaultSerialization&&) = delete;
    VaultSerialization& operator=(VaultSerialization&&) = delete;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULT_SERIALIZATION_H
