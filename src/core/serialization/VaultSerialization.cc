// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025 TJDev

#include "VaultSerialization.h"
#include "record.pb.h"
#include "../../utils/Log.h"
#include <limits>
#include <optional>

namespace TotpVault {

namespace {

// Owns a VaultData and wipes every secret copy in it on scope exit
class ScopedVaultData {
public:
    ScopedVaultData() = default;

    ~ScopedVaultData() {
        for (auto& record : *data_.mutable_entries()) {
            secure_clear_string(*record.mutable_secret());
        }
    }

    ScopedVaultData(const ScopedVaultData&) = delete;
    ScopedVaultData& operator=(const ScopedVaultData&) = delete;

    totpvault::VaultData& get() noexcept { return data_; }

private:
    totpvault::VaultData data_;
};

totpvault::Digest to_proto(DigestAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case DigestAlgorithm::SHA1:   return totpvault::DIGEST_SHA1;
        case DigestAlgorithm::SHA256: return totpvault::DIGEST_SHA256;
        case DigestAlgorithm::SHA512: return totpvault::DIGEST_SHA512;
    }
    return totpvault::DIGEST_SHA1;
}

std::optional<DigestAlgorithm> from_proto(totpvault::Digest digest) noexcept {
    switch (digest) {
        case totpvault::DIGEST_SHA1:   return DigestAlgorithm::SHA1;
        case totpvault::DIGEST_SHA256: return DigestAlgorithm::SHA256;
        case totpvault::DIGEST_SHA512: return DigestAlgorithm::SHA512;
        default:
            return std::nullopt;
    }
}

}  // namespace

VaultResult<SecureVector<uint8_t>>
VaultSerialization::serialize(const VaultContents& contents) {
    ScopedVaultData scoped;
    auto& vault_data = scoped.get();

    auto* metadata = vault_data.mutable_metadata();
    metadata->set_schema_version(CURRENT_SCHEMA_VERSION);
    metadata->set_created_at(contents.created_at);
    metadata->set_last_modified(contents.last_modified);

    for (const auto& [name, entry] : contents.entries) {
        auto* record = vault_data.add_entries();
        record->set_name(name);
        record->set_secret(reinterpret_cast<const char*>(entry.secret().data()),
                           entry.secret().size());
        record->set_digest(to_proto(entry.algorithm()));
        record->set_digits(entry.digits());
        record->set_period(entry.period());
        record->set_t0(entry.t0());
    }

    const size_t size = vault_data.ByteSizeLong();
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        Log::error("VaultSerialization: Payload too large ({} bytes)", size);
        return std::unexpected(VaultError::SerializationFailed);
    }

    SecureVector<uint8_t> out(size);
    if (!vault_data.SerializeToArray(out.data(), static_cast<int>(size))) {
        Log::error("VaultSerialization: Failed to serialize VaultData to protobuf");
        return std::unexpected(VaultError::SerializationFailed);
    }

    return out;
}

VaultResult<VaultContents>
VaultSerialization::deserialize(std::span<const uint8_t> data) {
    if (data.size() > MAX_PAYLOAD_SIZE) {
        Log::error("VaultSerialization: Payload exceeds maximum size ({} bytes > {} bytes)",
                   data.size(), MAX_PAYLOAD_SIZE);
        return std::unexpected(VaultError::InvalidProtobuf);
    }

    ScopedVaultData scoped;
    auto& vault_data = scoped.get();

    if (!vault_data.ParseFromArray(data.data(), static_cast<int>(data.size()))) {
        Log::error("VaultSerialization: Failed to parse VaultData from protobuf");
        return std::unexpected(VaultError::InvalidProtobuf);
    }

    const int32_t schema_version = vault_data.metadata().schema_version();
    if (schema_version > CURRENT_SCHEMA_VERSION) {
        Log::error("VaultSerialization: Vault schema v{} is newer than supported v{}",
                   schema_version, CURRENT_SCHEMA_VERSION);
        return std::unexpected(VaultError::UnsupportedVersion);
    }
    if (schema_version < 1) {
        Log::error("VaultSerialization: Missing or invalid schema version: {}", schema_version);
        return std::unexpected(VaultError::InvalidProtobuf);
    }

    VaultContents contents;
    contents.created_at = vault_data.metadata().created_at();
    contents.last_modified = vault_data.metadata().last_modified();

    for (const auto& record : vault_data.entries()) {
        auto algorithm = from_proto(record.digest());
        if (!algorithm) {
            Log::error("VaultSerialization: Unknown digest id {}", static_cast<int>(record.digest()));
            return std::unexpected(VaultError::InvalidProtobuf);
        }

        const auto& secret = record.secret();
        auto entry = SecretEntry::create(
            record.name(),
            std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(secret.data()), secret.size()),
            *algorithm,
            record.digits(),
            record.period(),
            record.t0());
        if (!entry) {
            Log::error("VaultSerialization: Stored entry failed validation");
            return std::unexpected(VaultError::InvalidProtobuf);
        }

        auto [it, inserted] = contents.entries.emplace(record.name(), std::move(*entry));
        if (!inserted) {
            Log::error("VaultSerialization: Duplicate entry name in payload");
            return std::unexpected(VaultError::InvalidProtobuf);
        }
    }

    return contents;
}

}  // namespace TotpVault
