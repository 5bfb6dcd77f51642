// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025 TJDev

#include "VaultFormat.h"
#include "../crypto/VaultCrypto.h"
#include "../../utils/Log.h"
#include <algorithm>

namespace TotpVault {

namespace {

void put_u8(std::vector<uint8_t>& out, uint8_t value) {
    out.push_back(value);
}

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value >> 24));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value));
}

void put_bytes(std::vector<uint8_t>& out, std::span<const uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

// Bounds-checked big-endian reader; every read fails once the input runs out
class Reader {
public:
    explicit Reader(std::span<const uint8_t> data) : data_(data) {}

    bool u8(uint8_t& value) {
        if (remaining() < 1) {
            return false;
        }
        value = data_[pos_++];
        return true;
    }

    bool u32(uint32_t& value) {
        if (remaining() < 4) {
            return false;
        }
        value = (static_cast<uint32_t>(data_[pos_]) << 24) |
                (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return true;
    }

    bool bytes(size_t count, std::vector<uint8_t>& out) {
        if (remaining() < count) {
            return false;
        }
        out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                   data_.begin() + static_cast<std::ptrdiff_t>(pos_ + count));
        pos_ += count;
        return true;
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

}  // namespace

std::vector<uint8_t> VaultFormat::header_bytes(const VaultContainer& container) {
    std::vector<uint8_t> out;
    out.reserve(MIN_FILE_SIZE + container.kdf.salt.size() + container.nonce.size());

    put_bytes(out, MAGIC);
    put_u32(out, container.format_version);
    put_u8(out, static_cast<uint8_t>(container.kdf.algorithm));
    put_u32(out, container.kdf.time_cost);
    put_u32(out, container.kdf.memory_kb);
    put_u32(out, container.kdf.parallelism);
    put_u8(out, static_cast<uint8_t>(container.kdf.salt.size()));
    put_bytes(out, container.kdf.salt);
    put_u8(out, static_cast<uint8_t>(container.nonce.size()));
    put_bytes(out, container.nonce);
    return out;
}

std::vector<uint8_t> VaultFormat::encode(const VaultContainer& container) {
    std::vector<uint8_t> out = header_bytes(container);
    out.reserve(out.size() + 4 + container.ciphertext.size());
    put_u32(out, static_cast<uint32_t>(container.ciphertext.size()));
    put_bytes(out, container.ciphertext);
    return out;
}

VaultResult<VaultContainer> VaultFormat::decode(std::span<const uint8_t> file_data) {
    if (file_data.size() < MAGIC.size() + 4) {
        Log::warning("VaultFormat: File too small ({} bytes)", file_data.size());
        return std::unexpected(VaultError::CorruptedFile);
    }
    if (!std::equal(MAGIC.begin(), MAGIC.end(), file_data.begin())) {
        Log::warning("VaultFormat: Bad magic, not a vault container");
        return std::unexpected(VaultError::CorruptedFile);
    }

    Reader reader(file_data.subspan(MAGIC.size()));
    VaultContainer container;

    if (!reader.u32(container.format_version)) {
        return std::unexpected(VaultError::CorruptedFile);
    }
    if (container.format_version != CURRENT_VERSION) {
        Log::error("VaultFormat: Unsupported container version {} (this build reads {})",
                   container.format_version, CURRENT_VERSION);
        return std::unexpected(VaultError::UnsupportedVersion);
    }

    uint8_t algorithm = 0;
    uint8_t salt_len = 0;
    uint8_t nonce_len = 0;
    uint32_t ciphertext_len = 0;

    if (!reader.u8(algorithm) ||
        !reader.u32(container.kdf.time_cost) ||
        !reader.u32(container.kdf.memory_kb) ||
        !reader.u32(container.kdf.parallelism) ||
        !reader.u8(salt_len)) {
        Log::warning("VaultFormat: Truncated KDF header");
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (algorithm != static_cast<uint8_t>(KdfAlgorithm::ARGON2ID)) {
        Log::warning("VaultFormat: Unknown KDF algorithm id {}", algorithm);
        return std::unexpected(VaultError::CorruptedFile);
    }
    container.kdf.algorithm = KdfAlgorithm::ARGON2ID;

    if (salt_len < KeyDerivation::MIN_SALT_LENGTH || salt_len > KeyDerivation::MAX_SALT_LENGTH) {
        Log::warning("VaultFormat: Invalid salt length {}", salt_len);
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (!reader.bytes(salt_len, container.kdf.salt) || !reader.u8(nonce_len)) {
        Log::warning("VaultFormat: Truncated salt");
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (nonce_len != VaultCrypto::NONCE_LENGTH) {
        Log::warning("VaultFormat: Invalid nonce length {}", nonce_len);
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (!reader.bytes(nonce_len, container.nonce) || !reader.u32(ciphertext_len)) {
        Log::warning("VaultFormat: Truncated nonce");
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (ciphertext_len < VaultCrypto::TAG_LENGTH || ciphertext_len > MAX_CIPHERTEXT_SIZE ||
        ciphertext_len != reader.remaining()) {
        Log::warning("VaultFormat: Ciphertext length {} does not match {} remaining bytes",
                     ciphertext_len, reader.remaining());
        return std::unexpected(VaultError::CorruptedFile);
    }

    if (!reader.bytes(ciphertext_len, container.ciphertext)) {
        return std::unexpected(VaultError::CorruptedFile);
    }

    return container;
}

}  // namespace TotpVault
