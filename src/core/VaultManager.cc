// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultManager.h"
#include "crypto/VaultCrypto.h"
#include "format/VaultFormat.h"
#include "io/VaultIO.h"
#include "../utils/Base32.h"
#include "../utils/Log.h"
#include <chrono>
#include <openssl/crypto.h>
#include <stdexcept>

namespace TotpVault {

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::span<const uint8_t> as_bytes(std::string_view text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

}  // namespace

VaultManager::VaultManager(const VaultConfig& config)
    : config_(config.validated()) {
    Log::debug("VaultManager: Argon2id defaults t={} m={}KiB p={} salt={}",
               config_.argon2_time_cost, config_.argon2_memory_kb,
               config_.argon2_parallelism, config_.salt_length);
}

VaultResult<KdfParameters> VaultManager::fresh_parameters() const {
    try {
        return KeyDerivation::generate_parameters(config_);
    } catch (const std::runtime_error& e) {
        Log::error("VaultManager: Failed to generate KDF parameters: {}", e.what());
        return std::unexpected(VaultError::CryptoError);
    }
}

VaultResult<> VaultManager::persist(const std::filesystem::path& path,
                                    std::span<const uint8_t> key,
                                    const KdfParameters& kdf,
                                    VaultContents& contents) {
    contents.last_modified = unix_now();

    auto plaintext = VaultSerialization::serialize(contents);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    VaultContainer container;
    container.format_version = VaultFormat::CURRENT_VERSION;
    container.kdf = kdf;
    try {
        container.nonce = VaultCrypto::generate_nonce();
    } catch (const std::runtime_error& e) {
        Log::error("VaultManager: Failed to generate nonce: {}", e.what());
        return std::unexpected(VaultError::CryptoError);
    }

    const auto aad = VaultFormat::header_bytes(container);
    auto ciphertext = VaultCrypto::seal(key, container.nonce, *plaintext, aad);
    if (!ciphertext) {
        return std::unexpected(ciphertext.error());
    }
    container.ciphertext = std::move(*ciphertext);

    return VaultIO::write_file(path, VaultFormat::encode(container));
}

VaultResult<> VaultManager::create_vault(const std::filesystem::path& path,
                                         std::string_view password) {
    auto occupied = VaultIO::exists(path);
    if (!occupied) {
        return std::unexpected(occupied.error());
    }
    if (*occupied) {
        Log::error("VaultManager: Refusing to overwrite existing file {}", path.string());
        return std::unexpected(VaultError::AlreadyExists);
    }

    auto kdf = fresh_parameters();
    if (!kdf) {
        return std::unexpected(kdf.error());
    }

    auto key = KeyDerivation::derive_key(password, *kdf);
    if (!key) {
        return std::unexpected(key.error());
    }

    VaultContents contents;
    contents.created_at = unix_now();

    if (auto written = persist(path, *key, *kdf, contents); !written) {
        return written;
    }

    Log::info("VaultManager: Created vault {}", path.string());
    return {};
}

VaultResult<VaultHandle> VaultManager::unlock_vault(const std::filesystem::path& path,
                                                    std::string_view password) {
    auto file_data = VaultIO::read_file(path);
    if (!file_data) {
        return std::unexpected(file_data.error());
    }

    auto container = VaultFormat::decode(*file_data);
    if (!container) {
        return std::unexpected(container.error());
    }

    // Stored costs are attacker-controlled until the tag verifies
    if (!KeyDerivation::validate(container->kdf)) {
        Log::error("VaultManager: Stored KDF parameters out of bounds in {}", path.string());
        return std::unexpected(VaultError::CorruptedFile);
    }

    auto key = KeyDerivation::derive_key(password, container->kdf);
    if (!key) {
        return std::unexpected(key.error());
    }

    const auto aad = VaultFormat::header_bytes(*container);
    auto plaintext = VaultCrypto::open(*key, container->nonce, container->ciphertext, aad);
    if (!plaintext) {
        if (plaintext.error() == VaultError::IntegrityCheckFailed) {
            Log::warning("VaultManager: Authentication failed for {}", path.string());
            return std::unexpected(VaultError::WrongPasswordOrCorrupt);
        }
        return std::unexpected(plaintext.error());
    }

    auto contents = VaultSerialization::deserialize(*plaintext);
    if (!contents) {
        return std::unexpected(contents.error());
    }

    Log::info("VaultManager: Unlocked {} ({} entries)", path.string(), contents->entries.size());
    return VaultHandle(path, std::move(*key), std::move(container->kdf), std::move(*contents));
}

void VaultManager::lock_vault(VaultHandle& handle) noexcept {
    handle.lock();
}

VaultResult<> VaultManager::rotate_password(VaultHandle& handle,
                                            std::string_view old_password,
                                            std::string_view new_password) {
    if (!handle.is_unlocked()) {
        return std::unexpected(VaultError::VaultNotOpen);
    }

    auto old_key = KeyDerivation::derive_key(old_password, handle.kdf_);
    if (!old_key) {
        return std::unexpected(old_key.error());
    }
    if (old_key->size() != handle.key_.size() ||
        CRYPTO_memcmp(old_key->data(), handle.key_.data(), handle.key_.size()) != 0) {
        Log::warning("VaultManager: Current password did not match for {}", handle.path_.string());
        return std::unexpected(VaultError::WrongPasswordOrCorrupt);
    }

    auto new_kdf = fresh_parameters();
    if (!new_kdf) {
        return std::unexpected(new_kdf.error());
    }

    auto new_key = KeyDerivation::derive_key(new_password, *new_kdf);
    if (!new_key) {
        return std::unexpected(new_key.error());
    }

    VaultContents updated = handle.contents_;
    if (auto written = persist(handle.path_, *new_key, *new_kdf, updated); !written) {
        return written;
    }

    secure_clear(handle.key_);
    handle.key_ = std::move(*new_key);
    handle.kdf_ = std::move(*new_kdf);
    handle.contents_ = std::move(updated);

    Log::info("VaultManager: Rotated password for {}", handle.path_.string());
    return {};
}

VaultResult<> VaultManager::add_entry(VaultHandle& handle,
                                      std::string_view name,
                                      std::string_view secret_input,
                                      bool encoded,
                                      DigestAlgorithm algorithm,
                                      uint32_t digits,
                                      uint32_t period,
                                      uint64_t t0) {
    if (!handle.is_unlocked()) {
        return std::unexpected(VaultError::VaultNotOpen);
    }

    SecureVector<uint8_t> secret;
    if (encoded) {
        auto decoded = Base32::decode(secret_input);
        if (!decoded) {
            Log::warning("VaultManager: Secret is not valid Base32");
            return std::unexpected(VaultError::InvalidEntry);
        }
        secret = std::move(*decoded);
    } else {
        const auto raw = as_bytes(secret_input);
        secret.assign(raw.begin(), raw.end());
    }

    auto entry = SecretEntry::create(name, secret, algorithm, digits, period, t0);
    if (!entry) {
        return std::unexpected(entry.error());
    }

    if (handle.contents_.entries.contains(name)) {
        Log::debug("VaultManager: Entry '{}' already exists", name);
        return std::unexpected(VaultError::DuplicateName);
    }

    VaultContents updated = handle.contents_;
    updated.entries.emplace(std::string(name), std::move(*entry));

    if (auto written = persist(handle.path_, handle.key_, handle.kdf_, updated); !written) {
        return written;
    }

    handle.contents_ = std::move(updated);
    Log::debug("VaultManager: Added entry '{}'", name);
    return {};
}

VaultResult<> VaultManager::remove_entry(VaultHandle& handle, std::string_view name) {
    if (!handle.is_unlocked()) {
        return std::unexpected(VaultError::VaultNotOpen);
    }

    VaultContents updated = handle.contents_;
    auto it = updated.entries.find(name);
    if (it == updated.entries.end()) {
        return std::unexpected(VaultError::NotFound);
    }
    updated.entries.erase(it);

    if (auto written = persist(handle.path_, handle.key_, handle.kdf_, updated); !written) {
        return written;
    }

    handle.contents_ = std::move(updated);
    Log::debug("VaultManager: Removed entry '{}'", name);
    return {};
}

std::vector<std::string> VaultManager::list_entries(const VaultHandle& handle) const {
    std::vector<std::string> names;
    if (!handle.is_unlocked()) {
        return names;
    }

    names.reserve(handle.contents_.entries.size());
    for (const auto& [name, entry] : handle.contents_.entries) {
        names.push_back(name);
    }
    return names;
}

VaultResult<TotpCode> VaultManager::current_code(const VaultHandle& handle,
                                                 std::string_view name,
                                                 int64_t now) const {
    if (!handle.is_unlocked()) {
        return std::unexpected(VaultError::VaultNotOpen);
    }

    auto it = handle.contents_.entries.find(name);
    if (it == handle.contents_.entries.end()) {
        return std::unexpected(VaultError::NotFound);
    }

    return TotpGenerator::generate(it->second, now);
}

VaultResult<TotpCode> VaultManager::show_code(const VaultHandle& handle,
                                              std::string_view name) const {
    return current_code(handle, name, unix_now());
}

}  // namespace TotpVault
