// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultHandle.h"

namespace TotpVault {

VaultHandle::VaultHandle(std::filesystem::path path,
                         SecureVector<uint8_t> key,
                         KdfParameters kdf,
                         VaultContents contents)
    : path_(std::move(path)),
      key_(std::move(key)),
      kdf_(std::move(kdf)),
      contents_(std::move(contents)),
      unlocked_(true) {}

VaultHandle::~VaultHandle() {
    lock();
}

VaultHandle::VaultHandle(VaultHandle&& other) noexcept {
    take(other);
}

VaultHandle& VaultHandle::operator=(VaultHandle&& other) noexcept {
    if (this != &other) {
        lock();
        take(other);
    }
    return *this;
}

void VaultHandle::take(VaultHandle& other) noexcept {
    path_ = std::move(other.path_);
    key_ = std::move(other.key_);
    kdf_ = std::move(other.kdf_);
    contents_ = std::move(other.contents_);
    unlocked_ = other.unlocked_;
    other.lock();
}

void VaultHandle::lock() noexcept {
    secure_clear(key_);
    key_.clear();
    key_.shrink_to_fit();

    // SecretEntry secrets are SecureVectors, wiped as the map releases them
    contents_.entries.clear();
    contents_.created_at = 0;
    contents_.last_modified = 0;

    kdf_ = KdfParameters{};
    unlocked_ = false;
}

}  // namespace TotpVault
