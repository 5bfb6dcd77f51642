// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file SecureMemory.h
 * @brief Zeroizing containers for keys, passwords and decrypted secrets
 *
 * Everything that holds sensitive bytes in this library lives in one of
 * these types, so the bytes are wiped with OPENSSL_cleanse() on every exit
 * path, including error returns and exceptions.
 */

#ifndef TOTPVAULT_SECURE_MEMORY_H
#define TOTPVAULT_SECURE_MEMORY_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace TotpVault {

/**
 * @brief Custom deleter for EVP_CIPHER_CTX
 */
struct EVPCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 *
 * @code
 * EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
 * if (!ctx) {
 *     return std::unexpected(VaultError::CryptoError);
 * }
 * @endcode
 */
using EVPCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherContextDeleter>;

/**
 * @brief Allocator that zeroes memory before handing it back
 *
 * @tparam T Element type (normally uint8_t)
 */
template<typename T>
class SecureAllocator : public std::allocator<T> {
public:
    template<typename U>
    struct rebind {
        using other = SecureAllocator<U>;
    };

    SecureAllocator() noexcept = default;

    template<typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}

    void deallocate(T* p, std::size_t n) {
        if (p) {
            OPENSSL_cleanse(p, n * sizeof(T));
            std::allocator<T>::deallocate(p, n);
        }
    }
};

/**
 * @brief std::vector whose storage is wiped on deallocation
 *
 * Used for derived keys, decrypted plaintext and raw TOTP secrets.
 */
template<typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

/**
 * @brief Overwrite a byte range in a way the optimizer cannot elide
 */
inline void secure_clear(std::span<uint8_t> bytes) noexcept {
    if (!bytes.empty()) {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }
}

/**
 * @brief Wipe and empty a std::string that held sensitive text
 */
inline void secure_clear_string(std::string& str) noexcept {
    // Wipe up to capacity: a moved-from string keeps its old short-string
    // bytes past size()
    str.resize(str.capacity());
    OPENSSL_cleanse(str.data(), str.size());
    str.clear();
}

/**
 * @brief Owning password buffer, securely cleared on destruction
 *
 * Move-only. The moved-from object, and the std::string it was built
 * from, are wiped as well.
 *
 * @code
 * SecureString password{read_password_from_terminal()};
 * auto handle = manager.unlock_vault(path, password.view());
 * // password wiped when it leaves scope
 * @endcode
 */
class SecureString {
public:
    /// Takes the text and wipes what @p str leaves behind
    explicit SecureString(std::string&& str) : str_(std::move(str)) {
        secure_clear_string(str);
    }

    ~SecureString() {
        secure_clear_string(str_);
    }

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    SecureString(SecureString&& other) noexcept
        : str_(std::move(other.str_)) {
        secure_clear_string(other.str_);
    }

    SecureString& operator=(SecureString&& other) noexcept {
        if (this != &other) {
            secure_clear_string(str_);
            str_ = std::move(other.str_);
            secure_clear_string(other.str_);
        }
        return *this;
    }

    [[nodiscard]] std::string_view view() const noexcept { return str_; }

    void clear() noexcept { secure_clear_string(str_); }

    [[nodiscard]] bool empty() const noexcept { return str_.empty(); }

    [[nodiscard]] size_t bytes() const noexcept { return str_.size(); }

private:
    std::string str_;
};

} // namespace TotpVault

#endif // TOTPVAULT_SECURE_MEMORY_H
