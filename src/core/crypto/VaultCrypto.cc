// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2024 Travis E. Hansen

#include "VaultCrypto.h"
#include "../../utils/Log.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace TotpVault {

VaultResult<std::vector<uint8_t>> VaultCrypto::seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {

    if (key.size() != KEY_LENGTH || nonce.size() != NONCE_LENGTH) {
        Log::error("VaultCrypto: seal called with key {} bytes, nonce {} bytes",
                   key.size(), nonce.size());
        return std::unexpected(VaultError::EncryptionFailed);
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_LENGTH, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    int len = 0;

    if (!associated_data.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, associated_data.data(),
                              static_cast<int>(associated_data.size())) != 1) {
            return std::unexpected(VaultError::EncryptionFailed);
        }
    }

    std::vector<uint8_t> ciphertext(plaintext.size() + TAG_LENGTH);
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1) {
            return std::unexpected(VaultError::EncryptionFailed);
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }
    ciphertext_len += len;

    // Append tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, TAG_LENGTH,
                            ciphertext.data() + ciphertext_len) != 1) {
        return std::unexpected(VaultError::EncryptionFailed);
    }

    ciphertext.resize(static_cast<size_t>(ciphertext_len) + TAG_LENGTH);
    return ciphertext;
}

VaultResult<SecureVector<uint8_t>> VaultCrypto::open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> associated_data) {

    if (key.size() != KEY_LENGTH || nonce.size() != NONCE_LENGTH) {
        Log::error("VaultCrypto: open called with key {} bytes, nonce {} bytes",
                   key.size(), nonce.size());
        return std::unexpected(VaultError::CryptoError);
    }
    if (ciphertext.size() < TAG_LENGTH) {
        return std::unexpected(VaultError::IntegrityCheckFailed);
    }

    const auto body = ciphertext.first(ciphertext.size() - TAG_LENGTH);
    // EVP_CTRL_AEAD_SET_TAG takes a non-const pointer
    std::vector<uint8_t> tag(ciphertext.end() - TAG_LENGTH, ciphertext.end());

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(VaultError::CryptoError);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, NONCE_LENGTH, nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::unexpected(VaultError::CryptoError);
    }

    int len = 0;

    if (!associated_data.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, associated_data.data(),
                              static_cast<int>(associated_data.size())) != 1) {
            return std::unexpected(VaultError::CryptoError);
        }
    }

    SecureVector<uint8_t> plaintext(body.size());
    int plaintext_len = 0;

    if (!body.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, body.data(),
                              static_cast<int>(body.size())) != 1) {
            return std::unexpected(VaultError::CryptoError);
        }
        plaintext_len = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, TAG_LENGTH, tag.data()) != 1) {
        return std::unexpected(VaultError::CryptoError);
    }

    // Finalize (verifies the tag); plaintext is discarded and wiped on failure
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) != 1) {
        return std::unexpected(VaultError::IntegrityCheckFailed);
    }
    plaintext_len += len;

    plaintext.resize(static_cast<size_t>(plaintext_len));
    return plaintext;
}

std::vector<uint8_t> VaultCrypto::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (length == 0) {
        return bytes;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure
    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        // Never hand out predictable salts or nonces
        OPENSSL_cleanse(bytes.data(), bytes.size());
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

}  // namespace TotpVault
