// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_vault_crypto.cc
 * @brief Unit tests for VaultCrypto ChaCha20-Poly1305 encryption
 *
 * Tests encryption/decryption, authentication, associated data binding
 * and error handling.
 */

#include <gtest/gtest.h>
#include "../src/core/crypto/VaultCrypto.h"
#include <algorithm>
#include <set>

using namespace TotpVault;

// ============================================================================
// Test Fixture
// ============================================================================

class VaultCryptoTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_key = VaultCrypto::generate_random_bytes(VaultCrypto::KEY_LENGTH);
        test_nonce = VaultCrypto::generate_nonce();
        test_plaintext = {
            'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'
        };
        test_aad = {'T', 'O', 'T', 'V', 0, 0, 0, 1};
    }

    std::vector<uint8_t> test_key;
    std::vector<uint8_t> test_nonce;
    std::vector<uint8_t> test_plaintext;
    std::vector<uint8_t> test_aad;
};

// ============================================================================
// Round Trip
// ============================================================================

TEST_F(VaultCryptoTest, SealThenOpen) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext, test_aad);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->size(), test_plaintext.size() + VaultCrypto::TAG_LENGTH);

    auto opened = VaultCrypto::open(test_key, test_nonce, *sealed, test_aad);
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(std::ranges::equal(*opened, test_plaintext));
}

TEST_F(VaultCryptoTest, EmptyPlaintext) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, {}, test_aad);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_EQ(sealed->size(), VaultCrypto::TAG_LENGTH);

    auto opened = VaultCrypto::open(test_key, test_nonce, *sealed, test_aad);
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(opened->empty());
}

TEST_F(VaultCryptoTest, CiphertextDiffersFromPlaintext) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext);
    ASSERT_TRUE(sealed.has_value());
    EXPECT_FALSE(std::equal(test_plaintext.begin(), test_plaintext.end(), sealed->begin()));
}

TEST_F(VaultCryptoTest, DifferentNoncesProduceDifferentCiphertexts) {
    auto other_nonce = VaultCrypto::generate_nonce();
    auto a = VaultCrypto::seal(test_key, test_nonce, test_plaintext);
    auto b = VaultCrypto::seal(test_key, other_nonce, test_plaintext);
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
}

// ============================================================================
// Authentication
// ============================================================================

TEST_F(VaultCryptoTest, WrongKeyFails) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext, test_aad);
    ASSERT_TRUE(sealed.has_value());

    auto wrong_key = test_key;
    wrong_key[0] ^= 0x01;

    auto opened = VaultCrypto::open(wrong_key, test_nonce, *sealed, test_aad);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), VaultError::IntegrityCheckFailed);
}

TEST_F(VaultCryptoTest, EveryCiphertextBitIsAuthenticated) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext, test_aad);
    ASSERT_TRUE(sealed.has_value());

    for (size_t bit = 0; bit < sealed->size() * 8; ++bit) {
        auto tampered = *sealed;
        tampered[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));

        auto opened = VaultCrypto::open(test_key, test_nonce, tampered, test_aad);
        ASSERT_FALSE(opened.has_value()) << "bit " << bit;
        EXPECT_EQ(opened.error(), VaultError::IntegrityCheckFailed);
    }
}

TEST_F(VaultCryptoTest, TamperedNonceFails) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext, test_aad);
    ASSERT_TRUE(sealed.has_value());

    auto nonce = test_nonce;
    nonce[5] ^= 0x80;
    EXPECT_FALSE(VaultCrypto::open(test_key, nonce, *sealed, test_aad).has_value());
}

TEST_F(VaultCryptoTest, AssociatedDataIsBound) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext, test_aad);
    ASSERT_TRUE(sealed.has_value());

    auto aad = test_aad;
    aad.back() ^= 0x01;

    auto opened = VaultCrypto::open(test_key, test_nonce, *sealed, aad);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), VaultError::IntegrityCheckFailed);

    EXPECT_FALSE(VaultCrypto::open(test_key, test_nonce, *sealed).has_value());
}

TEST_F(VaultCryptoTest, TruncatedInputFails) {
    std::vector<uint8_t> short_input(VaultCrypto::TAG_LENGTH - 1, 0);
    auto opened = VaultCrypto::open(test_key, test_nonce, short_input);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), VaultError::IntegrityCheckFailed);
}

// ============================================================================
// Argument Validation
// ============================================================================

TEST_F(VaultCryptoTest, SealRejectsBadKeyOrNonceSize) {
    std::vector<uint8_t> short_key(16, 0);
    auto a = VaultCrypto::seal(short_key, test_nonce, test_plaintext);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error(), VaultError::EncryptionFailed);

    std::vector<uint8_t> long_nonce(16, 0);
    auto b = VaultCrypto::seal(test_key, long_nonce, test_plaintext);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error(), VaultError::EncryptionFailed);
}

TEST_F(VaultCryptoTest, OpenRejectsBadKeySize) {
    auto sealed = VaultCrypto::seal(test_key, test_nonce, test_plaintext);
    ASSERT_TRUE(sealed.has_value());

    std::vector<uint8_t> short_key(16, 0);
    auto opened = VaultCrypto::open(short_key, test_nonce, *sealed);
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error(), VaultError::CryptoError);
}

// ============================================================================
// Random Generation
// ============================================================================

TEST(VaultCryptoRandomTest, GeneratesRequestedLength) {
    EXPECT_EQ(VaultCrypto::generate_random_bytes(0).size(), 0u);
    EXPECT_EQ(VaultCrypto::generate_random_bytes(64).size(), 64u);
    EXPECT_EQ(VaultCrypto::generate_nonce().size(), VaultCrypto::NONCE_LENGTH);
}

TEST(VaultCryptoRandomTest, NoncesDoNotRepeat) {
    std::set<std::vector<uint8_t>> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(VaultCrypto::generate_nonce()).second);
    }
}
