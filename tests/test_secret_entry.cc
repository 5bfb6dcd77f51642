// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file test_secret_entry.cc
 * @brief Validation tests for SecretEntry
 */

#include <gtest/gtest.h>
#include "../src/core/SecretEntry.h"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace TotpVault;

class SecretEntryTest : public ::testing::Test {
protected:
    std::vector<uint8_t> secret{'1', '2', '3', '4', '5', '6', '7', '8', '9', '0'};
};

TEST_F(SecretEntryTest, CreateWithDefaults) {
    auto entry = SecretEntry::create("github", secret);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name(), "github");
    EXPECT_TRUE(std::ranges::equal(entry->secret(), secret));
    EXPECT_EQ(entry->algorithm(), DigestAlgorithm::SHA1);
    EXPECT_EQ(entry->digits(), DEFAULT_DIGITS);
    EXPECT_EQ(entry->period(), DEFAULT_PERIOD);
    EXPECT_EQ(entry->t0(), 0u);
}

TEST_F(SecretEntryTest, CreateWithAllFields) {
    auto entry = SecretEntry::create("bank", secret, DigestAlgorithm::SHA512, 8, 60, 1000);

    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->algorithm(), DigestAlgorithm::SHA512);
    EXPECT_EQ(entry->digits(), 8u);
    EXPECT_EQ(entry->period(), 60u);
    EXPECT_EQ(entry->t0(), 1000u);
}

TEST_F(SecretEntryTest, RejectsEmptyName) {
    auto entry = SecretEntry::create("", secret);
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error(), VaultError::InvalidEntry);
}

TEST_F(SecretEntryTest, NameLengthLimit) {
    EXPECT_TRUE(SecretEntry::create(std::string(MAX_ENTRY_NAME_LENGTH, 'a'), secret).has_value());

    auto too_long = SecretEntry::create(std::string(MAX_ENTRY_NAME_LENGTH + 1, 'a'), secret);
    ASSERT_FALSE(too_long.has_value());
    EXPECT_EQ(too_long.error(), VaultError::InvalidEntry);
}

TEST_F(SecretEntryTest, RejectsEmptySecret) {
    auto entry = SecretEntry::create("github", std::span<const uint8_t>{});
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error(), VaultError::InvalidEntry);
}

TEST_F(SecretEntryTest, DigitsBounds) {
    EXPECT_FALSE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 5).has_value());
    EXPECT_TRUE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 6).has_value());
    EXPECT_TRUE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 10).has_value());
    EXPECT_FALSE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 11).has_value());
}

TEST_F(SecretEntryTest, RejectsZeroPeriod) {
    auto entry = SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 6, 0);
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error(), VaultError::InvalidEntry);
}

TEST_F(SecretEntryTest, T0Bounds) {
    EXPECT_TRUE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 6, 30, MAX_T0).has_value());

    auto entry = SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 6, 30, MAX_T0 + 1);
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error(), VaultError::InvalidEntry);

    EXPECT_FALSE(SecretEntry::create("a", secret, DigestAlgorithm::SHA1, 6, 30, UINT64_MAX).has_value());
}

TEST_F(SecretEntryTest, RejectsUnknownDigest) {
    auto entry = SecretEntry::create("a", secret, static_cast<DigestAlgorithm>(7));
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error(), VaultError::InvalidEntry);
}

TEST_F(SecretEntryTest, EqualityComparesAllFields) {
    auto a = SecretEntry::create("a", secret);
    auto b = SecretEntry::create("a", secret);
    auto c = SecretEntry::create("a", secret, DigestAlgorithm::SHA256);

    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(*a, *b);
    EXPECT_FALSE(*a == *c);
}

TEST(DigestAlgorithmTest, ToString) {
    EXPECT_EQ(to_string(DigestAlgorithm::SHA1), "SHA-1");
    EXPECT_EQ(to_string(DigestAlgorithm::SHA256), "SHA-256");
    EXPECT_EQ(to_string(DigestAlgorithm::SHA512), "SHA-512");
}
