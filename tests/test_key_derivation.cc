// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file test_key_derivation.cc
 * @brief Unit tests for Argon2id KeyDerivation
 *
 * Tests cover:
 * - Key size (256-bit)
 * - Determinism for identical inputs
 * - Password and salt sensitivity
 * - Parameter validation of untrusted headers
 * - Parameter generation from VaultConfig
 */

#include <gtest/gtest.h>
#include "../src/core/crypto/KeyDerivation.h"
#include <random>

using namespace TotpVault;

// ============================================================================
// Test Fixture
// ============================================================================

class KeyDerivationTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937 rng(54321);  // Fixed seed
        std::uniform_int_distribution<int> dist(0, 255);

        params_.salt.resize(16);
        for (auto& byte : params_.salt) {
            byte = static_cast<uint8_t>(dist(rng));
        }
        // Low costs keep the suite fast
        params_.time_cost = 1;
        params_.memory_kb = 8192;
        params_.parallelism = 1;
    }

    KdfParameters params_;

    const std::string test_password_ = "correct_horse_battery_staple";
    const std::string test_password2_ = "different_password_123";
};

// ============================================================================
// Derivation
// ============================================================================

TEST_F(KeyDerivationTest, ProducesCorrectKeySize) {
    auto key = KeyDerivation::derive_key(test_password_, params_);

    ASSERT_TRUE(key.has_value()) << "Argon2id derivation failed";
    EXPECT_EQ(key->size(), KeyDerivation::KEY_LENGTH);
}

TEST_F(KeyDerivationTest, Deterministic) {
    auto key1 = KeyDerivation::derive_key(test_password_, params_);
    auto key2 = KeyDerivation::derive_key(test_password_, params_);

    ASSERT_TRUE(key1 && key2);
    EXPECT_EQ(*key1, *key2);
}

TEST_F(KeyDerivationTest, DifferentPasswordsProduceDifferentKeys) {
    auto key1 = KeyDerivation::derive_key(test_password_, params_);
    auto key2 = KeyDerivation::derive_key(test_password2_, params_);

    ASSERT_TRUE(key1 && key2);
    EXPECT_NE(*key1, *key2);
}

TEST_F(KeyDerivationTest, DifferentSaltsProduceDifferentKeys) {
    KdfParameters other = params_;
    other.salt[0] ^= 0x01;

    auto key1 = KeyDerivation::derive_key(test_password_, params_);
    auto key2 = KeyDerivation::derive_key(test_password_, other);

    ASSERT_TRUE(key1 && key2);
    EXPECT_NE(*key1, *key2);
}

TEST_F(KeyDerivationTest, DifferentCostsProduceDifferentKeys) {
    KdfParameters other = params_;
    other.time_cost = 2;

    auto key1 = KeyDerivation::derive_key(test_password_, params_);
    auto key2 = KeyDerivation::derive_key(test_password_, other);

    ASSERT_TRUE(key1 && key2);
    EXPECT_NE(*key1, *key2);
}

TEST_F(KeyDerivationTest, EmptyPasswordIsAccepted) {
    auto key = KeyDerivation::derive_key("", params_);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->size(), KeyDerivation::KEY_LENGTH);
}

// ============================================================================
// Parameter Validation
// ============================================================================

TEST_F(KeyDerivationTest, ValidParametersPass) {
    EXPECT_TRUE(KeyDerivation::validate(params_));
}

TEST_F(KeyDerivationTest, RejectsShortSalt) {
    params_.salt.resize(15);
    EXPECT_FALSE(KeyDerivation::validate(params_));

    auto key = KeyDerivation::derive_key(test_password_, params_);
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error(), VaultError::KeyDerivationFailed);
}

TEST_F(KeyDerivationTest, RejectsZeroCosts) {
    KdfParameters no_time = params_;
    no_time.time_cost = 0;
    EXPECT_FALSE(KeyDerivation::validate(no_time));

    KdfParameters no_lanes = params_;
    no_lanes.parallelism = 0;
    EXPECT_FALSE(KeyDerivation::validate(no_lanes));

    KdfParameters no_memory = params_;
    no_memory.memory_kb = 0;
    EXPECT_FALSE(KeyDerivation::validate(no_memory));
}

TEST_F(KeyDerivationTest, RejectsMemoryBelowEightKiBPerLane) {
    params_.parallelism = 4;
    params_.memory_kb = 31;
    EXPECT_FALSE(KeyDerivation::validate(params_));

    params_.memory_kb = 32;
    EXPECT_TRUE(KeyDerivation::validate(params_));
}

TEST_F(KeyDerivationTest, RejectsExcessiveCosts) {
    KdfParameters slow = params_;
    slow.time_cost = KeyDerivation::MAX_TIME_COST + 1;
    EXPECT_FALSE(KeyDerivation::validate(slow));

    KdfParameters huge = params_;
    huge.memory_kb = KeyDerivation::MAX_MEMORY_KB + 1;
    EXPECT_FALSE(KeyDerivation::validate(huge));
}

TEST_F(KeyDerivationTest, RejectsUnknownAlgorithm) {
    params_.algorithm = static_cast<KdfAlgorithm>(0x01);
    auto key = KeyDerivation::derive_key(test_password_, params_);
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error(), VaultError::KeyDerivationFailed);
}

// ============================================================================
// Parameter Generation
// ============================================================================

TEST(KeyDerivationParametersTest, GenerateUsesConfig) {
    VaultConfig config;
    config.salt_length = 32;
    config.argon2_time_cost = 2;
    config.argon2_memory_kb = 16384;
    config.argon2_parallelism = 2;

    auto params = KeyDerivation::generate_parameters(config);

    EXPECT_EQ(params.algorithm, KdfAlgorithm::ARGON2ID);
    EXPECT_EQ(params.salt.size(), 32u);
    EXPECT_EQ(params.time_cost, 2u);
    EXPECT_EQ(params.memory_kb, 16384u);
    EXPECT_EQ(params.parallelism, 2u);
    EXPECT_TRUE(KeyDerivation::validate(params));
}

TEST(KeyDerivationParametersTest, GenerateClampsUnsafeConfig) {
    VaultConfig config;
    config.salt_length = 4;
    config.argon2_time_cost = 0;
    config.argon2_memory_kb = 1;
    config.argon2_parallelism = 0;

    auto params = KeyDerivation::generate_parameters(config);

    EXPECT_EQ(params.salt.size(), SettingsValidator::MIN_SALT_LENGTH);
    EXPECT_EQ(params.time_cost, SettingsValidator::MIN_ARGON2_TIME_COST);
    EXPECT_EQ(params.memory_kb, SettingsValidator::MIN_ARGON2_MEMORY_KB);
    EXPECT_EQ(params.parallelism, SettingsValidator::MIN_ARGON2_PARALLELISM);
}

TEST(KeyDerivationParametersTest, EachGenerationHasFreshSalt) {
    VaultConfig config;
    auto a = KeyDerivation::generate_parameters(config);
    auto b = KeyDerivation::generate_parameters(config);
    EXPECT_NE(a.salt, b.salt);
}

TEST(KeyDerivationParametersTest, AlgorithmName) {
    EXPECT_EQ(KeyDerivation::algorithm_to_string(KdfAlgorithm::ARGON2ID), "Argon2id");
}
