// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "../src/utils/SettingsValidator.h"
#include "../src/core/VaultConfig.h"
#include <gtest/gtest.h>

using namespace TotpVault;

/**
 * @brief Salt length is clamped into [MIN_SALT_LENGTH, MAX_SALT_LENGTH]
 */
TEST(SettingsValidatorTest, SaltLengthClampsToSafeRange) {
    EXPECT_EQ(SettingsValidator::clamp_salt_length(0), SettingsValidator::MIN_SALT_LENGTH);
    EXPECT_EQ(SettingsValidator::clamp_salt_length(15), SettingsValidator::MIN_SALT_LENGTH);
    EXPECT_EQ(SettingsValidator::clamp_salt_length(32), 32u);
    EXPECT_EQ(SettingsValidator::clamp_salt_length(1000), SettingsValidator::MAX_SALT_LENGTH);
}

TEST(SettingsValidatorTest, TimeCostClampsToSafeRange) {
    EXPECT_EQ(SettingsValidator::clamp_time_cost(0), SettingsValidator::MIN_ARGON2_TIME_COST);
    EXPECT_EQ(SettingsValidator::clamp_time_cost(5), 5u);
    EXPECT_EQ(SettingsValidator::clamp_time_cost(100), SettingsValidator::MAX_ARGON2_TIME_COST);
}

/**
 * @brief Memory below 8 MB would make offline guessing cheap
 */
TEST(SettingsValidatorTest, MemoryClampsToSafeRange) {
    EXPECT_EQ(SettingsValidator::clamp_memory_kb(1024), SettingsValidator::MIN_ARGON2_MEMORY_KB);
    EXPECT_EQ(SettingsValidator::clamp_memory_kb(262144), 262144u);
    EXPECT_EQ(SettingsValidator::clamp_memory_kb(0xFFFFFFFFu), SettingsValidator::MAX_ARGON2_MEMORY_KB);
}

TEST(SettingsValidatorTest, ParallelismClampsToSafeRange) {
    EXPECT_EQ(SettingsValidator::clamp_parallelism(0), SettingsValidator::MIN_ARGON2_PARALLELISM);
    EXPECT_EQ(SettingsValidator::clamp_parallelism(8), 8u);
    EXPECT_EQ(SettingsValidator::clamp_parallelism(64), SettingsValidator::MAX_ARGON2_PARALLELISM);
}

TEST(SettingsValidatorTest, DefaultsAreInsideTheirRanges) {
    static_assert(SettingsValidator::clamp_salt_length(SettingsValidator::DEFAULT_SALT_LENGTH) ==
                  SettingsValidator::DEFAULT_SALT_LENGTH);
    static_assert(SettingsValidator::clamp_time_cost(SettingsValidator::DEFAULT_ARGON2_TIME_COST) ==
                  SettingsValidator::DEFAULT_ARGON2_TIME_COST);
    static_assert(SettingsValidator::clamp_memory_kb(SettingsValidator::DEFAULT_ARGON2_MEMORY_KB) ==
                  SettingsValidator::DEFAULT_ARGON2_MEMORY_KB);
    static_assert(SettingsValidator::clamp_parallelism(SettingsValidator::DEFAULT_ARGON2_PARALLELISM) ==
                  SettingsValidator::DEFAULT_ARGON2_PARALLELISM);
    SUCCEED();
}

TEST(SettingsValidatorTest, VaultConfigValidatedClampsEveryField) {
    VaultConfig config;
    config.salt_length = 1;
    config.argon2_time_cost = 99;
    config.argon2_memory_kb = 2;
    config.argon2_parallelism = 99;

    const VaultConfig safe = config.validated();
    EXPECT_EQ(safe.salt_length, SettingsValidator::MIN_SALT_LENGTH);
    EXPECT_EQ(safe.argon2_time_cost, SettingsValidator::MAX_ARGON2_TIME_COST);
    EXPECT_EQ(safe.argon2_memory_kb, SettingsValidator::MIN_ARGON2_MEMORY_KB);
    EXPECT_EQ(safe.argon2_parallelism, SettingsValidator::MAX_ARGON2_PARALLELISM);
}

TEST(SettingsValidatorTest, DefaultVaultConfigIsUnchangedByValidation) {
    const VaultConfig config;
    const VaultConfig safe = config.validated();
    EXPECT_EQ(safe.salt_length, config.salt_length);
    EXPECT_EQ(safe.argon2_time_cost, config.argon2_time_cost);
    EXPECT_EQ(safe.argon2_memory_kb, config.argon2_memory_kb);
    EXPECT_EQ(safe.argon2_parallelism, config.argon2_parallelism);
}
