// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file VaultIO.h
 * @brief Crash-safe file I/O for vault persistence
 *
 * This file contains the VaultIO utility class which handles all file system
 * operations for vault storage: atomic replacement, owner-only permissions
 * and directory synchronization.
 */

#ifndef TOTPVAULT_VAULTIO_H
#define TOTPVAULT_VAULTIO_H

#include "../VaultError.h"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace TotpVault {

/**
 * @brief Utility class for vault file I/O
 *
 * @section atomicity Atomic Writes
 * write_file() is write_temporary() followed by commit_temporary():
 * 1. `<path>.tmp` is created fresh (O_EXCL, mode 0600), written and fsync'd
 * 2. rename(2) moves it over `<path>`
 * 3. the parent directory is fsync'd so the rename survives power loss;
 *    this step is best-effort and only logs a warning on failure, since
 *    the new file is already in place
 *
 * A crash at any point leaves either the old file or the new file at
 * `<path>`, never a mix. A stale `<path>.tmp` is never read and is
 * replaced by the next write.
 *
 * @section limitations Limitations
 * No inter-process locking: two concurrent writers race, and the last
 * rename wins.
 *
 * @section errors Errors
 * Failures are logged with the path and errno text, then returned as
 * FileNotFound, FilePermissionDenied, FileReadFailed or FileWriteFailed.
 *
 * @note This is a utility class with deleted constructors (static methods only)
 */
class VaultIO {
public:
    /// Largest file read_file() will load
    static constexpr size_t MAX_FILE_SIZE = 64 * 1024 * 1024;

    /**
     * @brief Read a whole vault file
     *
     * Opens with O_NOFOLLOW, so a symlink at @p path is refused.
     *
     * @return File contents, or FileNotFound / FilePermissionDenied / FileReadFailed
     */
    [[nodiscard]] static VaultResult<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

    /**
     * @brief Atomically replace @p path with @p data
     *
     * @post On success @p path holds exactly @p data with mode 0600
     * @post On failure @p path is untouched and the temporary is removed
     */
    [[nodiscard]] static VaultResult<> write_file(const std::filesystem::path& path,
                                                  std::span<const uint8_t> data);

    /**
     * @brief First half of write_file(): durable temporary beside @p path
     * @return Path of the temporary file
     */
    [[nodiscard]] static VaultResult<std::filesystem::path> write_temporary(
        const std::filesystem::path& path,
        std::span<const uint8_t> data);

    /**
     * @brief Second half of write_file(): rename @p temp over @p path and sync the directory
     *
     * Succeeds once the rename succeeds. A failed directory sync is logged,
     * not returned, so callers never treat a committed file as unwritten.
     */
    [[nodiscard]] static VaultResult<> commit_temporary(const std::filesystem::path& temp,
                                                        const std::filesystem::path& path);

    /// `<path>.tmp`
    [[nodiscard]] static std::filesystem::path temporary_path(const std::filesystem::path& path);

    /**
     * @brief Whether anything (file, directory, symlink) occupies @p path
     * @return true/false, or FileReadFailed if the parent cannot be inspected
     */
    [[nodiscard]] static VaultResult<bool> exists(const std::filesystem::path& path);

    VaultIO() = delete;
    ~VaultIO() = delete;
    VaultIO(const VaultIO&) = delete;
    VaultIO& operator=(const VaultIO&) = delete;
    VaultIO(VaultIO&&) = delete;
    VaultIO& operator=(VaultIO&&) = delete;
};

}  // namespace TotpVault

#endif  // TOTPVAULT_VAULTIO_H
