// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultIO.h"
#include "../../utils/Log.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace TotpVault {

namespace {

// Closes the descriptor on scope exit
class UniqueFd {
public:
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    // Explicit close so write paths can check the result
    bool close() noexcept {
        if (fd_ < 0) {
            return true;
        }
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc == 0;
    }

private:
    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int fd_;
};

VaultError read_error_from_errno(int err) noexcept {
    switch (err) {
        case ENOENT:
        case ENOTDIR:
            return VaultError::FileNotFound;
        case EACCES:
        case EPERM:
            return VaultError::FilePermissionDenied;
        default:
            return VaultError::FileReadFailed;
    }
}

bool write_all(int fd, std::span<const uint8_t> data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(rc);
    }
    return true;
}

bool sync_directory(const std::filesystem::path& dir) {
    const std::filesystem::path target = dir.empty() ? std::filesystem::path(".") : dir;
    UniqueFd fd(::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.valid()) {
        return false;
    }
    return ::fsync(fd.get()) == 0;
}

}  // namespace

std::filesystem::path VaultIO::temporary_path(const std::filesystem::path& path) {
    std::filesystem::path temp = path;
    temp += ".tmp";
    return temp;
}

VaultResult<bool> VaultIO::exists(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        Log::error("VaultIO: Cannot inspect {}: {}", path.string(), ec.message());
        return std::unexpected(VaultError::FileReadFailed);
    }
    return std::filesystem::exists(status);
}

VaultResult<std::vector<uint8_t>> VaultIO::read_file(const std::filesystem::path& path) {
    UniqueFd fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.valid()) {
        const int err = errno;
        Log::error("VaultIO: Failed to open {}: {}", path.string(), std::strerror(err));
        return std::unexpected(read_error_from_errno(err));
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) {
        Log::error("VaultIO: Failed to stat {}: {}", path.string(), std::strerror(errno));
        return std::unexpected(VaultError::FileReadFailed);
    }
    if (!S_ISREG(st.st_mode)) {
        Log::error("VaultIO: {} is not a regular file", path.string());
        return std::unexpected(VaultError::FileReadFailed);
    }
    if (static_cast<uint64_t>(st.st_size) > MAX_FILE_SIZE) {
        Log::error("VaultIO: {} is too large ({} bytes)", path.string(),
                   static_cast<uint64_t>(st.st_size));
        return std::unexpected(VaultError::FileReadFailed);
    }
    if ((st.st_mode & (S_IRWXG | S_IRWXO)) != 0) {
        Log::warning("VaultIO: {} is accessible by group/others (mode {:o})",
                     path.string(), st.st_mode & 0777);
    }

    std::vector<uint8_t> data(static_cast<size_t>(st.st_size));
    size_t total = 0;
    while (total < data.size()) {
        const ssize_t rc = ::read(fd.get(), data.data() + total, data.size() - total);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            Log::error("VaultIO: Failed to read {}: {}", path.string(), std::strerror(errno));
            return std::unexpected(VaultError::FileReadFailed);
        }
        if (rc == 0) {
            break;
        }
        total += static_cast<size_t>(rc);
    }
    data.resize(total);

    Log::debug("VaultIO: Read {} bytes from {}", data.size(), path.string());
    return data;
}

VaultResult<std::filesystem::path> VaultIO::write_temporary(const std::filesystem::path& path,
                                                            std::span<const uint8_t> data) {
    const auto temp = temporary_path(path);

    // Leftover from an interrupted write
    if (::unlink(temp.c_str()) != 0 && errno != ENOENT) {
        Log::error("VaultIO: Cannot remove stale {}: {}", temp.string(), std::strerror(errno));
        return std::unexpected(VaultError::FileWriteFailed);
    }

    UniqueFd fd(::open(temp.c_str(),
                       O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                       S_IRUSR | S_IWUSR));
    if (!fd.valid()) {
        const int err = errno;
        Log::error("VaultIO: Failed to create {}: {}", temp.string(), std::strerror(err));
        return std::unexpected(err == EACCES || err == EPERM ? VaultError::FilePermissionDenied
                                                             : VaultError::FileWriteFailed);
    }

    if (!write_all(fd.get(), data) || ::fsync(fd.get()) != 0) {
        Log::error("VaultIO: Failed to write {}: {}", temp.string(), std::strerror(errno));
        fd.close();
        ::unlink(temp.c_str());
        return std::unexpected(VaultError::FileWriteFailed);
    }

    if (!fd.close()) {
        Log::error("VaultIO: Failed to close {}: {}", temp.string(), std::strerror(errno));
        ::unlink(temp.c_str());
        return std::unexpected(VaultError::FileWriteFailed);
    }

    return temp;
}

VaultResult<> VaultIO::commit_temporary(const std::filesystem::path& temp,
                                        const std::filesystem::path& path) {
    if (::rename(temp.c_str(), path.c_str()) != 0) {
        Log::error("VaultIO: Failed to rename {} to {}: {}",
                   temp.string(), path.string(), std::strerror(errno));
        ::unlink(temp.c_str());
        return std::unexpected(VaultError::FileWriteFailed);
    }

    // Committed once renamed; a failed directory sync is only logged
    if (!sync_directory(path.parent_path())) {
        Log::warning("VaultIO: Failed to sync directory of {}: {}", path.string(), std::strerror(errno));
    }

    return {};
}

VaultResult<> VaultIO::write_file(const std::filesystem::path& path, std::span<const uint8_t> data) {
    auto temp = write_temporary(path, data);
    if (!temp) {
        return std::unexpected(temp.error());
    }
    auto committed = commit_temporary(*temp, path);
    if (!committed) {
        return committed;
    }
    Log::debug("VaultIO: Wrote {} bytes to {}", data.size(), path.string());
    return {};
}

}  // namespace TotpVault
