/**
 * @file FileDescriptor.hpp
 * @brief RAII owner for POSIX file descriptors
 *
 * Holds the child-process pipes of the command executor and the exclusive
 * temporary file written while provisioning a signing identity.
 */

#pragma once

#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <filesystem>
#include <string_view>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only descriptor, closed on destruction
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Adopt a descriptor returned by a system call (-1 is allowed)
     */
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    /**
     * @brief Create @p path for writing, failing if it already exists
     *
     * Invalid on failure; errno is left as set by open(2).
     */
    [[nodiscard]] static auto create_exclusive(const std::filesystem::path& path, mode_t mode)
        -> FileDescriptor {
        return FileDescriptor{::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode)};
    }

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

    /**
     * @brief Write all of @p data and flush it to stable storage
     * @return false with errno set on the first failing write(2) or fsync(2)
     */
    [[nodiscard]] auto write_durably(std::string_view data) const -> bool {
        while (!data.empty()) {
            const ssize_t n = ::write(fd_, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return ::fsync(fd_) == 0;
    }

    /**
     * @brief Close the current descriptor, if any, and adopt @p fd
     */
    void reset(int fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}  // namespace util
