#pragma once

#include "dtx/core/result.hpp"

#include <utility>

namespace dtx::process {

constexpr int kInvalidFd = -1;

/**
 * @brief Owning wrapper around a POSIX file descriptor
 *
 * Closes on destruction. Move-only, same ownership model as a socket handle:
 * the pipeline runner hands each end to exactly one stage and drops its own
 * copy right after the spawn so EOF propagates down the pipe.
 */
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor();

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;

    bool is_valid() const { return fd_ != kInvalidFd; }
    int native_handle() const { return fd_; }

    /**
     * @brief Give up ownership without closing
     */
    int release() noexcept { return std::exchange(fd_, kInvalidFd); }

    void close();

private:
    int fd_ = kInvalidFd;
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

/**
 * @brief pipe2(O_CLOEXEC); both ends close automatically in exec'd children
 */
Result<Pipe> make_pipe();

/**
 * @brief Open /dev/null for reading or writing (O_CLOEXEC)
 */
Result<FileDescriptor> open_null(bool for_writing);

} // namespace dtx::process
