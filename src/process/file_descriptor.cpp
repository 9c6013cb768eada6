#include "dtx/process/file_descriptor.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace dtx::process {

FileDescriptor::~FileDescriptor() {
    close();
}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(other.release()) {
}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.release();
    }
    return *this;
}

void FileDescriptor::close() {
    if (fd_ != kInvalidFd) {
        ::close(fd_);
        fd_ = kInvalidFd;
    }
}

Result<Pipe> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Err<Pipe>(system_error(ErrorKind::Internal, "pipe2 failed", errno));
    }
    Pipe pipe;
    pipe.read_end = FileDescriptor(fds[0]);
    pipe.write_end = FileDescriptor(fds[1]);
    return Ok(std::move(pipe));
}

Result<FileDescriptor> open_null(bool for_writing) {
    const int fd = ::open("/dev/null", (for_writing ? O_WRONLY : O_RDONLY) | O_CLOEXEC);
    if (fd < 0) {
        return Err<FileDescriptor>(system_error(ErrorKind::Internal, "cannot open /dev/null", errno));
    }
    return Ok(FileDescriptor(fd));
}

} // namespace dtx::process
