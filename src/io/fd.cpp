#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace fwsync {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::OpenForWrite(const std::string& path, Fd& out) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result::Fail(ErrorCode::Io,
                            "open " + path + " failed: " + std::strerror(errno));
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

Result Fd::WriteAll(std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Result::Fail(ErrorCode::Io, std::string("write failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result Fd::Sync() {
    if (::fsync(fd_) != 0)
        return Result::Fail(ErrorCode::Io, std::string("fsync failed: ") + std::strerror(errno));
    return Result::Ok();
}

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

} // namespace fwsync
