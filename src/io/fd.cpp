#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace billsync {

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

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

void Fd::Close() {
    // stdin is borrowed by "-" replays, never owned
    if (fd_ >= 0 && fd_ != STDIN_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

Result Fd::MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("pipe failed: ") + std::strerror(e));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

} // namespace billsync
