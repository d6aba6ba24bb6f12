/**
 * \file unique_fd.hpp
 * \brief Move-only owner of a POSIX file descriptor.
 */
#pragma once
#include <unistd.h>
#include <utility>

namespace docsync {

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    UniqueFd(const UniqueFd &) = delete;
    UniqueFd &operator=(const UniqueFd &) = delete;
    UniqueFd(UniqueFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd &operator=(UniqueFd &&other) noexcept {
        if(this != &other) { reset(); fd_ = std::exchange(other.fd_, -1); }
        return *this;
    }
    ~UniqueFd() { reset(); }

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    explicit operator bool() const noexcept { return valid(); }

    /** \brief Close the descriptor now. \return 0, or -1 with errno set by close(2). */
    int close() noexcept {
        int rc = 0;
        if(fd_ >= 0) { rc = ::close(fd_); fd_ = -1; }
        return rc;
    }

    void reset() noexcept { close(); }

private:
    int fd_ = -1;
};

} // namespace docsync
