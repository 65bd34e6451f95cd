#include "socket_io.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

namespace modelbridge::net {

namespace {

enum class WaitResult {
    Ready,
    Timeout,
    Error,
};

WaitResult wait_readable(int fd, Clock::time_point deadline) {
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return WaitResult::Timeout;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WaitResult::Error;
        }
        if (rc == 0) {
            return WaitResult::Timeout;
        }
        // POLLHUP still lets recv() report the orderly close
        return WaitResult::Ready;
    }
}

// Reads exactly len bytes. `got` reports how many arrived before a failure.
IoStatus read_exact(int fd, char* dst, size_t len, Clock::time_point deadline, size_t& got) {
    got = 0;
    while (got < len) {
        switch (wait_readable(fd, deadline)) {
            case WaitResult::Timeout:
                return IoStatus::Timeout;
            case WaitResult::Error:
                return IoStatus::Error;
            case WaitResult::Ready:
                break;
        }

        ssize_t chunk = ::recv(fd, dst + got, len - got, 0);
        if (chunk < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return IoStatus::Error;
        }
        if (chunk == 0) {
            return IoStatus::Closed;
        }
        got += static_cast<size_t>(chunk);
    }
    return IoStatus::Ok;
}

bool write_all(int fd, const char* src, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t written = ::send(fd, src + offset, len - offset, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

} // namespace

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int UniqueFd::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

const char* io_status_name(IoStatus status) {
    switch (status) {
        case IoStatus::Ok:
            return "ok";
        case IoStatus::Closed:
            return "closed";
        case IoStatus::Timeout:
            return "timeout";
        case IoStatus::TooLarge:
            return "too large";
        case IoStatus::Error:
            return "error";
    }
    return "unknown";
}

IoStatus write_frame(int fd, const std::string& payload) {
    if (payload.size() > kMaxFrameSize) {
        return IoStatus::TooLarge;
    }

    uint32_t length_be = htonl(static_cast<uint32_t>(payload.size()));
    if (!write_all(fd, reinterpret_cast<const char*>(&length_be), sizeof(length_be))) {
        return IoStatus::Error;
    }
    if (!payload.empty() && !write_all(fd, payload.data(), payload.size())) {
        return IoStatus::Error;
    }
    return IoStatus::Ok;
}

IoStatus read_frame(int fd, std::string& payload, Clock::time_point deadline) {
    uint32_t length_be = 0;
    size_t got = 0;
    IoStatus status = read_exact(fd, reinterpret_cast<char*>(&length_be), sizeof(length_be), deadline, got);
    if (status != IoStatus::Ok) {
        // a close in the middle of the header is a broken frame, not a disconnect
        if (status == IoStatus::Closed && got > 0) {
            return IoStatus::Error;
        }
        return status;
    }

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        return IoStatus::TooLarge;
    }

    std::vector<char> buffer(length);
    if (length > 0) {
        status = read_exact(fd, buffer.data(), length, deadline, got);
        if (status == IoStatus::Closed) {
            return IoStatus::Error;
        }
        if (status != IoStatus::Ok) {
            return status;
        }
    }

    payload.assign(buffer.data(), buffer.size());
    return IoStatus::Ok;
}

IoStatus read_frame(int fd, std::string& payload, std::chrono::milliseconds timeout) {
    return read_frame(fd, payload, Clock::now() + timeout);
}

} // namespace modelbridge::net
