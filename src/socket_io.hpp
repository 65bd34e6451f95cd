#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace modelbridge::net {

/// Largest frame accepted on the TCP hop.
constexpr uint32_t kMaxFrameSize = 1024 * 1024;

/// Owns a socket descriptor and closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

enum class IoStatus {
    Ok,
    Closed,    // peer closed before the first byte of the frame
    Timeout,
    TooLarge,
    Error,
};

const char* io_status_name(IoStatus status);

using Clock = std::chrono::steady_clock;

/**
 * Writes one frame: 4-byte big-endian length followed by the payload.
 */
IoStatus write_frame(int fd, const std::string& payload);

/**
 * Reads one frame. The whole frame must arrive before @p deadline.
 *
 * @param fd connected socket
 * @param payload receives the frame body
 * @param deadline absolute time limit for the complete frame
 */
IoStatus read_frame(int fd, std::string& payload, Clock::time_point deadline);

/// Same as read_frame with a deadline of now + timeout.
IoStatus read_frame(int fd, std::string& payload, std::chrono::milliseconds timeout);

} // namespace modelbridge::net
