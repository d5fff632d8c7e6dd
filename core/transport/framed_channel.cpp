#include "framed_channel.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace hearth {
namespace transport {

namespace {

constexpr int kInvalidFd = -1;

int elapsed_ms_since(std::chrono::steady_clock::time_point start) {
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

}  // namespace

FramedChannel::FramedChannel() : read_fd_(kInvalidFd), write_fd_(kInvalidFd) {}

FramedChannel::FramedChannel(int read_fd, int write_fd) : read_fd_(read_fd), write_fd_(write_fd) {}

FramedChannel::~FramedChannel() {
    // Descriptors belong to whoever created them (PluginProcess or the host's stdio)
}

void FramedChannel::set_fds(int read_fd, int write_fd) {
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    eof_ = false;
    error_.clear();
}

bool FramedChannel::write_frame(const uint8_t *data, size_t len, int timeout_ms) {
    error_.clear();
    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    uint32_t len32 = static_cast<uint32_t>(len);
    uint8_t len_buf[4];
    len_buf[0] = (len32 >> 0) & 0xFF;
    len_buf[1] = (len32 >> 8) & 0xFF;
    len_buf[2] = (len32 >> 16) & 0xFF;
    len_buf[3] = (len32 >> 24) & 0xFF;

    if (!write_exact(len_buf, 4, timeout_ms)) {
        return false;
    }
    if (len > 0 && !write_exact(data, len, timeout_ms)) {
        return false;
    }
    return true;
}

bool FramedChannel::read_frame(std::vector<uint8_t> &out, int timeout_ms) {
    error_.clear();
    const auto start = std::chrono::steady_clock::now();

    uint8_t len_buf[4];
    if (!read_exact(len_buf, 4, timeout_ms)) {
        return false;
    }

    uint32_t len = (uint32_t(len_buf[0]) << 0) | (uint32_t(len_buf[1]) << 8) | (uint32_t(len_buf[2]) << 16) |
                   (uint32_t(len_buf[3]) << 24);
    if (len > kMaxFrameSize) {
        error_ = "Frame too large: " + std::to_string(len) + " bytes";
        return false;
    }

    out.resize(len);
    if (len > 0) {
        int remaining = timeout_ms;
        if (timeout_ms >= 0) {
            remaining = timeout_ms - elapsed_ms_since(start);
            if (remaining < 0) {
                remaining = 0;
            }
        }
        if (!read_exact(out.data(), len, remaining)) {
            if (error_.empty()) {
                error_ = "EOF reading frame payload";
            }
            return false;
        }
    }
    return true;
}

bool FramedChannel::wait_for_data(int timeout_ms) {
    error_.clear();
    if (read_fd_ < 0) {
        error_ = "Channel read side closed";
        return false;
    }

    struct pollfd pfd;
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result < 0) {
        error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (result == 0) {
        return false;
    }
    // POLLHUP with buffered data still reports POLLIN; read() then drains it
    if ((pfd.revents & POLLIN) != 0) {
        return true;
    }
    if ((pfd.revents & POLLHUP) != 0) {
        eof_ = true;
        error_ = "Peer closed the channel";
        return false;
    }
    error_ = "poll error on channel";
    return false;
}

bool FramedChannel::write_exact(const uint8_t *buf, size_t n, int timeout_ms) {
    if (write_fd_ < 0) {
        error_ = "Channel write side closed";
        return false;
    }

    size_t total = 0;
    const auto start = std::chrono::steady_clock::now();
    while (total < n) {
        if (timeout_ms >= 0 && elapsed_ms_since(start) >= timeout_ms) {
            error_ = "Timeout writing frame";
            return false;
        }

        ssize_t w = write(write_fd_, buf + total, n - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                eof_ = true;
                error_ = "Broken pipe (peer terminated)";
            } else {
                error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool FramedChannel::read_exact(uint8_t *buf, size_t n, int timeout_ms) {
    if (read_fd_ < 0) {
        error_ = "Channel read side closed";
        return false;
    }

    size_t total = 0;
    const auto start = std::chrono::steady_clock::now();
    while (total < n) {
        if (timeout_ms >= 0) {
            const int elapsed = elapsed_ms_since(start);
            if (elapsed >= timeout_ms) {
                error_ = "Timeout reading frame";
                return false;
            }
            if (!wait_for_data(timeout_ms - elapsed)) {
                if (error_.empty()) {
                    error_ = "Timeout waiting for data";
                } else if (eof_ && total == 0) {
                    // Clean EOF between frames
                    error_.clear();
                }
                return false;
            }
        }

        ssize_t r = read(read_fd_, buf + total, n - total);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            error_ = "Read failed: " + std::string(strerror(errno));
            return false;
        }
        if (r == 0) {
            eof_ = true;
            if (total > 0) {
                error_ = "EOF inside frame";
            }
            return false;
        }
        total += static_cast<size_t>(r);
    }
    return true;
}

void FramedChannel::close_write() {
    if (write_fd_ >= 0) {
        close(write_fd_);
        write_fd_ = kInvalidFd;
    }
}

void FramedChannel::close_read() {
    if (read_fd_ >= 0) {
        close(read_fd_);
        read_fd_ = kInvalidFd;
    }
}

}  // namespace transport
}  // namespace hearth
