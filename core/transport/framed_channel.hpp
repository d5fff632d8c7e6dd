#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hearth {
namespace transport {

// Maximum frame size: 1 MiB
constexpr uint32_t kMaxFrameSize = 1024u * 1024u;

// FramedChannel moves length-prefixed binary frames over a pair of pipe
// descriptors. Frames are: uint32_le (length) + payload bytes.
//
// The orchestrator side uses the pipes connected to a plugin process;
// hearth-plugin-host uses its own stdin/stdout.
class FramedChannel {
public:
    FramedChannel();
    FramedChannel(int read_fd, int write_fd);
    ~FramedChannel();

    FramedChannel(const FramedChannel &) = delete;
    FramedChannel &operator=(const FramedChannel &) = delete;

    void set_fds(int read_fd, int write_fd);

    // Write one frame. timeout_ms < 0 blocks.
    bool write_frame(const uint8_t *data, size_t len, int timeout_ms = -1);
    bool write_frame(const std::string &data, int timeout_ms = -1) {
        return write_frame(reinterpret_cast<const uint8_t *>(data.data()), data.size(), timeout_ms);
    }

    // Read one frame. Returns false on EOF or error (last_error() empty on clean EOF)
    bool read_frame(std::vector<uint8_t> &out, int timeout_ms = -1);

    // Returns true if data is readable within timeout_ms, false on timeout or error (error set)
    bool wait_for_data(int timeout_ms);

    // Closing the write side signals EOF to the peer
    void close_write();
    void close_read();

    bool eof() const { return eof_; }
    const std::string &last_error() const { return error_; }

private:
    int read_fd_;
    int write_fd_;
    bool eof_ = false;
    std::string error_;

    bool read_exact(uint8_t *buf, size_t n, int timeout_ms);
    bool write_exact(const uint8_t *buf, size_t n, int timeout_ms);
};

}  // namespace transport
}  // namespace hearth
