#pragma once
// =============================================================================
// PosixSerialLink — termios serial port (8N1, raw, no flow control)
// =============================================================================
// open() takes an exclusive advisory lock on the device node; a second open
// of the same port (from this or another process) fails with ConfigError.
// =============================================================================
#include "device/serial_link.hpp"

#include <memory>
#include <string>

namespace retina::device {

// 9600, 19200, 38400, 57600, 115200, 230400
bool isSupportedBaud(int baud);

class PosixSerialLink : public SerialLink {
public:
    // ConfigError: unsupported baud, port busy. LinkIoError: open/termios failure.
    static Result<std::unique_ptr<PosixSerialLink>> open(const std::string& port, int baud);

    ~PosixSerialLink() override;

    PosixSerialLink(const PosixSerialLink&) = delete;
    PosixSerialLink& operator=(const PosixSerialLink&) = delete;

    Result<void> write(const std::vector<uint8_t>& bytes, Clock::time_point deadline) override;
    Result<std::string> readLine(Clock::time_point deadline) override;
    size_t drainInput() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }
    std::string describe() const override;

private:
    PosixSerialLink(int fd, std::string port, int baud);

    int fd_ = -1;
    std::string port_;
    int baud_ = 0;
    std::string rx_;  // bytes received but not yet returned as a line
};

} // namespace retina::device
