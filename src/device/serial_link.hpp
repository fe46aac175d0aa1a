#pragma once
// =============================================================================
// SerialLink — byte/line transport to the keyboard bridge
// =============================================================================
// Implementations: PosixSerialLink (termios) and FakeLink (in-process
// simulator). Errors:
//   write/readLine deadline passed                   -> LinkTimeout
//   connection-level failure                         -> LinkIoError
//   use after close()                                -> SessionClosed
// =============================================================================
#include "result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace retina::device {

class SerialLink {
public:
    using Clock = std::chrono::steady_clock;

    virtual ~SerialLink() = default;

    // All bytes handed to the driver before the deadline, or LinkTimeout
    virtual Result<void> write(const std::vector<uint8_t>& bytes, Clock::time_point deadline) = 0;

    // Next line with "\r\n" / "\n" stripped
    virtual Result<std::string> readLine(Clock::time_point deadline) = 0;

    // Discard buffered input, returns bytes dropped
    virtual size_t drainInput() = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual std::string describe() const = 0;
};

} // namespace retina::device
