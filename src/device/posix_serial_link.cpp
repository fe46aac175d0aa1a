// =============================================================================
// PosixSerialLink — implementation
// =============================================================================
#include "device/posix_serial_link.hpp"
#include "retina_log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>

#include <fcntl.h>
#include <poll.h>
#include <sys/file.h>
#include <termios.h>
#include <unistd.h>

static constexpr const char* TAG = "serial";

namespace retina::device {

namespace {

bool baudConstant(int baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        default: return false;
    }
}

std::string errnoText(int e) {
    return std::string(strerror(e)) + " (errno " + std::to_string(e) + ")";
}

// Split one complete line off the front of buf, stripping "\r\n" / "\n"
bool takeLine(std::string& buf, std::string& line) {
    auto nl = buf.find('\n');
    if (nl == std::string::npos) return false;
    line = buf.substr(0, nl);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    buf.erase(0, nl + 1);
    return true;
}

} // namespace

bool isSupportedBaud(int baud) {
    speed_t s;
    return baudConstant(baud, s);
}

Result<std::unique_ptr<PosixSerialLink>> PosixSerialLink::open(const std::string& port, int baud) {
    speed_t speed;
    if (!baudConstant(baud, speed)) {
        return Error("unsupported baud rate " + std::to_string(baud), ErrorKind::ConfigError);
    }
    if (port.empty()) {
        return Error("serial port path is empty", ErrorKind::ConfigError);
    }

    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int e = errno;
        return Error("open " + port + ": " + errnoText(e), ErrorKind::LinkIoError, e);
    }

    // One session per physical link
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int e = errno;
        ::close(fd);
        if (e == EWOULDBLOCK) {
            return Error("serial port " + port + " is already in use", ErrorKind::ConfigError, e);
        }
        return Error("flock " + port + ": " + errnoText(e), ErrorKind::LinkIoError, e);
    }

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        int e = errno;
        ::close(fd);
        return Error("tcgetattr " + port + ": " + errnoText(e), ErrorKind::LinkIoError, e);
    }
    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);
    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        int e = errno;
        ::close(fd);
        return Error("tcsetattr " + port + ": " + errnoText(e), ErrorKind::LinkIoError, e);
    }
    tcflush(fd, TCIOFLUSH);

    RLOG_INFO(TAG, "opened %s @ %d baud", port.c_str(), baud);
    return std::unique_ptr<PosixSerialLink>(new PosixSerialLink(fd, port, baud));
}

PosixSerialLink::PosixSerialLink(int fd, std::string port, int baud)
    : fd_(fd), port_(std::move(port)), baud_(baud) {}

PosixSerialLink::~PosixSerialLink() {
    close();
}

// No tcdrain: it cannot be bounded, and a device that stops reading would
// hold the session worker forever. Bytes queued in the driver count as sent.
Result<void> PosixSerialLink::write(const std::vector<uint8_t>& bytes, Clock::time_point deadline) {
    if (fd_ < 0) return Error("write on closed link " + port_, ErrorKind::SessionClosed);

    size_t off = 0;
    while (off < bytes.size()) {
        ssize_t n = ::write(fd_, bytes.data() + off, bytes.size() - off);
        if (n > 0) {
            off += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto now = Clock::now();
            if (now >= deadline) {
                return Error("write to " + port_ + " timed out after " + std::to_string(off) +
                             "/" + std::to_string(bytes.size()) + " bytes",
                             ErrorKind::LinkTimeout);
            }
            auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            pollfd p{fd_, POLLOUT, 0};
            int r = ::poll(&p, 1, (int)std::min<long long>(100, std::max<long long>(1, wait_ms)));
            if (r < 0 && errno != EINTR) {
                int e = errno;
                return Error("poll " + port_ + ": " + errnoText(e), ErrorKind::LinkIoError, e);
            }
            if (r > 0 && (p.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                return Error("serial port " + port_ + " hung up", ErrorKind::LinkIoError);
            }
            continue;
        }
        int e = errno;
        return Error("write " + port_ + ": " + errnoText(e), ErrorKind::LinkIoError, e);
    }
    return Ok();
}

Result<std::string> PosixSerialLink::readLine(Clock::time_point deadline) {
    if (fd_ < 0) return Error("read on closed link " + port_, ErrorKind::SessionClosed);

    std::string line;
    while (true) {
        if (takeLine(rx_, line)) return line;

        auto now = Clock::now();
        if (now >= deadline) {
            return Error("no response from " + port_, ErrorKind::LinkTimeout);
        }
        auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

        pollfd p{fd_, POLLIN, 0};
        int r = ::poll(&p, 1, (int)std::max<long long>(1, wait_ms));
        if (r < 0) {
            if (errno == EINTR) continue;
            int e = errno;
            return Error("poll " + port_ + ": " + errnoText(e), ErrorKind::LinkIoError, e);
        }
        if (r == 0) continue;
        if (p.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            return Error("serial port " + port_ + " hung up", ErrorKind::LinkIoError);
        }

        char buf[256];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            rx_.append(buf, (size_t)n);
        } else if (n == 0) {
            return Error("serial port " + port_ + " closed by device", ErrorKind::LinkIoError);
        } else if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            int e = errno;
            return Error("read " + port_ + ": " + errnoText(e), ErrorKind::LinkIoError, e);
        }
    }
}

size_t PosixSerialLink::drainInput() {
    size_t dropped = rx_.size();
    rx_.clear();
    if (fd_ < 0) return dropped;

    char buf[256];
    while (true) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            dropped += (size_t)n;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    tcflush(fd_, TCIFLUSH);
    if (dropped > 0) RLOG_DEBUG(TAG, "drained %zu stale bytes from %s", dropped, port_.c_str());
    return dropped;
}

void PosixSerialLink::close() {
    if (fd_ < 0) return;
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    RLOG_INFO(TAG, "closed %s", port_.c_str());
}

std::string PosixSerialLink::describe() const {
    return port_ + "@" + std::to_string(baud_);
}

} // namespace retina::device
