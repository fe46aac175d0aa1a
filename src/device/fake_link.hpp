#pragma once
// =============================================================================
// FakeLink — in-process keyboard bridge simulator (no hardware required)
// =============================================================================
// write() parses outgoing command lines and schedules a response according to
// the configured Behavior; readLine() returns responses once they are due.
// Used by --simulate and by the device tests.
// =============================================================================
#include "device/serial_link.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace retina::device {

class FakeLink : public SerialLink {
public:
    enum class Mode {
        Ack,        // every command line is acknowledged
        Silent,     // nothing is ever answered
        Malformed,  // every command line gets a garbage reply
        AckAfter,   // the first `fail_count` writes are ignored, then Ack
        IoError     // write fails with LinkIoError once `fail_count` writes succeeded
    };

    struct Behavior {
        Mode mode = Mode::Ack;
        std::string ack = "OK";
        std::string garbage = "ERR";
        int fail_count = 0;
        std::chrono::milliseconds reply_delay{0};
    };

    struct Stats {
        uint64_t writes = 0;
        uint64_t bytes_written = 0;
        uint64_t replies_queued = 0;
        uint64_t bytes_drained = 0;
        int peak_concurrent_writes = 0;
    };

    // Returns the reply for one received line, or nullopt for silence.
    // Overrides Behavior when set.
    using Responder = std::function<std::optional<std::string>(const std::string& line,
                                                               uint64_t write_index)>;

    FakeLink();
    explicit FakeLink(Behavior behavior);

    void setBehavior(const Behavior& behavior);
    void setResponder(Responder responder);

    // Queue an unsolicited line, readable immediately
    void injectLine(const std::string& line);

    Stats stats() const;
    std::vector<std::string> writtenLines() const;

    Result<void> write(const std::vector<uint8_t>& bytes, Clock::time_point deadline) override;
    Result<std::string> readLine(Clock::time_point deadline) override;
    size_t drainInput() override;
    void close() override;
    bool isOpen() const override;
    std::string describe() const override { return "fake"; }

private:
    struct Pending {
        Clock::time_point due;
        std::string line;
    };

    void enqueue(Pending p);
    std::optional<std::string> replyFor(const std::string& line, uint64_t write_index) const;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    Behavior behavior_;
    Responder responder_;
    bool open_ = true;
    int writers_ = 0;
    Stats stats_;
    std::deque<Pending> pending_;
    std::vector<std::string> written_;
    std::string partial_;  // incomplete outgoing line
};

} // namespace retina::device
