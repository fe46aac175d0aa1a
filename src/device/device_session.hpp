#pragma once
// =============================================================================
// DeviceSession — acknowledged, retried command dispatch over one SerialLink
// =============================================================================
// State machine (per command):
//
//   Idle -> Sending -> AwaitingAck -> Idle                 (acknowledged)
//                          |
//                          +-> Retrying -> Sending          (retries <= max)
//                                   |
//                                   +-> Failed -> Idle      (DispatchFailed)
//
//   any -> Broken on LinkIoError (terminal for the session)
//
// A worker thread owns the link; submit() hands it a command through a
// single-slot channel and is rejected with DeviceBusy while one is in flight.
// After an attempt that was not acknowledged, the link must stay quiet for a
// full command timeout before the next write; lines that arrive meanwhile are
// discarded. Together with draining input before every write, a late
// acknowledgement of an earlier attempt cannot satisfy a later command.
// =============================================================================
#include "device/command.hpp"
#include "device/serial_link.hpp"
#include "result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace retina {
class EventBus;
}

namespace retina::device {

enum class SessionState {
    Idle = 0,
    Sending,
    AwaitingAck,
    Retrying,
    Failed,
    Broken,
    Closed
};

const char* sessionStateToString(SessionState s);

struct SessionConfig {
    int max_retries = 2;  // writes per command = max_retries + 1
};

Result<void> validateSessionConfig(const SessionConfig& cfg);

enum class DispatchOutcome { None, InFlight, Success, Failed, Broken };

const char* dispatchOutcomeToString(DispatchOutcome o);

// Snapshot for the host; plain data
struct DispatchStatus {
    SessionState state = SessionState::Idle;
    bool in_flight = false;
    std::string last_label;
    DispatchOutcome last_outcome = DispatchOutcome::None;
    int last_attempts = 0;
    std::optional<Error> last_error;
    uint64_t submitted = 0;
    uint64_t succeeded = 0;
    uint64_t failed = 0;
    uint64_t total_writes = 0;
};

class DeviceSession {
public:
    // bus may be nullptr. The session owns the link and starts its worker.
    DeviceSession(std::unique_ptr<SerialLink> link, const SessionConfig& config,
                  EventBus* bus = nullptr);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    // Non-blocking. DeviceBusy if a command is in flight, LinkIoError once
    // broken, SessionClosed after close(), ConfigError for an invalid command.
    Result<void> submit(Command cmd);

    // Outcome of the most recent command once it is terminal. DeviceBusy if
    // it is still in flight when the timeout expires.
    Result<void> waitForCompletion(std::chrono::milliseconds timeout);

    // submit + waitForCompletion (CLI, tests)
    Result<void> send(Command cmd, std::chrono::milliseconds wait);

    DispatchStatus status() const;
    SessionState state() const;
    bool busy() const;

    // The LinkIoError that broke the session, if any
    std::optional<Error> linkFailure() const;

    // Stops the worker (after the current attempt) and closes the link.
    void close();

private:
    void workerLoop();
    Result<void> dispatch(const Command& cmd, int& attempts);
    Result<void> settle(std::chrono::milliseconds guard);
    Error markBroken(const Error& e, const std::string& label, int retries);
    void setState(SessionState s, const std::string& label, int retries);

    std::unique_ptr<SerialLink> link_;
    const SessionConfig config_;
    EventBus* bus_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::optional<Command> slot_;
    bool in_flight_ = false;
    bool stopping_ = false;
    std::optional<Error> broken_;
    SessionState state_ = SessionState::Idle;
    DispatchStatus status_;
    Result<void> last_result_;

    // Worker only. Non-zero while a reply to an unacknowledged attempt may
    // still be on the wire.
    std::chrono::milliseconds settle_guard_{0};

    std::thread worker_;
};

} // namespace retina::device
