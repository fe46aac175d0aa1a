// =============================================================================
// DeviceSession — implementation
// =============================================================================
#include "device/device_session.hpp"
#include "event_bus.hpp"
#include "retina_log.hpp"

#include <algorithm>

static constexpr const char* TAG = "session";

// settle() gives up after this many guard intervals of continuous chatter
static constexpr int kSettleWindows = 4;

namespace retina::device {

const char* sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Idle:        return "Idle";
        case SessionState::Sending:     return "Sending";
        case SessionState::AwaitingAck: return "AwaitingAck";
        case SessionState::Retrying:    return "Retrying";
        case SessionState::Failed:      return "Failed";
        case SessionState::Broken:      return "Broken";
        case SessionState::Closed:      return "Closed";
    }
    return "?";
}

const char* dispatchOutcomeToString(DispatchOutcome o) {
    switch (o) {
        case DispatchOutcome::None:     return "none";
        case DispatchOutcome::InFlight: return "in_flight";
        case DispatchOutcome::Success:  return "success";
        case DispatchOutcome::Failed:   return "failed";
        case DispatchOutcome::Broken:   return "broken";
    }
    return "?";
}

Result<void> validateSessionConfig(const SessionConfig& cfg) {
    if (cfg.max_retries < 0 || cfg.max_retries > 100) {
        return Error("max_retries must be in [0, 100], got " + std::to_string(cfg.max_retries),
                     ErrorKind::ConfigError);
    }
    return Ok();
}

DeviceSession::DeviceSession(std::unique_ptr<SerialLink> link, const SessionConfig& config,
                             EventBus* bus)
    : link_(std::move(link)), config_(config), bus_(bus) {
    RLOG_INFO(TAG, "session on %s (max_retries=%d)",
              link_ ? link_->describe().c_str() : "<none>", config_.max_retries);
    worker_ = std::thread(&DeviceSession::workerLoop, this);
}

DeviceSession::~DeviceSession() {
    close();
}

// =============================================================================
// Host-side API
// =============================================================================

Result<void> DeviceSession::submit(Command cmd) {
    if (!cmd.valid()) {
        return Error("invalid command '" + cmd.label + "'", ErrorKind::ConfigError);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return Error("session closed", ErrorKind::SessionClosed);
        if (broken_) {
            return Error("session broken: " + broken_->message, ErrorKind::LinkIoError,
                         broken_->code);
        }
        if (in_flight_) {
            return Error("command '" + status_.last_label + "' still in flight",
                         ErrorKind::DeviceBusy);
        }
        in_flight_ = true;
        status_.in_flight = true;
        status_.last_label = cmd.label;
        status_.last_outcome = DispatchOutcome::InFlight;
        status_.last_attempts = 0;
        status_.last_error.reset();
        status_.submitted++;
        last_result_ = Ok();
        slot_ = std::move(cmd);
    }
    work_cv_.notify_one();
    return Ok();
}

Result<void> DeviceSession::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!done_cv_.wait_for(lock, timeout, [this] { return !in_flight_; })) {
        return Error("command '" + status_.last_label + "' still in flight",
                     ErrorKind::DeviceBusy);
    }
    return last_result_;
}

Result<void> DeviceSession::send(Command cmd, std::chrono::milliseconds wait) {
    auto r = submit(std::move(cmd));
    if (r.is_err()) return r;
    return waitForCompletion(wait);
}

DispatchStatus DeviceSession::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    DispatchStatus s = status_;
    s.state = state_;
    return s;
}

SessionState DeviceSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool DeviceSession::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::optional<Error> DeviceSession::linkFailure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!broken_) return std::nullopt;
    return Error("session broken: " + broken_->message, ErrorKind::LinkIoError,
                 broken_->code);
}

void DeviceSession::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
    }
    work_cv_.notify_all();
    if (worker_.joinable()) worker_.join();

    if (link_) link_->close();

    SessionState old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = state_;
        if (state_ != SessionState::Broken) state_ = SessionState::Closed;
        if (in_flight_) {
            // Submitted but never picked up
            in_flight_ = false;
            status_.in_flight = false;
            status_.last_outcome = DispatchOutcome::Failed;
            last_result_ = Error("session closed", ErrorKind::SessionClosed);
        }
    }
    done_cv_.notify_all();
    if (old != SessionState::Broken && old != SessionState::Closed) {
        RLOG_INFO(TAG, "session closed");
    }
}

// =============================================================================
// Worker
// =============================================================================

void DeviceSession::setState(SessionState s, const std::string& label, int retries) {
    SessionState old;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        old = state_;
        state_ = s;
    }
    if (old == s) return;

    RLOG_TRACE(TAG, "%s -> %s [%s]", sessionStateToString(old), sessionStateToString(s),
               label.c_str());
    if (bus_) {
        SessionStateEvent ev;
        ev.old_state = static_cast<int>(old);
        ev.new_state = static_cast<int>(s);
        ev.label = label;
        ev.retries = retries;
        ev.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
        bus_->publish(ev);
    }
}

void DeviceSession::workerLoop() {
    while (true) {
        Command cmd;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return stopping_ || slot_.has_value(); });
            if (stopping_) return;
            cmd = std::move(*slot_);
            slot_.reset();
        }

        int attempts = 0;
        Result<void> result = dispatch(cmd, attempts);

        DispatchEvent ev;
        ev.label = cmd.label;
        ev.attempts = attempts;
        ev.success = result.is_ok();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status_.last_attempts = attempts;
            status_.total_writes += attempts;
            if (result.is_ok()) {
                status_.last_outcome = DispatchOutcome::Success;
                status_.succeeded++;
            } else {
                const Error& e = result.error();
                status_.last_error = e;
                status_.failed++;
                status_.last_outcome = e.kind == ErrorKind::LinkIoError
                                           ? DispatchOutcome::Broken
                                           : DispatchOutcome::Failed;
                ev.error = e.message;
                ev.error_kind = e.kind;
            }
            last_result_ = result;
            in_flight_ = false;
            status_.in_flight = false;
        }
        done_cv_.notify_all();
        if (bus_) bus_->publish(ev);

        std::lock_guard<std::mutex> lock(mutex_);
        if (broken_) return;
    }
}

Error DeviceSession::markBroken(const Error& e, const std::string& label, int retries) {
    RLOG_ERROR(TAG, "link failure on '%s': %s", label.c_str(), e.message.c_str());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        broken_ = e;
    }
    setState(SessionState::Broken, label, retries);
    return Error(e.message, ErrorKind::LinkIoError, e.code);
}

// Discards input until nothing has arrived for `guard`.
Result<void> DeviceSession::settle(std::chrono::milliseconds guard) {
    const auto give_up = SerialLink::Clock::now() + guard * kSettleWindows;
    int discarded = 0;
    while (true) {
        auto quiet_until = SerialLink::Clock::now() + guard;
        if (quiet_until > give_up) {
            return Error("link did not go quiet (" + std::to_string(discarded) +
                         " stale line(s) discarded)", ErrorKind::LinkTimeout);
        }
        auto line = link_->readLine(quiet_until);
        if (line.is_ok()) {
            discarded++;
            RLOG_DEBUG(TAG, "discarded late reply '%s'", line.value().c_str());
            continue;
        }
        if (line.error().kind == ErrorKind::LinkTimeout) return Ok();
        return line.error();
    }
}

Result<void> DeviceSession::dispatch(const Command& cmd, int& attempts) {
    int retries = 0;
    SessionState st = SessionState::Sending;
    std::string cause;

    while (true) {
        switch (st) {
            case SessionState::Sending: {
                setState(SessionState::Sending, cmd.label, retries);
                if (settle_guard_.count() > 0) {
                    auto q = settle(std::max(settle_guard_, cmd.timeout));
                    if (q.is_err()) {
                        const Error& e = q.error();
                        if (e.kind == ErrorKind::LinkIoError || e.kind == ErrorKind::SessionClosed) {
                            return markBroken(e, cmd.label, retries);
                        }
                        cause = e.message;
                        retries++;
                        st = SessionState::Retrying;
                        break;
                    }
                    settle_guard_ = std::chrono::milliseconds(0);
                }
                link_->drainInput();
                auto w = link_->write(cmd.payload, SerialLink::Clock::now() + cmd.timeout);
                if (w.is_err()) {
                    const Error& e = w.error();
                    if (e.kind == ErrorKind::LinkIoError || e.kind == ErrorKind::SessionClosed) {
                        return markBroken(e, cmd.label, retries);
                    }
                    // Part of the line may have gone out
                    settle_guard_ = cmd.timeout;
                    cause = e.message;
                    retries++;
                    st = SessionState::Retrying;
                    break;
                }
                attempts++;
                st = SessionState::AwaitingAck;
                break;
            }

            case SessionState::AwaitingAck: {
                setState(SessionState::AwaitingAck, cmd.label, retries);
                auto deadline = SerialLink::Clock::now() + cmd.timeout;
                auto line = link_->readLine(deadline);
                if (line.is_ok()) {
                    if (cmd.accepts(line.value())) {
                        RLOG_DEBUG(TAG, "'%s' acknowledged after %d attempt(s)",
                                   cmd.label.c_str(), attempts);
                        setState(SessionState::Idle, cmd.label, retries);
                        return Ok();
                    }
                    cause = "unexpected response '" + line.value() + "'";
                } else {
                    const Error& e = line.error();
                    if (e.kind == ErrorKind::LinkIoError || e.kind == ErrorKind::SessionClosed) {
                        return markBroken(e, cmd.label, retries);
                    }
                    cause = "no acknowledgement within " +
                            std::to_string(cmd.timeout.count()) + " ms";
                }
                settle_guard_ = cmd.timeout;
                retries++;
                RLOG_WARN(TAG, "'%s' attempt %d: %s", cmd.label.c_str(), attempts, cause.c_str());
                st = SessionState::Retrying;
                break;
            }

            case SessionState::Retrying: {
                setState(SessionState::Retrying, cmd.label, retries);
                bool stop;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    stop = stopping_;
                }
                if (retries <= config_.max_retries && !stop) {
                    st = SessionState::Sending;
                } else {
                    st = SessionState::Failed;
                }
                break;
            }

            case SessionState::Failed: {
                setState(SessionState::Failed, cmd.label, retries);
                RLOG_ERROR(TAG, "'%s' failed after %d attempt(s): %s",
                           cmd.label.c_str(), attempts, cause.c_str());
                setState(SessionState::Idle, cmd.label, retries);
                return Error("'" + cmd.label + "' failed after " + std::to_string(attempts) +
                             " attempt(s): " + cause, ErrorKind::DispatchFailed);
            }

            default:
                return Error("unexpected session state", ErrorKind::Generic);
        }
    }
}

} // namespace retina::device
