// =============================================================================
// FakeLink — implementation
// =============================================================================
#include "device/fake_link.hpp"
#include "retina_log.hpp"

#include <algorithm>
#include <cerrno>
#include <optional>
#include <thread>

static constexpr const char* TAG = "FakeLink";

namespace retina::device {

FakeLink::FakeLink() : FakeLink(Behavior()) {}

FakeLink::FakeLink(Behavior behavior) : behavior_(std::move(behavior)) {}

void FakeLink::setBehavior(const Behavior& behavior) {
    std::lock_guard<std::mutex> lock(mutex_);
    behavior_ = behavior;
}

void FakeLink::setResponder(Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    responder_ = std::move(responder);
}

void FakeLink::injectLine(const std::string& line) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        enqueue({Clock::now(), line});
    }
    cv_.notify_all();
}

FakeLink::Stats FakeLink::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::vector<std::string> FakeLink::writtenLines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

// Keeps pending_ ordered by due time. Caller holds mutex_.
void FakeLink::enqueue(Pending p) {
    auto pos = std::upper_bound(pending_.begin(), pending_.end(), p.due,
                                [](Clock::time_point t, const Pending& x) { return t < x.due; });
    pending_.insert(pos, std::move(p));
}

std::optional<std::string> FakeLink::replyFor(const std::string& line, uint64_t write_index) const {
    if (responder_) return responder_(line, write_index);

    switch (behavior_.mode) {
        case Mode::Ack:
            return behavior_.ack;
        case Mode::Silent:
            return std::nullopt;
        case Mode::Malformed:
            return behavior_.garbage;
        case Mode::AckAfter:
            if (write_index <= (uint64_t)std::max(0, behavior_.fail_count)) return std::nullopt;
            return behavior_.ack;
        case Mode::IoError:
            return behavior_.ack;
    }
    return std::nullopt;
}

Result<void> FakeLink::write(const std::vector<uint8_t>& bytes, Clock::time_point /*deadline*/) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!open_) return Error("write on closed fake link", ErrorKind::SessionClosed);

    writers_++;
    stats_.peak_concurrent_writes = std::max(stats_.peak_concurrent_writes, writers_);

    if (behavior_.mode == Mode::IoError &&
        stats_.writes >= (uint64_t)std::max(0, behavior_.fail_count)) {
        writers_--;
        RLOG_DEBUG(TAG, "simulated I/O fault after %llu writes",
                   (unsigned long long)stats_.writes);
        return Error("simulated device disconnect", ErrorKind::LinkIoError, EIO);
    }

    stats_.writes++;
    stats_.bytes_written += bytes.size();
    const uint64_t index = stats_.writes;

    // Outgoing bytes may hold several lines or a partial one
    partial_.append(bytes.begin(), bytes.end());
    size_t nl;
    bool queued = false;
    while ((nl = partial_.find('\n')) != std::string::npos) {
        std::string line = partial_.substr(0, nl);
        partial_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        written_.push_back(line);

        // Responder runs under the lock; it must not call back into the link
        if (auto reply = replyFor(line, index)) {
            enqueue({Clock::now() + behavior_.reply_delay, *reply});
            stats_.replies_queued++;
            queued = true;
        }
    }

    // Widen the overlap window so concurrent writers are observable
    lock.unlock();
    std::this_thread::yield();
    lock.lock();
    writers_--;
    lock.unlock();

    if (queued) cv_.notify_all();
    return Ok();
}

Result<std::string> FakeLink::readLine(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (!open_) return Error("read on closed fake link", ErrorKind::SessionClosed);

        auto now = Clock::now();
        if (!pending_.empty() && pending_.front().due <= now) {
            std::string line = std::move(pending_.front().line);
            pending_.pop_front();
            return line;
        }
        if (now >= deadline) return Error("no response from fake link", ErrorKind::LinkTimeout);

        auto wake = deadline;
        if (!pending_.empty()) wake = std::min(wake, pending_.front().due);
        cv_.wait_until(lock, wake);
    }
}

size_t FakeLink::drainInput() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    auto now = Clock::now();
    // Only bytes that already arrived; replies still "on the wire" stay queued
    while (!pending_.empty() && pending_.front().due <= now) {
        dropped += pending_.front().line.size() + 1;
        pending_.pop_front();
    }
    stats_.bytes_drained += dropped;
    return dropped;
}

void FakeLink::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
        pending_.clear();
    }
    cv_.notify_all();
}

bool FakeLink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

} // namespace retina::device
