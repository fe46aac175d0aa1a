// =============================================================================
// Retina - Device Command
// =============================================================================
// One instruction for the device: the bytes to write, the acknowledgement
// predicate applied to each response line, and the per-attempt timeout.
// Owned by DeviceSession for the duration of a send/ack cycle.
// =============================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace retina::device {

// Called with one response line (terminator stripped). true = acknowledged.
using AckPredicate = std::function<bool(const std::string& line)>;

struct Command {
    std::string label;                     // for logs / status
    std::vector<uint8_t> payload;          // written verbatim
    AckPredicate accepts;                  // required
    std::chrono::milliseconds timeout{250};

    bool valid() const { return !payload.empty() && static_cast<bool>(accepts) &&
                                timeout.count() > 0; }
};

// Line must equal token exactly
inline AckPredicate expectLine(std::string token) {
    return [token = std::move(token)](const std::string& line) { return line == token; };
}

} // namespace retina::device
