#pragma once
// =============================================================================
// KeyboardProtocol — HID keyboard bridge command lines
// =============================================================================
// The device is a microcontroller acting as a USB keyboard. Commands are
// newline-terminated ASCII lines:
//   press,<code>    keyDown,<code>    keyUp,<code>    write,<text>
// <code> is the Arduino Keyboard library key code.
// =============================================================================
#include "device/command.hpp"
#include "result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace retina::device {

// Key name (case-insensitive) -> Arduino key code, 0 if unknown.
// Single letters map to their lowercase ASCII value.
int keyCode(const std::string& name);

struct CommandSpec {
    enum class Type { Press, KeyDown, KeyUp, Write, Hotkey, Raw };

    Type type = Type::Press;
    std::vector<std::string> keys;  // Press/KeyDown/KeyUp: 1 key, Hotkey: 1..n
    std::string text;               // Write: phrase, Raw: line without terminator
};

// "press" / "keyDown" / "keyUp" / "write" / "hotkey" / "raw"
bool parseCommandType(const std::string& s, CommandSpec::Type& out);
const char* commandTypeToString(CommandSpec::Type t);

// Encodes the spec into a payload. TemplateLoadError for unknown keys,
// missing arguments or text containing line terminators.
Result<Command> buildCommand(const CommandSpec& spec, const std::string& ack_token,
                             std::chrono::milliseconds timeout);

} // namespace retina::device
