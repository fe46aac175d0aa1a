// =============================================================================
// KeyboardProtocol — key code table + command line encoding
// =============================================================================
#include "device/keyboard_protocol.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace retina::device {

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

int keyCode(const std::string& name) {
    static const std::unordered_map<std::string, int> kNamed = {
        {"space", 32},     {"?", 63},
        {"ctrl", 128},     {"shift", 129},   {"alt", 130},
        {"enter", 176},    {"esc", 177},     {"backspace", 178},
        {"right", 215},    {"left", 216},    {"down", 217},    {"up", 218},
        {"f1", 194},  {"f2", 195},  {"f3", 196},  {"f4", 197},
        {"f5", 198},  {"f6", 199},  {"f7", 200},  {"f8", 201},
        {"f9", 202},  {"f10", 203}, {"f11", 204}, {"f12", 205},
    };
    if (name.empty()) return 0;
    std::string k = toLower(name);
    if (k.size() == 1 && k[0] >= 'a' && k[0] <= 'z') return (int)k[0];
    auto it = kNamed.find(k);
    return it != kNamed.end() ? it->second : 0;
}

bool parseCommandType(const std::string& s, CommandSpec::Type& out) {
    static const struct { const char* name; CommandSpec::Type type; } kTypes[] = {
        {"press", CommandSpec::Type::Press},   {"keydown", CommandSpec::Type::KeyDown},
        {"keyup", CommandSpec::Type::KeyUp},   {"write", CommandSpec::Type::Write},
        {"hotkey", CommandSpec::Type::Hotkey}, {"raw", CommandSpec::Type::Raw},
    };
    std::string k = toLower(s);
    for (const auto& t : kTypes) {
        if (k == t.name) { out = t.type; return true; }
    }
    return false;
}

const char* commandTypeToString(CommandSpec::Type t) {
    switch (t) {
        case CommandSpec::Type::Press:   return "press";
        case CommandSpec::Type::KeyDown: return "keyDown";
        case CommandSpec::Type::KeyUp:   return "keyUp";
        case CommandSpec::Type::Write:   return "write";
        case CommandSpec::Type::Hotkey:  return "hotkey";
        case CommandSpec::Type::Raw:     return "raw";
    }
    return "?";
}

static bool hasLineBreak(const std::string& s) {
    return s.find_first_of("\r\n") != std::string::npos;
}

Result<Command> buildCommand(const CommandSpec& spec, const std::string& ack_token,
                             std::chrono::milliseconds timeout) {
    if (ack_token.empty() || hasLineBreak(ack_token)) {
        return Err<Command>("ack token must be a non-empty single line",
                            ErrorKind::TemplateLoadError);
    }
    if (timeout.count() <= 0) {
        return Err<Command>("command timeout must be > 0", ErrorKind::TemplateLoadError);
    }

    std::string line;
    switch (spec.type) {
        case CommandSpec::Type::Press:
        case CommandSpec::Type::KeyDown:
        case CommandSpec::Type::KeyUp: {
            if (spec.keys.size() != 1) {
                return Err<Command>(std::string(commandTypeToString(spec.type)) +
                                    " takes exactly one key", ErrorKind::TemplateLoadError);
            }
            int code = keyCode(spec.keys[0]);
            if (code == 0) {
                return Err<Command>("unknown key '" + spec.keys[0] + "'",
                                    ErrorKind::TemplateLoadError);
            }
            line = std::string(commandTypeToString(spec.type)) + "," + std::to_string(code);
            break;
        }
        case CommandSpec::Type::Hotkey: {
            if (spec.keys.empty()) {
                return Err<Command>("hotkey needs at least one key", ErrorKind::TemplateLoadError);
            }
            line = "hotkey";
            for (const auto& k : spec.keys) {
                int code = keyCode(k);
                if (code == 0) {
                    return Err<Command>("unknown key '" + k + "'", ErrorKind::TemplateLoadError);
                }
                line += "," + std::to_string(code);
            }
            break;
        }
        case CommandSpec::Type::Write:
            if (spec.text.empty() || hasLineBreak(spec.text)) {
                return Err<Command>("write needs a non-empty single-line text",
                                    ErrorKind::TemplateLoadError);
            }
            line = "write," + spec.text;
            break;
        case CommandSpec::Type::Raw:
            if (spec.text.empty() || hasLineBreak(spec.text)) {
                return Err<Command>("raw needs a non-empty single-line text",
                                    ErrorKind::TemplateLoadError);
            }
            line = spec.text;
            break;
    }

    Command cmd;
    cmd.label = line;
    line += '\n';
    cmd.payload.assign(line.begin(), line.end());
    cmd.accepts = expectLine(ack_token);
    cmd.timeout = timeout;
    return cmd;
}

} // namespace retina::device
