#include "lasertrack/actuator/ActuatorProtocol.hpp"

#include "lasertrack/core/Errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>

namespace lasertrack::actuator {

namespace {

// Cursor over one protocol line. Every consume* returns false without
// advancing past the failure point; callers bail out on the first false.
class Scanner {
public:
    explicit Scanner(std::string_view text) : text(text) {}

    void skipSpace() {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    bool consume(char expected) {
        skipSpace();
        if (pos < text.size() && text[pos] == expected) {
            ++pos;
            return true;
        }
        return false;
    }

    bool consumeWord(std::string_view word) {
        skipSpace();
        if (text.substr(pos, word.size()) == word) {
            pos += word.size();
            return true;
        }
        return false;
    }

    bool number(double& out) {
        skipSpace();
        const std::size_t start = pos;
        std::size_t cursor = pos;
        if (cursor < text.size() && (text[cursor] == '+' || text[cursor] == '-')) {
            ++cursor;
        }
        const std::size_t intStart = cursor;
        cursor = digits(cursor);
        bool haveDigits = cursor > intStart;
        if (cursor < text.size() && text[cursor] == '.') {
            const std::size_t fracStart = ++cursor;
            cursor = digits(cursor);
            haveDigits = haveDigits || cursor > fracStart;
        }
        if (!haveDigits) {
            return false;
        }
        if (cursor < text.size() && (text[cursor] == 'e' || text[cursor] == 'E')) {
            std::size_t expCursor = cursor + 1;
            if (expCursor < text.size() && (text[expCursor] == '+' || text[expCursor] == '-')) {
                ++expCursor;
            }
            const std::size_t expDigits = digits(expCursor);
            if (expDigits == expCursor) {
                return false;
            }
            cursor = expDigits;
        }

        const std::string token(text.substr(start, cursor - start));
        char* end = nullptr;
        const double value = std::strtod(token.c_str(), &end);
        if (end != token.c_str() + token.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        pos = cursor;
        return true;
    }

    bool pair(double& first, double& second) {
        return consume('(') && number(first) && consume(',') && number(second) && consume(')');
    }

    bool atEnd() {
        skipSpace();
        return pos == text.size();
    }

private:
    std::size_t digits(std::size_t cursor) const {
        while (cursor < text.size() && std::isdigit(static_cast<unsigned char>(text[cursor]))) {
            ++cursor;
        }
        return cursor;
    }

    std::string_view text;
    std::size_t pos = 0;
};

struct Keyword {
    std::string_view word;
    CommandKind kind;
};

constexpr Keyword KEYWORDS[] = {
    {"on", CommandKind::LaserOn},
    {"off", CommandKind::LaserOff},
    {"angles", CommandKind::QueryAngles},
    {"limits", CommandKind::QueryLimits},
    {"test", CommandKind::SelfTestStart},
    {"stop", CommandKind::SelfTestStop},
    {"version", CommandKind::Version},
    {"quit", CommandKind::Quit},
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::ostringstream numberStream() {
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::setprecision(8);
    return os;
}

std::error_code badRequest() {
    return std::make_error_code(std::errc::invalid_argument);
}

std::error_code badReply() {
    return make_error_code(errc::malformed_reply);
}

} // namespace

const char* toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::SetAngles:     return "set-angles";
        case CommandKind::SetNormalized: return "set-normalized";
        case CommandKind::LaserOn:       return "on";
        case CommandKind::LaserOff:      return "off";
        case CommandKind::QueryAngles:   return "angles";
        case CommandKind::QueryLimits:   return "limits";
        case CommandKind::SelfTestStart: return "test";
        case CommandKind::SelfTestStop:  return "stop";
        case CommandKind::Version:       return "version";
        case CommandKind::Quit:          return "quit";
    }
    return "unknown";
}

ActuatorCommand ActuatorCommand::setAngles(const core::ServoAngles& angles) {
    return ActuatorCommand{CommandKind::SetAngles, angles.h, angles.v};
}

ActuatorCommand ActuatorCommand::setNormalized(const core::NormalizedPoint& point) {
    return ActuatorCommand{CommandKind::SetNormalized, point.x, point.y};
}

ActuatorCommand ActuatorCommand::simple(CommandKind kind) {
    return ActuatorCommand{kind, 0.0, 0.0};
}

namespace protocol {

std::string encodeCommand(const ActuatorCommand& command) {
    switch (command.kind) {
        case CommandKind::SetAngles: {
            auto os = numberStream();
            os << '(' << command.first << ',' << command.second << ')';
            return os.str();
        }
        case CommandKind::SetNormalized: {
            auto os = numberStream();
            os << "norm(" << command.first << ',' << command.second << ')';
            return os.str();
        }
        default:
            return toString(command.kind);
    }
}

expected<ActuatorCommand> parseCommand(std::string_view line) {
    const auto text = trim(line);

    for (const auto& keyword : KEYWORDS) {
        if (text == keyword.word) {
            return ActuatorCommand::simple(keyword.kind);
        }
    }

    Scanner scanner(text);
    ActuatorCommand command;
    if (scanner.consumeWord("norm")) {
        command.kind = CommandKind::SetNormalized;
    } else {
        command.kind = CommandKind::SetAngles;
    }
    if (!scanner.pair(command.first, command.second) || !scanner.atEnd()) {
        return unexpected(badRequest());
    }
    return command;
}

std::string encodeAck(bool accepted) {
    return accepted ? "1" : "0";
}

std::string encodeAngles(const core::ServoAngles& angles) {
    return encodeCommand(ActuatorCommand::setAngles(angles));
}

std::string encodeLimits(const core::ServoLimits& limits) {
    auto os = numberStream();
    os << "((" << limits.horizontal.min << ',' << limits.horizontal.max << "),("
       << limits.vertical.min << ',' << limits.vertical.max << "))";
    return os.str();
}

std::string encodeVersion(int version) {
    return std::to_string(version);
}

expected<bool> parseAck(std::string_view line) {
    const auto text = trim(line);
    if (text == "1") return true;
    if (text == "0") return false;
    return unexpected(badReply());
}

expected<core::ServoAngles> parseAngles(std::string_view line) {
    Scanner scanner(line);
    core::ServoAngles angles;
    if (!scanner.pair(angles.h, angles.v) || !scanner.atEnd()) {
        return unexpected(badReply());
    }
    return angles;
}

expected<core::ServoLimits> parseLimits(std::string_view line) {
    Scanner scanner(line);
    core::ServoLimits limits;
    const bool ok = scanner.consume('(')
        && scanner.pair(limits.horizontal.min, limits.horizontal.max)
        && scanner.consume(',')
        && scanner.pair(limits.vertical.min, limits.vertical.max)
        && scanner.consume(')')
        && scanner.atEnd();
    if (!ok) {
        return unexpected(badReply());
    }
    if (limits.horizontal.min > limits.horizontal.max || limits.vertical.min > limits.vertical.max) {
        return unexpected(badReply());
    }
    return limits;
}

expected<int> parseVersion(std::string_view line) {
    const auto text = trim(line);
    if (text.empty() || text.size() > 4) {
        return unexpected(badReply());
    }
    int version = 0;
    for (const char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return unexpected(badReply());
        }
        version = version * 10 + (c - '0');
    }
    return version;
}

} // namespace protocol

} // namespace lasertrack::actuator
