#include "ProtocolCodec.h"
#include "ErrorCodes.h"
#include <cctype>

namespace WatchBridge {

namespace {
    bool isUnreserved(unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-' || c == '~' || c == '/';
    }

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
}

std::string ProtocolCodec::quote(const std::string& value) {
    static const char HEX[] = "0123456789ABCDEF";

    std::string result;
    result.reserve(value.size());
    for (unsigned char c : value) {
        if (isUnreserved(c)) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += HEX[c >> 4];
            result += HEX[c & 0x0F];
        }
    }
    return result;
}

std::string ProtocolCodec::unquote(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        result += value[i];
    }
    return result;
}

Result<Command> ProtocolCodec::parse(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    size_t start = text.find_first_not_of(' ');
    if (start == std::string::npos) {
        return ErrorRegistry::createError(ErrorCode::MALFORMED_COMMAND, "empty line", "Protocol");
    }
    text.erase(0, start);

    Command command;
    size_t pos = 0;
    size_t space = text.find(' ');
    command.name = text.substr(0, space);
    while (space != std::string::npos) {
        pos = space + 1;
        space = text.find(' ', pos);
        command.args.push_back(unquote(text.substr(pos, space == std::string::npos ? std::string::npos
                                                                                 : space - pos)));
    }
    return command;
}

std::string ProtocolCodec::format(const std::string& name, const std::vector<std::string>& args) {
    std::string line = name;
    for (const auto& arg : args) {
        line += ' ';
        line += quote(arg);
    }
    return line;
}

} // namespace WatchBridge
