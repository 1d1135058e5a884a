#include <scrub/error.hpp>
#include <cerrno>
#include <cstring>

namespace scrub {

const char* ScrubError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string ScrubError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

ScrubError io_error(const std::string& action, const std::string& path) {
    std::string msg = "failed to " + action;
    if (errno != 0) {
        msg += ": ";
        msg += std::strerror(errno);
    }
    return ScrubError{ScrubError::IO, msg, "", path, 0};
}

} // namespace scrub
