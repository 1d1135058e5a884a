#pragma once

#include <string>

namespace scrub {

struct ScrubError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    ScrubError() = default;
    ScrubError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ScrubError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    ScrubError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// IO error for a failed file operation, with the current errno text.
// `action` reads like "open input file"; the path goes into `file`.
ScrubError io_error(const std::string& action, const std::string& path);

} // namespace scrub
