#include <scrub/lang/header.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

namespace scrub {

namespace {

// Lines past this index that are neither comment nor code end a header
constexpr int kLooseLines = 3;

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

struct HeaderDetector {
    const HeaderOptions& opts;
    std::vector<std::string> lines;
    int scanned = 0;
    int blank_run = 0;
    bool saw_comment = false;
    bool in_block = false;
    int cutoff = -1;

    explicit HeaderDetector(const HeaderOptions& o) : opts(o) {}

    HeaderLine classify(const std::string& trimmed) {
        if (in_block) {
            if (trimmed.find("*/") != std::string::npos) in_block = false;
            return HeaderLine::Comment;
        }
        if (trimmed.empty()) return HeaderLine::Blank;
        if (starts_with(trimmed, "//!") || starts_with(trimmed, "///") ||
            starts_with(trimmed, "#![")) {
            return HeaderLine::Doc;
        }
        if (starts_with(trimmed, "//")) return HeaderLine::Comment;
        if (starts_with(trimmed, "/*")) {
            if (trimmed.find("*/", 2) == std::string::npos) in_block = true;
            return HeaderLine::Comment;
        }
        for (const auto& kw : opts.code_keywords) {
            if (starts_with(trimmed, kw + " ")) return HeaderLine::Code;
        }
        return HeaderLine::Other;
    }

    // Returns false once the header boundary is known.
    bool feed(std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++scanned;
        lines.push_back(line);

        switch (classify(trim(line))) {
        case HeaderLine::Blank:
            ++blank_run;
            if (blank_run > opts.blank_run && saw_comment) {
                cutoff = scanned - blank_run;
                return false;
            }
            break;
        case HeaderLine::Doc:
        case HeaderLine::Comment:
            blank_run = 0;
            saw_comment = true;
            break;
        case HeaderLine::Code:
            cutoff = scanned - 1;
            return false;
        case HeaderLine::Other:
            blank_run = 0;
            if (scanned > kLooseLines && saw_comment) {
                cutoff = scanned - 1;
                return false;
            }
            break;
        }

        return scanned < opts.max_lines;
    }

    HeaderDecision finish() {
        if (cutoff < 0) {
            cutoff = saw_comment ? scanned : 0;
        }

        HeaderDecision decision;
        decision.line_count = cutoff;

        int shown = std::min(cutoff, opts.preview_lines);
        for (int i = 0; i < shown; ++i) {
            if (i > 0) decision.preview += '\n';
            decision.preview += lines[static_cast<size_t>(i)];
        }
        if (cutoff > shown) {
            if (shown > 0) decision.preview += '\n';
            decision.preview += "... (" + std::to_string(cutoff - shown) + " more lines)";
        }
        return decision;
    }
};

} // namespace

HeaderDecision detect_header(const std::string& source, const HeaderOptions& opts) {
    HeaderDetector detector(opts);
    size_t start = 0;
    while (start < source.size()) {
        size_t eol = source.find('\n', start);
        if (eol == std::string::npos) eol = source.size();
        bool more = detector.feed(source.substr(start, eol - start));
        start = eol + 1;
        if (!more) break;
    }
    return detector.finish();
}

Result<HeaderDecision> detect_header_file(const std::string& path, const HeaderOptions& opts) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return io_error("open file for header detection", path);
    }

    HeaderDetector detector(opts);
    std::string line;
    while (std::getline(file, line)) {
        if (!detector.feed(line)) break;
    }
    if (file.bad()) {
        return io_error("read file for header detection", path);
    }
    return Result<HeaderDecision>::ok(detector.finish());
}

} // namespace scrub
