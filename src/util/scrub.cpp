#include <scrub/scrub.hpp>
#include <scrub/log.hpp>
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace scrub {

namespace fs = std::filesystem;

size_t ScrubReport::line_comments() const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [](const CommentEvent& e) { return e.kind == CommentKind::Line; }));
}

size_t ScrubReport::block_comments() const {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(),
        [](const CommentEvent& e) { return e.kind == CommentKind::Block; }));
}

bool read_line(std::istream& in, std::string& line) {
    if (!std::getline(in, line)) return false;
    // getline stops at eof without a delimiter only on the final line
    if (!in.eof()) line += '\n';
    return true;
}

Result<ScrubReport> scrub_stream(std::istream& in, std::ostream* out, int header_lines) {
    ScrubReport report;
    std::string line;

    while (report.header_lines < header_lines && read_line(in, line)) {
        if (out) {
            *out << line;
            if (!*out) return io_error("write header line", "");
        }
        ++report.header_lines;
    }

    ScanState state;
    while (read_line(in, line)) {
        int line_number = report.header_lines + report.body_lines + 1;
        auto scanned = scan_line(line, line_number, state);
        if (out) {
            *out << scanned.text;
            if (!*out) return io_error("write processed line", "");
        }
        report.events.insert(report.events.end(),
                             scanned.events.begin(), scanned.events.end());
        ++report.body_lines;
    }

    if (in.bad()) {
        return io_error("read line for processing", "");
    }

    if (out) {
        out->flush();
        if (!*out) return io_error("flush output", "");
    }

    report.final_mode = state.mode;
    if (state.mode != ScanMode::Normal && state.mode != ScanMode::LineComment) {
        log::debug("input ended inside %s", scan_mode_name(state.mode));
    }
    return Result<ScrubReport>::ok(std::move(report));
}

Result<ScrubReport> scrub_file(const ScrubRequest& req) {
    std::error_code ec;
    if (!fs::exists(req.input, ec)) {
        return ScrubError{ScrubError::NotFound,
            "input file does not exist", "", req.input, 0};
    }
    if (!fs::is_regular_file(req.input, ec)) {
        return ScrubError{ScrubError::InvalidArg,
            "input path is not a file", "", req.input, 0};
    }

    errno = 0;
    std::ifstream in(req.input, std::ios::binary);
    if (!in.is_open()) {
        return io_error("open input file", req.input);
    }

    if (req.dry_run) {
        return scrub_stream(in, nullptr, req.header_lines);
    }

    if (!req.output) {
        return scrub_stream(in, &std::cout, req.header_lines);
    }

    // Truncating the output would empty the input before it is read
    if (fs::exists(*req.output, ec) && fs::equivalent(req.input, *req.output, ec)) {
        return ScrubError{ScrubError::InvalidArg,
            "output file is the same as the input file",
            "write to a different path, or omit -o to print to stdout",
            *req.output, 0};
    }

    errno = 0;
    std::ofstream out(*req.output, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return io_error("create output file", *req.output);
    }

    auto r = scrub_stream(in, &out, req.header_lines);
    SCRUB_TRY(r);
    log::debug("wrote %s", req.output->c_str());
    return r;
}

} // namespace scrub
