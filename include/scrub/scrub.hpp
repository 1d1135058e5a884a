#pragma once

#include <scrub/result.hpp>
#include <scrub/lang/scanner.hpp>
#include <istream>
#include <ostream>
#include <string>
#include <optional>

namespace scrub {

struct ScrubReport {
    int header_lines = 0;   // lines copied verbatim
    int body_lines = 0;     // lines fed through the scanner
    CommentEvents events;
    ScanMode final_mode = ScanMode::Normal;

    size_t line_comments() const;
    size_t block_comments() const;
};

// Read one line, keeping its '\n' if present. Returns false at end of input.
bool read_line(std::istream& in, std::string& line);

// Copy the first `header_lines` lines of `in` verbatim, then scrub the rest.
// Output goes to `out` unless it is null (dry run).
Result<ScrubReport> scrub_stream(std::istream& in, std::ostream* out, int header_lines);

struct ScrubRequest {
    std::string input;
    std::optional<std::string> output;  // stdout when absent
    int header_lines = 0;
    bool dry_run = false;
};

// File front end for scrub_stream(). The output file is only created when
// the input opened successfully and this is not a dry run.
Result<ScrubReport> scrub_file(const ScrubRequest& req);

} // namespace scrub
