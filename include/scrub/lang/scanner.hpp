#pragma once

#include <scrub/lang/comment.hpp>
#include <optional>
#include <string>
#include <vector>

namespace scrub {

// Lexical class of the last character processed
enum class ScanMode {
    Normal,
    LineComment,
    BlockComment,
    StringLiteral,
    StringEscape,   // after a backslash inside "..."
    CharLiteral,
    CharEscape,     // after a backslash inside '...'
    RawString       // r"..." / r#"..."#
};

// State threaded from one scan_line() call to the next. Construct one per
// file, feed every line through it in order, and drop it at EOF.
struct ScanState {
    ScanMode mode = ScanMode::Normal;

    // Number of '#' marks that opened the current raw string
    size_t raw_fence = 0;

    // Line on which the open block comment started
    std::optional<int> block_start_line;

    // The active line comment is the only thing on its line
    bool full_line_comment = false;
};

struct ScanResult {
    std::string text;       // the line with comments removed
    CommentEvents events;   // comments removed on (or closed on) this line
};

// Scan one line (including its trailing '\n', if any) and advance `state`.
// Never fails: unterminated strings or comments leave `state` in a
// non-Normal mode, which the next call resumes from.
ScanResult scan_line(const std::string& line, int line_number, ScanState& state);

struct ScrubTextResult {
    std::string text;
    CommentEvents events;
    ScanState final_state;
};

// Scrub a whole in-memory text. The first `header_lines` lines are copied
// verbatim; line numbers in events count those lines.
ScrubTextResult scrub_text(const std::string& source, int header_lines = 0);

const char* scan_mode_name(ScanMode m);

} // namespace scrub
