#pragma once

#include <scrub/result.hpp>
#include <string>
#include <vector>

namespace scrub {

struct HeaderOptions {
    int max_lines = 50;       // hard cap on lines inspected
    int preview_lines = 10;   // header lines shown in the preview
    int blank_run = 2;        // more consecutive blanks than this end a header
    // A trimmed line starting with one of these plus a space is code
    std::vector<std::string> code_keywords = {
        "use", "mod", "pub", "fn", "struct", "enum", "impl", "trait"
    };
};

struct HeaderDecision {
    int line_count = 0;     // 0 means no header detected
    std::string preview;    // header text shown before asking the user
};

// Classification of a single line while looking for a header
enum class HeaderLine {
    Doc,       // //!, /// or #![
    Comment,   // // or /*, or inside a block comment opened above
    Blank,
    Code,      // starts with a recognized declaration keyword
    Other
};

// Guess how many leading lines of `source` form a license/doc header.
HeaderDecision detect_header(const std::string& source,
                             const HeaderOptions& opts = HeaderOptions{});

// Same, reading at most opts.max_lines lines from a file.
Result<HeaderDecision> detect_header_file(const std::string& path,
                                          const HeaderOptions& opts = HeaderOptions{});

} // namespace scrub
