#pragma once

#include <vector>

namespace scrub {

// Comment kinds removed by the scanner
enum class CommentKind {
    Line,   // // line comment
    Block   // /* block comment */, possibly spanning lines
};

// One removed comment. Line numbers are 1-based and inclusive; a line
// comment always has start_line == end_line.
struct CommentEvent {
    int start_line = 0;
    int end_line = 0;
    CommentKind kind = CommentKind::Line;

    bool operator==(const CommentEvent& other) const {
        return start_line == other.start_line && end_line == other.end_line &&
               kind == other.kind;
    }
    bool operator!=(const CommentEvent& other) const { return !(*this == other); }
};

using CommentEvents = std::vector<CommentEvent>;

const char* comment_kind_name(CommentKind k);

} // namespace scrub
