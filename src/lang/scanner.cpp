#include <scrub/lang/scanner.hpp>
#include <cctype>

namespace scrub {

const char* comment_kind_name(CommentKind k) {
    switch (k) {
    case CommentKind::Line:  return "line";
    case CommentKind::Block: return "block";
    }
    return "?";
}

const char* scan_mode_name(ScanMode m) {
    switch (m) {
    case ScanMode::Normal:        return "Normal";
    case ScanMode::LineComment:   return "LineComment";
    case ScanMode::BlockComment:  return "BlockComment";
    case ScanMode::StringLiteral: return "StringLiteral";
    case ScanMode::StringEscape:  return "StringEscape";
    case ScanMode::CharLiteral:   return "CharLiteral";
    case ScanMode::CharEscape:    return "CharEscape";
    case ScanMode::RawString:     return "RawString";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Line scanner
// ---------------------------------------------------------------------------

namespace {

bool all_whitespace(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

struct LineScanner {
    const std::string& line;
    int line_number;
    ScanState& state;
    size_t pos = 0;

    std::string out;
    CommentEvents events;

    LineScanner(const std::string& l, int n, ScanState& s)
        : line(l), line_number(n), state(s) {
        out.reserve(line.size());
    }

    bool at_end() const { return pos >= line.size(); }

    // '\0' past the end; never a trigger character
    char peek() const { return at_end() ? '\0' : line[pos]; }

    char advance() { return line[pos++]; }

    ScanResult run() {
        while (!at_end()) {
            char c = advance();
            switch (state.mode) {
            case ScanMode::Normal:        scan_normal(c); break;
            case ScanMode::LineComment:   scan_line_comment(c); break;
            case ScanMode::BlockComment:  scan_block_comment(c); break;
            case ScanMode::StringLiteral: scan_quoted(c, '"', ScanMode::StringEscape); break;
            case ScanMode::CharLiteral:   scan_quoted(c, '\'', ScanMode::CharEscape); break;
            case ScanMode::StringEscape:
                out += c;
                state.mode = ScanMode::StringLiteral;
                break;
            case ScanMode::CharEscape:
                out += c;
                state.mode = ScanMode::CharLiteral;
                break;
            case ScanMode::RawString:     scan_raw_string(c); break;
            }
        }
        return ScanResult{std::move(out), std::move(events)};
    }

    void scan_normal(char c) {
        switch (c) {
        case '/':
            if (peek() == '/') {
                advance();
                open_line_comment();
            } else if (peek() == '*') {
                advance();
                state.mode = ScanMode::BlockComment;
                if (!state.block_start_line) {
                    state.block_start_line = line_number;
                }
            } else {
                out += c;
            }
            break;
        case '"':
            out += c;
            state.mode = ScanMode::StringLiteral;
            break;
        case '\'':
            out += c;
            state.mode = ScanMode::CharLiteral;
            break;
        case 'r':
            scan_raw_prefix();
            break;
        default:
            out += c;
            break;
        }
    }

    void open_line_comment() {
        // Only whitespace before the comment: drop it along with the newline
        if (all_whitespace(out)) {
            out.clear();
            state.full_line_comment = true;
        } else {
            state.full_line_comment = false;
        }
        state.mode = ScanMode::LineComment;
        events.push_back({line_number, line_number, CommentKind::Line});
    }

    // After an 'r': zero or more '#' then '"' opens a raw string. Anything
    // else is ordinary code and is emitted as consumed.
    void scan_raw_prefix() {
        out += 'r';
        size_t hashes = 0;
        while (peek() == '#') {
            out += advance();
            ++hashes;
        }
        if (peek() == '"') {
            out += advance();
            state.raw_fence = hashes;
            state.mode = ScanMode::RawString;
        }
    }

    void scan_line_comment(char c) {
        if (c != '\n') return;
        if (!state.full_line_comment) {
            out += c;
        }
        state.mode = ScanMode::Normal;
        state.full_line_comment = false;
    }

    void scan_block_comment(char c) {
        if (c != '*' || peek() != '/') return;
        advance();
        state.mode = ScanMode::Normal;
        if (state.block_start_line) {
            events.push_back({*state.block_start_line, line_number, CommentKind::Block});
            state.block_start_line.reset();
        }
    }

    void scan_quoted(char c, char quote, ScanMode escape_mode) {
        out += c;
        if (c == '\\') {
            state.mode = escape_mode;
        } else if (c == quote) {
            state.mode = ScanMode::Normal;
        }
    }

    // A '"' closes the raw string only when followed by exactly raw_fence
    // hashes. Hashes consumed by a failed attempt stay string content.
    void scan_raw_string(char c) {
        out += c;
        if (c != '"') return;

        size_t found = 0;
        while (found < state.raw_fence && peek() == '#') {
            out += advance();
            ++found;
        }
        if (found == state.raw_fence) {
            state.mode = ScanMode::Normal;
            state.raw_fence = 0;
        }
    }
};

} // namespace

ScanResult scan_line(const std::string& line, int line_number, ScanState& state) {
    LineScanner scanner(line, line_number, state);
    return scanner.run();
}

ScrubTextResult scrub_text(const std::string& source, int header_lines) {
    ScrubTextResult result;
    int line_number = 0;
    size_t start = 0;

    while (start < source.size()) {
        size_t eol = source.find('\n', start);
        size_t len = (eol == std::string::npos) ? source.size() - start : eol - start + 1;
        std::string line = source.substr(start, len);
        start += len;
        ++line_number;

        if (line_number <= header_lines) {
            result.text += line;
            continue;
        }

        auto scanned = scan_line(line, line_number, result.final_state);
        result.text += scanned.text;
        result.events.insert(result.events.end(), scanned.events.begin(), scanned.events.end());
    }

    return result;
}

} // namespace scrub
