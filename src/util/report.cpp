#include <scrub/report.hpp>

namespace scrub {

std::string describe_event(const CommentEvent& event) {
    if (event.kind == CommentKind::Line) {
        return "- Line " + std::to_string(event.start_line) + ": Removed line comment.";
    }
    if (event.start_line == event.end_line) {
        return "- Line " + std::to_string(event.start_line) + ": Removed block comment.";
    }
    return "- Lines " + std::to_string(event.start_line) + "-" +
           std::to_string(event.end_line) + ": Removed block comment.";
}

void write_verbose_report(std::ostream& os, const ScrubReport& report) {
    if (report.events.empty()) {
        os << "No comments found to remove in the processed section.\n";
        return;
    }

    os << "Comments removed:\n";
    for (const auto& event : report.events) {
        os << describe_event(event) << "\n";
    }
    os << "---\n";
    os << "Statistics:\n";
    os << "- Total line comments removed: " << report.line_comments() << "\n";
    os << "- Total block comments removed: " << report.block_comments() << "\n";
    os << "---\n";
}

std::string dry_run_summary(const ScrubReport& report) {
    return "Dry run complete. " + std::to_string(report.line_comments()) +
           " line comments and " + std::to_string(report.block_comments()) +
           " block comments would be removed. No output file written.";
}

} // namespace scrub
