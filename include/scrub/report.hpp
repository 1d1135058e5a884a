#pragma once

#include <scrub/scrub.hpp>
#include <ostream>
#include <string>

namespace scrub {

// "- Line 4: Removed line comment." / "- Lines 3-7: Removed block comment."
std::string describe_event(const CommentEvent& event);

// Per-comment listing followed by totals, as printed by --verbose
void write_verbose_report(std::ostream& os, const ScrubReport& report);

// One-line summary printed after a dry run without --verbose
std::string dry_run_summary(const ScrubReport& report);

} // namespace scrub
