#pragma once

#include <scrub/result.hpp>
#include <scrub/log.hpp>
#include <istream>
#include <ostream>
#include <optional>
#include <string>
#include <vector>

namespace scrub {

struct Options {
    std::string input;
    std::optional<std::string> output;   // -o/--output; stdout when absent
    std::optional<int> header_lines;     // -H/--header-lines; detect when absent
    bool verbose = false;                // -v/--verbose
    bool dry_run = false;                // -d/--dry-run
    bool assume_yes = false;             // -y/--yes
    bool no_detect = false;              // -n/--no-detect
    std::string config_path;             // -c/--config
    std::optional<log::Level> log_level; // --log-level
    bool show_help = false;
    bool show_version = false;
};

// Parse command-line arguments (without the program name).
Result<Options> parse_args(const std::vector<std::string>& args);

std::string usage();
std::string version_string();

// Print `question [y/N]: ` to `out` and read one answer from `in`.
// Only "y" or "yes" (any case, surrounding whitespace ignored) accepts.
bool ask_yes_no(const std::string& question, std::istream& in, std::ostream& out);

// Run the tool. Prompts and reports go to `err`; scrubbed text goes to
// the output file or stdout. Returns the process exit code.
int run(const Options& opts, std::istream& in, std::ostream& err);

} // namespace scrub
