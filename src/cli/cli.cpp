#include <scrub/cli.hpp>
#include <scrub/config.hpp>
#include <scrub/lang/header.hpp>
#include <scrub/report.hpp>
#include <scrub/scrub.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifndef SCRUB_VERSION
#define SCRUB_VERSION "0.0.0"
#endif

namespace scrub {

namespace fs = std::filesystem;

namespace {

Result<int> parse_count(const std::string& flag, const std::string& text) {
    bool digits = !text.empty();
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
    }
    if (!digits || text.size() > 9) {
        return ScrubError{ScrubError::InvalidArg,
            "invalid value '" + text + "' for " + flag,
            "expected a non-negative line count"};
    }
    return Result<int>::ok(std::atoi(text.c_str()));
}

// Splits "--name=value" into name and value; other arguments pass through.
void split_inline_value(std::string& arg, std::optional<std::string>& value) {
    if (arg.size() > 2 && arg[0] == '-' && arg[1] == '-') {
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }
    }
}

int confirm_header(const Options& opts, const HeaderOptions& hopts,
                   std::istream& in, std::ostream& err) {
    std::error_code ec;
    if (!fs::is_regular_file(opts.input, ec)) return 0;

    auto r = detect_header_file(opts.input, hopts);
    if (r.is_err()) {
        log::warn("header detection failed: %s", r.error().message.c_str());
        return 0;
    }

    const auto& decision = r.value();
    if (decision.line_count == 0) {
        log::debug("no header detected in %s", opts.input.c_str());
        return 0;
    }

    err << "Automatically detected a header with " << decision.line_count << " lines:\n\n"
        << decision.preview << "\n\n";

    if (opts.assume_yes ||
        ask_yes_no("Should this section be treated as a header (preserve comments)?", in, err)) {
        err << "Header will be set to " << decision.line_count << " lines.\n";
        return decision.line_count;
    }
    err << "Header detection ignored. Processing the entire file.\n";
    return 0;
}

} // namespace

Result<Options> parse_args(const std::vector<std::string>& args) {
    Options opts;
    bool have_input = false;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string arg = args[i];
        std::optional<std::string> inline_value;
        split_inline_value(arg, inline_value);

        // Fetch the value of an option taking an argument
        auto take_value = [&](const std::string& flag) -> Result<std::string> {
            if (inline_value) return Result<std::string>::ok(*inline_value);
            if (i + 1 >= args.size()) {
                return ScrubError{ScrubError::InvalidArg,
                    "missing value for " + flag};
            }
            return Result<std::string>::ok(args[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            opts.dry_run = true;
        } else if (arg == "-y" || arg == "--yes") {
            opts.assume_yes = true;
        } else if (arg == "-n" || arg == "--no-detect") {
            opts.no_detect = true;
        } else if (arg == "-H" || arg == "--header-lines") {
            auto v = take_value(arg);
            SCRUB_TRY(v);
            auto n = parse_count(arg, v.value());
            SCRUB_TRY(n);
            opts.header_lines = n.value();
        } else if (arg == "-o" || arg == "--output") {
            auto v = take_value(arg);
            SCRUB_TRY(v);
            opts.output = v.value();
        } else if (arg == "-c" || arg == "--config") {
            auto v = take_value(arg);
            SCRUB_TRY(v);
            opts.config_path = v.value();
        } else if (arg == "--log-level") {
            auto v = take_value(arg);
            SCRUB_TRY(v);
            auto lvl = log::parse_level(v.value());
            SCRUB_TRY(lvl);
            opts.log_level = lvl.value();
        } else if (arg.size() > 1 && arg[0] == '-') {
            return ScrubError{ScrubError::InvalidArg,
                "unknown option '" + args[i] + "'",
                "run with --help for usage"};
        } else if (have_input) {
            return ScrubError{ScrubError::InvalidArg,
                "unexpected argument '" + arg + "'",
                "only one input file is accepted"};
        } else {
            opts.input = arg;
            have_input = true;
        }
    }

    if (!have_input && !opts.show_help && !opts.show_version) {
        return ScrubError{ScrubError::InvalidArg,
            "no input file given", "run with --help for usage"};
    }
    return Result<Options>::ok(std::move(opts));
}

std::string usage() {
    return
        "Usage: scrub [options] <input>\n"
        "\n"
        "Remove comments from a source file, keeping string, character and\n"
        "raw-string literals intact.\n"
        "\n"
        "Options:\n"
        "  -H, --header-lines N  copy the first N lines verbatim (skips detection)\n"
        "  -o, --output PATH     write to PATH instead of stdout\n"
        "  -v, --verbose         list every removed comment on stderr\n"
        "  -d, --dry-run         scan only, write nothing\n"
        "  -y, --yes             accept a detected header without asking\n"
        "  -n, --no-detect       do not look for a header\n"
        "  -c, --config PATH     extra TOML config file, applied last\n"
        "      --log-level LVL   trace, debug, info, warn or error\n"
        "  -h, --help            show this help\n"
        "  -V, --version         show the version\n";
}

std::string version_string() {
    return std::string("scrub ") + SCRUB_VERSION;
}

bool ask_yes_no(const std::string& question, std::istream& in, std::ostream& out) {
    out << question << " [y/N]: ";
    out.flush();

    std::string response;
    if (!std::getline(in, response)) {
        return false;
    }

    std::string answer;
    for (char c : response) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            answer += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return answer == "y" || answer == "yes";
}

int run(const Options& opts, std::istream& in, std::ostream& err) {
    if (opts.show_help) {
        err << usage();
        return 0;
    }
    if (opts.show_version) {
        err << version_string() << "\n";
        return 0;
    }

    auto cfg_result = Config::discover(opts.config_path);
    if (cfg_result.is_err()) {
        log::report(cfg_result.error());
        return 1;
    }
    const Config& cfg = cfg_result.value();

    log::set_level(opts.log_level ? *opts.log_level : cfg.log_level);
    if (cfg.log_color_set && !cfg.log_color) {
        log::set_color_enabled(false);
    }
    bool verbose = opts.verbose || cfg.verbose;

    int header_lines = 0;
    if (opts.header_lines) {
        header_lines = *opts.header_lines;
    } else if (cfg.detect_header && !opts.no_detect) {
        header_lines = confirm_header(opts, cfg.header, in, err);
    }

    ScrubRequest req;
    req.input = opts.input;
    req.output = opts.output;
    req.header_lines = header_lines;
    req.dry_run = opts.dry_run;

    auto result = scrub_file(req);
    if (result.is_err()) {
        log::report(result.error());
        return 1;
    }
    const auto& report = result.value();

    if (verbose) {
        write_verbose_report(err, report);
    }

    if (opts.dry_run) {
        if (verbose) {
            err << "Dry run complete. No output file written.\n";
        } else {
            std::cout << dry_run_summary(report) << "\n";
        }
    } else if (opts.output) {
        log::info("output written to %s", opts.output->c_str());
    }
    return 0;
}

} // namespace scrub
