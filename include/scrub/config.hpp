#pragma once

#include <scrub/result.hpp>
#include <scrub/lang/header.hpp>
#include <scrub/log.hpp>
#include <string>
#include <optional>

namespace scrub {

// Layered configuration: global > project > explicit --config file.
// Later layers override earlier ones, but only for keys they set.
struct Config {
    // [header]
    bool detect_header = true;
    HeaderOptions header;

    // [output]
    bool verbose = false;

    // [log]
    log::Level log_level = log::Info;
    bool log_color = true;

    // Track which fields were explicitly set (for merge)
    bool detect_header_set = false;
    bool max_lines_set = false;
    bool preview_lines_set = false;
    bool blank_run_set = false;
    bool code_keywords_set = false;
    bool verbose_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> explicit
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);

    // Load whichever of the global and project files exist, plus
    // `explicit_path` when non-empty (which must exist), and merge them.
    static Result<Config> discover(const std::string& explicit_path);
};

// Discover the global config file path: ~/.scrub/config.toml
std::string global_config_path();

// Project config file name, looked up in the working directory
constexpr const char* kProjectConfigFile = ".scrub.toml";

} // namespace scrub
