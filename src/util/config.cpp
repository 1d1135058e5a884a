#include <scrub/config.hpp>
#include <toml++/toml.hpp>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace scrub {

namespace fs = std::filesystem;

namespace {

// Reads an integer key into `out` when present. Missing keys are fine; a
// value of the wrong type or below `min` is a Config error.
Result<bool> read_int(const toml::table& tbl, const char* section,
                      const char* key, int64_t min, int& out) {
    auto node = tbl[key];
    if (!node) return Result<bool>::ok(false);

    auto v = node.value<int64_t>();
    if (!v) {
        return ScrubError{ScrubError::Config,
            std::string("[") + section + "] " + key + " must be an integer"};
    }
    if (*v < min || *v > INT32_MAX) {
        return ScrubError{ScrubError::Config,
            std::string("[") + section + "] " + key + " is out of range",
            "minimum is " + std::to_string(min)};
    }
    out = static_cast<int>(*v);
    return Result<bool>::ok(true);
}

Result<bool> read_bool(const toml::table& tbl, const char* section,
                       const char* key, bool& out) {
    auto node = tbl[key];
    if (!node) return Result<bool>::ok(false);

    auto v = node.value<bool>();
    if (!v) {
        return ScrubError{ScrubError::Config,
            std::string("[") + section + "] " + key + " must be true or false"};
    }
    out = *v;
    return Result<bool>::ok(true);
}

} // namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return ScrubError{ScrubError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [header] section
    if (auto header = doc["header"].as_table()) {
        auto r = read_bool(*header, "header", "detect", cfg.detect_header);
        SCRUB_TRY(r);
        cfg.detect_header_set = r.value();

        r = read_int(*header, "header", "max-lines", 1, cfg.header.max_lines);
        SCRUB_TRY(r);
        cfg.max_lines_set = r.value();

        r = read_int(*header, "header", "preview-lines", 0, cfg.header.preview_lines);
        SCRUB_TRY(r);
        cfg.preview_lines_set = r.value();

        r = read_int(*header, "header", "blank-run", 0, cfg.header.blank_run);
        SCRUB_TRY(r);
        cfg.blank_run_set = r.value();

        if (auto node = (*header)["code-keywords"]) {
            auto arr = node.as_array();
            if (!arr) {
                return ScrubError{ScrubError::Config,
                    "[header] code-keywords must be an array of strings"};
            }
            cfg.header.code_keywords.clear();
            for (const auto& el : *arr) {
                auto s = el.value<std::string>();
                if (!s || s->empty()) {
                    return ScrubError{ScrubError::Config,
                        "[header] code-keywords must be an array of strings"};
                }
                cfg.header.code_keywords.push_back(*s);
            }
            cfg.code_keywords_set = true;
        }
    }

    // [output] section
    if (auto output = doc["output"].as_table()) {
        auto r = read_bool(*output, "output", "verbose", cfg.verbose);
        SCRUB_TRY(r);
        cfg.verbose_set = r.value();
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto s = node.value<std::string>();
            if (!s) {
                return ScrubError{ScrubError::Config, "[log] level must be a string"};
            }
            auto lvl = log::parse_level(*s);
            if (lvl.is_err()) {
                return ScrubError{ScrubError::Config,
                    "[log] " + lvl.error().message, lvl.error().hint};
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }

        auto r = read_bool(*lg, "log", "color", cfg.log_color);
        SCRUB_TRY(r);
        cfg.log_color_set = r.value();
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return ScrubError{ScrubError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        auto err = std::move(r).error();
        err.file = path;
        return err;
    }
    return r;
}

void Config::merge(const Config& other) {
    if (other.detect_header_set) {
        detect_header = other.detect_header;
        detect_header_set = true;
    }
    if (other.max_lines_set) {
        header.max_lines = other.header.max_lines;
        max_lines_set = true;
    }
    if (other.preview_lines_set) {
        header.preview_lines = other.header.preview_lines;
        preview_lines_set = true;
    }
    if (other.blank_run_set) {
        header.blank_run = other.header.blank_run;
        blank_run_set = true;
    }
    // Keyword lists replace, they do not accumulate
    if (other.code_keywords_set) {
        header.code_keywords = other.header.code_keywords;
        code_keywords_set = true;
    }
    if (other.verbose_set) {
        verbose = other.verbose;
        verbose_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (explicit_file.has_value()) result.merge(explicit_file.value());
    return result;
}

Result<Config> Config::discover(const std::string& explicit_path) {
    std::optional<Config> global;
    std::optional<Config> project;
    std::optional<Config> explicit_file;
    std::error_code ec;

    std::string gpath = global_config_path();
    if (!gpath.empty() && fs::is_regular_file(gpath, ec)) {
        auto r = Config::load(gpath);
        SCRUB_TRY(r);
        global = std::move(r).value();
        log::debug("loaded global config %s", gpath.c_str());
    }

    if (fs::is_regular_file(kProjectConfigFile, ec)) {
        auto r = Config::load(kProjectConfigFile);
        SCRUB_TRY(r);
        project = std::move(r).value();
        log::debug("loaded project config %s", kProjectConfigFile);
    }

    if (!explicit_path.empty()) {
        if (!fs::exists(explicit_path, ec)) {
            return ScrubError{ScrubError::NotFound,
                "config file does not exist", "", explicit_path, 0};
        }
        auto r = Config::load(explicit_path);
        SCRUB_TRY(r);
        explicit_file = std::move(r).value();
        log::debug("loaded config %s", explicit_path.c_str());
    }

    return Result<Config>::ok(effective(global, project, explicit_file));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.scrub/config.toml";
}

} // namespace scrub
