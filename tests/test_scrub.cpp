#include <catch2/catch.hpp>
#include <scrub/scrub.hpp>
#include <scrub/lang/header.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace scrub;
namespace fs = std::filesystem;

namespace {

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("scrub_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        std::ofstream f(full, std::ios::binary);
        f << content;
        return full.string();
    }
};

std::string fixture_dir() {
    const char* src = std::getenv("SCRUB_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// tests/fixtures/sample.rs after its first five lines
const char* SAMPLE_BODY =
    "use std::fmt; \n"
    "\n"
    "\n"
    "pub struct Point {\n"
    "    x: i32, \n"
    "    y: i32,\n"
    "}\n"
    "\n"
    "fn main() {\n"
    "    let url = \"http://example.com/*path*/\";\n"
    "    let raw = r#\"a \"quoted\" // value\"#;\n"
    "    let c = '/';\n"
    "    let z =  30;\n"
    "    println!(\"{}\", url);\n"
    "}\n";

const char* SAMPLE_HEADER =
    "// Copyright (c) 2025 Example Authors\n"
    "// SPDX-License-Identifier: MIT\n"
    "\n"
    "//! Demo crate.\n"
    "\n";

} // namespace

// ===== read_line =====

TEST_CASE("read_line keeps newlines except on an unterminated last line", "[scrub]") {
    std::istringstream in("a\n\nb");
    std::string line;

    REQUIRE(read_line(in, line));
    REQUIRE(line == "a\n");
    REQUIRE(read_line(in, line));
    REQUIRE(line == "\n");
    REQUIRE(read_line(in, line));
    REQUIRE(line == "b");
    REQUIRE_FALSE(read_line(in, line));
}

TEST_CASE("read_line on empty input", "[scrub]") {
    std::istringstream in("");
    std::string line;
    REQUIRE_FALSE(read_line(in, line));
}

// ===== scrub_stream =====

TEST_CASE("scrub_stream writes scrubbed text", "[scrub]") {
    std::istringstream in("// gone\nlet a = 1; // trailing\nlet b = /* x */ 2;\n");
    std::ostringstream out;

    auto r = scrub_stream(in, &out, 0);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == "let a = 1; \nlet b =  2;\n");
    REQUIRE(r.value().body_lines == 3);
    REQUIRE(r.value().line_comments() == 2);
    REQUIRE(r.value().block_comments() == 1);
}

TEST_CASE("scrub_stream numbers lines after the header", "[scrub]") {
    std::istringstream in("// h1\n// h2\nx; // c\n/* a\nb */\n");
    std::ostringstream out;

    auto r = scrub_stream(in, &out, 2);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == "// h1\n// h2\nx; \n\n");

    const auto& report = r.value();
    REQUIRE(report.header_lines == 2);
    REQUIRE(report.body_lines == 3);
    REQUIRE(report.events.size() == 2);
    REQUIRE(report.events[0] == CommentEvent{3, 3, CommentKind::Line});
    REQUIRE(report.events[1] == CommentEvent{4, 5, CommentKind::Block});
}

TEST_CASE("scrub_stream header longer than input", "[scrub]") {
    std::istringstream in("// only\n");
    std::ostringstream out;

    auto r = scrub_stream(in, &out, 10);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == "// only\n");
    REQUIRE(r.value().header_lines == 1);
    REQUIRE(r.value().body_lines == 0);
}

TEST_CASE("scrub_stream dry run writes nothing but still reports", "[scrub]") {
    std::istringstream in("a; // one\n/* two */\n");

    auto r = scrub_stream(in, nullptr, 0);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().events.size() == 2);
}

TEST_CASE("scrub_stream records an unterminated construct", "[scrub]") {
    std::istringstream in("let s = r#\"open\n");
    std::ostringstream out;

    auto r = scrub_stream(in, &out, 0);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == "let s = r#\"open\n");
    REQUIRE(r.value().final_mode == ScanMode::RawString);
}

// ===== Fixture =====

TEST_CASE("sample fixture without header", "[scrub]") {
    std::ifstream in(fixture_dir() + "/sample.rs", std::ios::binary);
    REQUIRE(in.is_open());
    std::ostringstream out;

    auto r = scrub_stream(in, &out, 0);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == std::string("\n\n") + SAMPLE_BODY);

    const auto& report = r.value();
    REQUIRE(report.line_comments() == 6);
    REQUIRE(report.block_comments() == 2);
    REQUIRE(report.events[4] == CommentEvent{8, 9, CommentKind::Block});
    REQUIRE(report.events[7] == CommentEvent{20, 20, CommentKind::Block});
}

TEST_CASE("sample fixture with detected header", "[scrub]") {
    auto path = fixture_dir() + "/sample.rs";
    auto d = detect_header_file(path);
    REQUIRE(d.is_ok());
    REQUIRE(d.value().line_count == 5);

    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    auto r = scrub_stream(in, &out, d.value().line_count);
    REQUIRE(r.is_ok());
    REQUIRE(out.str() == std::string(SAMPLE_HEADER) + SAMPLE_BODY);
    REQUIRE(r.value().line_comments() == 3);
    REQUIRE(r.value().block_comments() == 2);
}

// ===== scrub_file =====

TEST_CASE("scrub_file writes the output file", "[scrub]") {
    TempDir td;
    auto input = td.write_file("in.rs", "fn f() {} // c\n");
    auto output = (td.path / "out.rs").string();

    ScrubRequest req;
    req.input = input;
    req.output = output;

    auto r = scrub_file(req);
    REQUIRE(r.is_ok());
    REQUIRE(read_file(output) == "fn f() {} \n");
    REQUIRE(read_file(input) == "fn f() {} // c\n");
}

TEST_CASE("scrub_file dry run creates no output", "[scrub]") {
    TempDir td;
    auto input = td.write_file("in.rs", "// c\n");
    auto output = (td.path / "out.rs").string();

    ScrubRequest req;
    req.input = input;
    req.output = output;
    req.dry_run = true;

    auto r = scrub_file(req);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().line_comments() == 1);
    REQUIRE_FALSE(fs::exists(output));
}

TEST_CASE("scrub_file on a missing input", "[scrub]") {
    TempDir td;
    ScrubRequest req;
    req.input = (td.path / "missing.rs").string();
    req.dry_run = true;

    auto r = scrub_file(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScrubError::NotFound);
    REQUIRE(r.error().file == req.input);
}

TEST_CASE("scrub_file on a directory", "[scrub]") {
    TempDir td;
    ScrubRequest req;
    req.input = td.path.string();
    req.dry_run = true;

    auto r = scrub_file(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScrubError::InvalidArg);
}

TEST_CASE("scrub_file refuses to overwrite its input", "[scrub]") {
    TempDir td;
    auto input = td.write_file("in.rs", "x; // keep me\n");

    ScrubRequest req;
    req.input = input;
    req.output = input;

    auto r = scrub_file(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScrubError::InvalidArg);
    REQUIRE(read_file(input) == "x; // keep me\n");
}

TEST_CASE("scrub_file into a missing directory", "[scrub]") {
    TempDir td;
    auto input = td.write_file("in.rs", "x;\n");

    ScrubRequest req;
    req.input = input;
    req.output = (td.path / "no" / "such" / "out.rs").string();

    auto r = scrub_file(req);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ScrubError::IO);
    REQUIRE(r.error().file == *req.output);
}
