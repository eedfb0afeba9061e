#include <catch2/catch.hpp>
#include "util.hpp"
#include "temp_dir.hpp"
#include <cstdlib>

using namespace linkagent;

// ── trim / split ────────────────────────────────────────────────

TEST_CASE("trim: strips both ends", "[util]") {
    REQUIRE(trim("  hello \t\n") == "hello");
    REQUIRE(trim("") == "");
    REQUIRE(trim("   ") == "");
}

TEST_CASE("split: keeps empty middle fields", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1].empty());
}

// ── split_lines ─────────────────────────────────────────────────

TEST_CASE("split_lines: trailing newline adds no empty line", "[util]") {
    auto lines = split_lines("one\ntwo\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1] == "two");
}

TEST_CASE("split_lines: drops carriage returns", "[util]") {
    auto lines = split_lines("one\r\ntwo");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "one");
    REQUIRE(lines[1] == "two");
}

TEST_CASE("split_lines: empty input has no lines", "[util]") {
    REQUIRE(split_lines("").empty());
}

TEST_CASE("split_lines: blank lines kept", "[util]") {
    auto lines = split_lines("a\n\nb");
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[1].empty());
}

// ── collapse_whitespace / replace_all ───────────────────────────

TEST_CASE("collapse_whitespace: runs become one space", "[util]") {
    REQUIRE(collapse_whitespace("  int   x\t=  1; ") == "int x = 1;");
    REQUIRE(collapse_whitespace(" \t \n").empty());
}

TEST_CASE("replace_all: replaces every occurrence", "[util]") {
    REQUIRE(replace_all("a\r\nb\r\n", "\r\n", "\n") == "a\nb\n");
    REQUIRE(replace_all("aaa", "a", "aa") == "aaaaaa");
    REQUIRE(replace_all("abc", "", "x") == "abc");
}

// ── base64 ──────────────────────────────────────────────────────

TEST_CASE("base64_encode: RFC 4648 vectors", "[util]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64_encode: binary bytes", "[util]") {
    std::string bytes("\x89PNG\0\xff", 6);
    REQUIRE(base64_encode(bytes) == "iVBORwD/");
}

// ── utf8_truncate ───────────────────────────────────────────────

TEST_CASE("utf8_truncate: does not split a multibyte sequence", "[util]") {
    std::string s = "ab\xc3\xa9"; // "abé"
    REQUIRE(utf8_truncate(s, 3) == "ab");
    REQUIRE(utf8_truncate(s, 4) == s);
    REQUIRE(utf8_truncate("hello", 2) == "he");
}

// ── expand_home ─────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

// ── file helpers ────────────────────────────────────────────────

TEST_CASE("atomic_write_file: creates parents and replaces content", "[util]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    auto path = dir.file("nested/deeper/out.txt");

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::string content;
    REQUIRE(read_file(path, content));
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
}

TEST_CASE("read_file: missing file returns false", "[util]") {
    std::string content;
    REQUIRE_FALSE(read_file("/nonexistent/linkagent/file.txt", content));
}

TEST_CASE("epoch_millis: plausible wall clock", "[util]") {
    REQUIRE(epoch_millis() > 1600000000000ULL);
}

TEST_CASE("iso_timestamp: UTC with milliseconds", "[util]") {
    REQUIRE(iso_timestamp(0) == "1970-01-01T00:00:00.000Z");
    REQUIRE(iso_timestamp(1234) == "1970-01-01T00:00:01.234Z");
    REQUIRE(iso_timestamp(1714564800123ULL) == "2024-05-01T12:00:00.123Z");
}
