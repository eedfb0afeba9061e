#include <catch2/catch.hpp>
#include "edit_engine.hpp"

using namespace linkagent;

static std::string replaced(const std::string& content, const std::string& old_text,
                            const std::string& new_text, bool replace_all = false) {
    auto result = replace_text(content, old_text, new_text, replace_all);
    REQUIRE_FALSE(is_error(result));
    return get_value(result);
}

static std::string failure(const std::string& content, const std::string& old_text,
                           const std::string& new_text, bool replace_all = false) {
    auto result = replace_text(content, old_text, new_text, replace_all);
    REQUIRE(is_error(result));
    REQUIRE(get_error(result).kind() == ErrorKind::ToolExecution);
    return get_error(result).as<errors::ToolExecution>()->message;
}

// ── Exact ───────────────────────────────────────────────────────

TEST_CASE("replace_text: unique exact occurrence", "[edit_engine]") {
    REQUIRE(replaced("hello world", "world", "rust") == "hello rust");
}

TEST_CASE("replace_text: repeated occurrence is ambiguous", "[edit_engine]") {
    auto msg = failure("foo bar foo", "foo", "qux");
    REQUIRE(msg.find("found 2 times") != std::string::npos);
    REQUIRE(msg.find("exact") != std::string::npos);
}

TEST_CASE("replace_text: replace_all substitutes every occurrence", "[edit_engine]") {
    REQUIRE(replaced("foo bar foo baz foo", "foo", "qux", true) == "qux bar qux baz qux");
}

TEST_CASE("replace_text: missing text", "[edit_engine]") {
    REQUIRE(failure("hello world", "absent", "x") == "oldString not found in content");
}

TEST_CASE("replace_text: empty old text never matches", "[edit_engine]") {
    REQUIRE(failure("abc", "", "x") == "oldString not found in content");
}

TEST_CASE("find_exact: occurrences do not overlap", "[edit_engine]") {
    auto spans = find_exact("aaaa", "aa");
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[1].begin == 2);
}

// ── Line-trimmed ────────────────────────────────────────────────

TEST_CASE("replace_text: indentation differences fall back to line-trimmed", "[edit_engine]") {
    std::string content = "void f() {\n    if (x) {\n        y();\n    }\n}\n";
    std::string old_text = "if (x) {\n    y();\n}";
    auto spans = find_line_trimmed(content, old_text);
    REQUIRE(spans.size() == 1);

    auto out = replaced(content, old_text, "    if (z) {\n        w();\n    }");
    REQUIRE(out == "void f() {\n    if (z) {\n        w();\n    }\n}\n");
}

TEST_CASE("replace_text: line-trimmed keeps following newline when old has one", "[edit_engine]") {
    std::string content = "a\n  b\nc\n";
    REQUIRE(find_exact(content, "b \n").empty());
    REQUIRE(replaced(content, "b \n", "B\n") == "a\nB\nc\n");
}

// ── Whitespace-normalized ───────────────────────────────────────

TEST_CASE("replace_text: collapsed whitespace matches a single line", "[edit_engine]") {
    std::string content = "int   x  =  1;\nint y = 2;\n";
    REQUIRE(find_exact(content, "int x = 1;").empty());
    REQUIRE(find_line_trimmed(content, "int x = 1;").empty());
    REQUIRE(find_whitespace_normalized(content, "int x = 1;").size() == 1);

    REQUIRE(replaced(content, "int x = 1;", "int x = 5;") == "int x = 5;\nint y = 2;\n");
}

TEST_CASE("replace_text: whitespace-normalized span stops before the newline", "[edit_engine]") {
    std::string content = "x   =  1\ny\n";
    REQUIRE(find_line_trimmed(content, "x = 1\n").empty());
    REQUIRE(replaced(content, "x = 1\n", "z\n") == "z\n\ny\n");
}

TEST_CASE("find_whitespace_normalized: all-whitespace old has no candidates", "[edit_engine]") {
    REQUIRE(find_whitespace_normalized("a\n \nb", "   ").empty());
}

// ── Block anchor ────────────────────────────────────────────────

TEST_CASE("replace_text: block anchor matches on first and last lines", "[edit_engine]") {
    std::string content = "function a() {\n  one();\n  two();\n}\nrest\n";
    std::string old_text = "function a() {\n  ONE();\n}";
    REQUIRE(find_line_trimmed(content, old_text).empty());
    REQUIRE(find_block_anchor(content, old_text).size() == 1);

    REQUIRE(replaced(content, old_text, "function a() {}") == "function a() {}\nrest\n");
}

TEST_CASE("replace_text: block anchor keeps following newline when old has one", "[edit_engine]") {
    std::string content = "start\n  x\nend\nrest\n";
    std::string old_text = "start\n  y\nend\n";
    REQUIRE(find_line_trimmed(content, old_text).empty());
    REQUIRE(replaced(content, old_text, "S\n") == "S\nrest\n");
}

TEST_CASE("find_block_anchor: needs at least three lines", "[edit_engine]") {
    REQUIRE(find_block_anchor("a\nx\nb\n", "a\nb").empty());
}

TEST_CASE("find_block_anchor: requires a line between anchors", "[edit_engine]") {
    REQUIRE(find_block_anchor("start\nend\n", "start\nmid\nend").empty());
}

// ── Cascade policy ──────────────────────────────────────────────

TEST_CASE("replace_text: ambiguity at a strategy is not resolved by later ones", "[edit_engine]") {
    std::string content = "  call();\n    call();\n";
    auto msg = failure(content, "call();\n", "run();\n");
    REQUIRE(msg.find("found 2 times") != std::string::npos);
}

TEST_CASE("replace_text: replace_all under a fuzzy strategy", "[edit_engine]") {
    std::string content = "x  =  1;\ny = 2;\nx =   1;\n";
    REQUIRE(replaced(content, "x = 1;", "x = 0;", true) == "x = 0;\ny = 2;\nx = 0;\n");
}

// ── Line endings ────────────────────────────────────────────────

TEST_CASE("normalize_line_endings: CRLF to LF, idempotent", "[edit_engine]") {
    std::string once = normalize_line_endings("a\r\nb\r\nc");
    REQUIRE(once == "a\nb\nc");
    REQUIRE(normalize_line_endings(once) == once);
    REQUIRE(normalize_line_endings("lone\rcr") == "lone\rcr");
}
