#include <catch2/catch.hpp>
#include "diff.hpp"

using namespace linkagent;

TEST_CASE("diff_lines: identical texts are all equal", "[diff]") {
    auto lines = diff_lines("a\nb\n", "a\nb\n");
    REQUIRE(lines.size() == 2);
    auto stats = diff_stats(lines);
    REQUIRE(stats.additions == 0);
    REQUIRE(stats.deletions == 0);
}

TEST_CASE("diff_lines: one changed line", "[diff]") {
    auto stats = diff_stats(diff_lines("a\nb\nc\n", "a\nB\nc\n"));
    REQUIRE(stats.additions == 1);
    REQUIRE(stats.deletions == 1);
}

TEST_CASE("diff_lines: pure insertion and deletion", "[diff]") {
    auto ins = diff_stats(diff_lines("a\nc\n", "a\nb\nc\n"));
    REQUIRE(ins.additions == 1);
    REQUIRE(ins.deletions == 0);

    auto del = diff_stats(diff_lines("a\nb\nc\n", "a\nc\n"));
    REQUIRE(del.additions == 0);
    REQUIRE(del.deletions == 1);
}

TEST_CASE("diff_lines: from empty counts every line", "[diff]") {
    auto stats = diff_stats(diff_lines("", "x\ny\nz"));
    REQUIRE(stats.additions == 3);
    REQUIRE(stats.deletions == 0);
}

TEST_CASE("diff_lines: minimal script for interleaved edits", "[diff]") {
    // ABCABBA -> CBABAC needs 5 edits
    auto stats = diff_stats(diff_lines("A\nB\nC\nA\nB\nB\nA\n", "C\nB\nA\nB\nA\nC\n"));
    REQUIRE(stats.additions + stats.deletions == 5);
}

TEST_CASE("unified_diff: header and prefixed lines", "[diff]") {
    auto diff = unified_diff("hello world\n", "hello rust\n", "/tmp/f.txt");
    REQUIRE(diff.rfind("--- /tmp/f.txt\n+++ /tmp/f.txt\n", 0) == 0);
    REQUIRE(diff.find("-hello world\n") != std::string::npos);
    REQUIRE(diff.find("+hello rust\n") != std::string::npos);
}

TEST_CASE("unified_diff: context limited to three lines", "[diff]") {
    std::string before;
    for (int i = 1; i <= 10; ++i) before += "line" + std::to_string(i) + "\n";
    std::string after = before;
    after.replace(after.find("line5\n"), 6, "FIVE\n");

    auto diff = unified_diff(before, after, "f");
    REQUIRE(diff.find(" line2\n") != std::string::npos);
    REQUIRE(diff.find(" line1\n") == std::string::npos);
    REQUIRE(diff.find(" line8\n") != std::string::npos);
    REQUIRE(diff.find(" line9\n") == std::string::npos);
}

TEST_CASE("unified_diff: distant changes get separate hunks", "[diff]") {
    std::string before;
    for (int i = 1; i <= 30; ++i) before += "l" + std::to_string(i) + "\n";
    std::string after = before;
    after.replace(after.find("l2\n"), 3, "X2\n");
    after.replace(after.find("l28\n"), 4, "X28\n");

    auto diff = unified_diff(before, after, "f");
    REQUIRE(diff.find("...\n") != std::string::npos);
    REQUIRE(diff.find(" l15\n") == std::string::npos);
}

TEST_CASE("unified_diff: missing final newline still ends lines", "[diff]") {
    auto diff = unified_diff("a", "b", "f");
    REQUIRE(diff == "--- f\n+++ f\n-a\n+b\n");
}

TEST_CASE("unified_diff: precomputed lines render the same diff", "[diff]") {
    std::string before = "a\nb\nc\nd\n";
    std::string after = "a\nB\nc\nd\ne\n";
    auto lines = diff_lines(before, after);
    REQUIRE(unified_diff(lines, "f") == unified_diff(before, after, "f"));
    auto tight = unified_diff(lines, "f", 0);
    REQUIRE(tight.find("...\n+e\n") != std::string::npos);
    REQUIRE(tight.find(" c\n") == std::string::npos);
}
