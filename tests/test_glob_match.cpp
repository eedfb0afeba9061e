#include <catch2/catch.hpp>
#include "glob_match.hpp"
#include "temp_dir.hpp"
#include <algorithm>

using namespace linkagent;

TEST_CASE("glob_match_name: star and question mark", "[glob]") {
    REQUIRE(glob_match_name("*.txt", "notes.txt"));
    REQUIRE_FALSE(glob_match_name("*.txt", "notes.md"));
    REQUIRE(glob_match_name("a?c", "abc"));
    REQUIRE_FALSE(glob_match_name("a?c", "ac"));
    REQUIRE(glob_match_name("*", ""));
    REQUIRE(glob_match_name("*a*b*", "xxaYYbZ"));
}

TEST_CASE("glob_match_name: character classes", "[glob]") {
    REQUIRE(glob_match_name("file[0-9].log", "file7.log"));
    REQUIRE_FALSE(glob_match_name("file[0-9].log", "fileA.log"));
    REQUIRE(glob_match_name("[!a]*", "bcd"));
    REQUIRE_FALSE(glob_match_name("[!a]*", "abc"));
    REQUIRE(glob_match_name("[]]", "]"));
}

TEST_CASE("glob_match_path: double star spans directories", "[glob]") {
    REQUIRE(glob_match_path("**/*.txt", "a.txt"));
    REQUIRE(glob_match_path("**/*.txt", "x/y/a.txt"));
    REQUIRE(glob_match_path("src/**/main.cpp", "src/main.cpp"));
    REQUIRE(glob_match_path("src/**/main.cpp", "src/app/core/main.cpp"));
    REQUIRE_FALSE(glob_match_path("*.txt", "x/a.txt"));
}

TEST_CASE("glob_syntax_error: malformed patterns", "[glob]") {
    REQUIRE_FALSE(glob_syntax_error("src/**/*.cpp").has_value());
    REQUIRE(glob_syntax_error("file[abc").has_value());
    REQUIRE(glob_syntax_error("a**b/c").has_value());
}

TEST_CASE("glob_files: walks from the literal base", "[glob]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    std::filesystem::create_directories(dir.file("sub/deep"));
    write_file(dir.file("a.txt"), "a");
    write_file(dir.file("b.md"), "b");
    write_file(dir.file("sub/c.txt"), "c");
    write_file(dir.file("sub/deep/d.txt"), "d");

    auto top = glob_files(dir.path + "/*.txt");
    REQUIRE(top.size() == 1);
    REQUIRE(top[0].filename() == "a.txt");

    auto all = glob_files(dir.path + "/**/*.txt");
    REQUIRE(all.size() == 3);

    auto literal = glob_files(dir.path + "/sub/c.txt");
    REQUIRE(literal.size() == 1);

    REQUIRE(glob_files(dir.path + "/missing/*.txt").empty());
}
