#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace linkagent {

enum class DiffTag { Equal, Delete, Insert };

struct DiffLine {
    DiffTag tag;
    std::string text; // includes its trailing '\n' when the source had one
};

// Line-level shortest edit script (Myers) between two texts
std::vector<DiffLine> diff_lines(const std::string& before, const std::string& after);

struct DiffStats {
    size_t additions = 0;
    size_t deletions = 0;
};

DiffStats diff_stats(const std::vector<DiffLine>& lines);

// "--- path\n+++ path\n" followed by each hunk's lines prefixed with
// '-', '+' or ' ', `context` unchanged lines around every change, and a
// "...\n" line between hunks.
std::string unified_diff(const std::vector<DiffLine>& lines, const std::string& path,
                         size_t context = 3);

std::string unified_diff(const std::string& before, const std::string& after,
                         const std::string& path, size_t context = 3);

} // namespace linkagent
