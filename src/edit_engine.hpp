#pragma once
#include "error.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace linkagent {

// Byte range [begin, end) of a match inside the searched content
struct MatchSpan {
    size_t begin;
    size_t end;
};

enum class MatchStrategy {
    Exact,
    LineTrimmed,
    WhitespaceNormalized,
    BlockAnchor
};

const char* match_strategy_name(MatchStrategy strategy);

// Candidate finders. Each returns every candidate span in content order;
// candidates may overlap.
std::vector<MatchSpan> find_exact(const std::string& content, const std::string& old_text);
std::vector<MatchSpan> find_line_trimmed(const std::string& content, const std::string& old_text);
std::vector<MatchSpan> find_whitespace_normalized(const std::string& content,
                                                  const std::string& old_text);
std::vector<MatchSpan> find_block_anchor(const std::string& content, const std::string& old_text);

// Replace old_text with new_text in content, trying the strategies above in
// order. The first strategy with any candidate decides: one candidate (or
// replace_all) is replaced, several without replace_all is an ambiguity
// error. No candidate anywhere fails with "oldString not found in content".
Result<std::string> replace_text(const std::string& content, const std::string& old_text,
                                 const std::string& new_text, bool replace_all);

// CRLF -> LF
std::string normalize_line_endings(const std::string& text);

} // namespace linkagent
