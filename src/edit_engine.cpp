#include "edit_engine.hpp"
#include "util.hpp"

namespace linkagent {

namespace {

// Byte spans of each line, '\n' excluded (and a '\r' before it)
std::vector<MatchSpan> line_spans(const std::string& s) {
    std::vector<MatchSpan> spans;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t nl = s.find('\n', pos);
        size_t end = (nl == std::string::npos) ? s.size() : nl;
        size_t line_end = end;
        if (nl != std::string::npos && line_end > pos && s[line_end - 1] == '\r') {
            --line_end;
        }
        spans.push_back({pos, line_end});
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return spans;
}

std::string span_text(const std::string& s, const MatchSpan& span) {
    return s.substr(span.begin, span.end - span.begin);
}

// A multi-line old_text ending in a newline also consumes the newline after
// the matched block, so the replacement keeps the file's line structure.
MatchSpan block_span(const std::string& content, const std::vector<MatchSpan>& lines,
                     size_t first, size_t last, bool take_newline) {
    MatchSpan span{lines[first].begin, lines[last].end};
    if (take_newline) {
        size_t nl = content.find('\n', span.end);
        if (nl != std::string::npos && nl < span.end + 2) {
            span.end = nl + 1;
        }
    }
    return span;
}

bool ends_with_newline(const std::string& s) {
    return !s.empty() && s.back() == '\n';
}

std::vector<MatchSpan> non_overlapping(const std::vector<MatchSpan>& spans) {
    std::vector<MatchSpan> out;
    for (const auto& span : spans) {
        if (out.empty() || span.begin >= out.back().end) {
            out.push_back(span);
        }
    }
    return out;
}

std::string apply_spans(const std::string& content, const std::vector<MatchSpan>& spans,
                        const std::string& new_text) {
    std::string result;
    result.reserve(content.size() + spans.size() * new_text.size());
    size_t pos = 0;
    for (const auto& span : spans) {
        result.append(content, pos, span.begin - pos);
        result += new_text;
        pos = span.end;
    }
    result.append(content, pos, std::string::npos);
    return result;
}

} // namespace

const char* match_strategy_name(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::Exact:                return "exact";
        case MatchStrategy::LineTrimmed:          return "line-trimmed";
        case MatchStrategy::WhitespaceNormalized: return "whitespace-normalized";
        case MatchStrategy::BlockAnchor:          return "block-anchor";
    }
    return "unknown";
}

std::vector<MatchSpan> find_exact(const std::string& content, const std::string& old_text) {
    std::vector<MatchSpan> matches;
    if (old_text.empty()) return matches;
    size_t pos = 0;
    while ((pos = content.find(old_text, pos)) != std::string::npos) {
        matches.push_back({pos, pos + old_text.size()});
        pos += old_text.size();
    }
    return matches;
}

std::vector<MatchSpan> find_line_trimmed(const std::string& content, const std::string& old_text) {
    std::vector<MatchSpan> matches;
    auto search = split_lines(old_text);
    if (search.empty()) return matches;

    std::vector<std::string> search_trimmed;
    search_trimmed.reserve(search.size());
    for (const auto& line : search) search_trimmed.push_back(trim(line));

    auto lines = line_spans(content);
    if (lines.size() < search.size()) return matches;

    bool take_newline = ends_with_newline(old_text);
    for (size_t i = 0; i + search.size() <= lines.size(); ++i) {
        bool all_match = true;
        for (size_t j = 0; j < search.size(); ++j) {
            if (trim(span_text(content, lines[i + j])) != search_trimmed[j]) {
                all_match = false;
                break;
            }
        }
        if (all_match) {
            matches.push_back(block_span(content, lines, i, i + search.size() - 1, take_newline));
        }
    }
    return matches;
}

std::vector<MatchSpan> find_whitespace_normalized(const std::string& content,
                                                  const std::string& old_text) {
    std::vector<MatchSpan> matches;
    std::string normalized_old = collapse_whitespace(old_text);
    if (normalized_old.empty()) return matches;

    for (const auto& span : line_spans(content)) {
        if (collapse_whitespace(span_text(content, span)) == normalized_old) {
            matches.push_back(span);
        }
    }
    return matches;
}

std::vector<MatchSpan> find_block_anchor(const std::string& content, const std::string& old_text) {
    std::vector<MatchSpan> matches;
    auto search = split_lines(old_text);
    if (search.size() < 3) return matches;

    std::string first_line = trim(search.front());
    std::string last_line = trim(search.back());
    bool take_newline = ends_with_newline(old_text);

    auto lines = line_spans(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (trim(span_text(content, lines[i])) != first_line) continue;
        for (size_t j = i + 2; j < lines.size(); ++j) {
            if (trim(span_text(content, lines[j])) == last_line) {
                matches.push_back(block_span(content, lines, i, j, take_newline));
                break;
            }
        }
    }
    return matches;
}

Result<std::string> replace_text(const std::string& content, const std::string& old_text,
                                 const std::string& new_text, bool replace_all) {
    using Finder = std::vector<MatchSpan> (*)(const std::string&, const std::string&);
    static const std::pair<MatchStrategy, Finder> cascade[] = {
        {MatchStrategy::Exact, &find_exact},
        {MatchStrategy::LineTrimmed, &find_line_trimmed},
        {MatchStrategy::WhitespaceNormalized, &find_whitespace_normalized},
        {MatchStrategy::BlockAnchor, &find_block_anchor},
    };

    for (const auto& [strategy, finder] : cascade) {
        auto candidates = finder(content, old_text);
        if (candidates.empty()) continue;

        if (!replace_all) {
            if (candidates.size() > 1) {
                return AgentError::tool_execution(
                    "edit",
                    "oldString found " + std::to_string(candidates.size()) +
                    " times in content (" + match_strategy_name(strategy) +
                    " match). Provide more surrounding context to make the match "
                    "unique, or set replaceAll to replace every occurrence.");
            }
            return apply_spans(content, candidates, new_text);
        }

        return apply_spans(content, non_overlapping(candidates), new_text);
    }

    return AgentError::tool_execution("edit", "oldString not found in content");
}

std::string normalize_line_endings(const std::string& text) {
    return replace_all(text, "\r\n", "\n");
}

} // namespace linkagent
