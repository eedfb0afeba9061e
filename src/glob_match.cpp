#include "glob_match.hpp"
#include "util.hpp"

namespace linkagent {

namespace {

bool has_wildcard(const std::string& component) {
    return component.find_first_of("*?[") != std::string::npos;
}

// Match ch against the class starting at pattern[start] == '['. On return
// `next` points just past the closing ']'.
bool match_class(const std::string& pattern, size_t start, char ch, size_t& next) {
    size_t i = start + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (pattern[i] != ']' || first)) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (lo <= ch && ch <= hi) matched = true;
            i += 3;
        } else {
            if (lo == ch) matched = true;
            ++i;
        }
    }
    next = i + 1;
    return matched != negate;
}

bool match_components(const std::vector<std::string>& pattern, size_t pi,
                      const std::vector<std::string>& parts, size_t si) {
    if (pi == pattern.size()) return si == parts.size();
    if (pattern[pi] == "**") {
        for (size_t k = si; k <= parts.size(); ++k) {
            if (match_components(pattern, pi + 1, parts, k)) return true;
        }
        return false;
    }
    if (si == parts.size()) return false;
    return glob_match_name(pattern[pi], parts[si]) &&
           match_components(pattern, pi + 1, parts, si + 1);
}

std::vector<std::string> components(const std::string& path) {
    std::vector<std::string> out;
    for (auto& part : split(path, '/')) {
        if (!part.empty()) out.push_back(std::move(part));
    }
    return out;
}

} // namespace

std::optional<std::string> glob_syntax_error(const std::string& pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '[') continue;
        size_t j = i + 1;
        if (j < pattern.size() && (pattern[j] == '!' || pattern[j] == '^')) ++j;
        if (j < pattern.size() && pattern[j] == ']') ++j;
        while (j < pattern.size() && pattern[j] != ']') ++j;
        if (j >= pattern.size()) {
            return "unclosed character class at position " + std::to_string(i);
        }
        i = j;
    }

    for (const auto& component : split(pattern, '/')) {
        if (component != "**" && component.find("**") != std::string::npos) {
            return "recursive wildcard '**' must form a whole path component";
        }
    }
    return std::nullopt;
}

bool glob_match_name(const std::string& pattern, const std::string& name) {
    size_t pi = 0;
    size_t si = 0;
    size_t star_pi = std::string::npos;
    size_t star_si = 0;

    while (si < name.size()) {
        if (pi < pattern.size()) {
            char c = pattern[pi];
            if (c == '*') {
                star_pi = pi++;
                star_si = si;
                continue;
            }
            if (c == '?') {
                ++pi;
                ++si;
                continue;
            }
            if (c == '[') {
                size_t next = pi;
                if (match_class(pattern, pi, name[si], next)) {
                    pi = next;
                    ++si;
                    continue;
                }
            } else if (c == name[si]) {
                ++pi;
                ++si;
                continue;
            }
        }
        // Mismatch: let the last '*' absorb one more character
        if (star_pi != std::string::npos) {
            pi = star_pi + 1;
            si = ++star_si;
            continue;
        }
        return false;
    }

    while (pi < pattern.size() && pattern[pi] == '*') ++pi;
    return pi == pattern.size();
}

bool glob_match_path(const std::string& pattern, const std::string& path) {
    return match_components(components(pattern), 0, components(path), 0);
}

std::vector<std::filesystem::path> glob_files(const std::string& pattern) {
    namespace fs = std::filesystem;
    std::vector<fs::path> out;

    auto parts = components(pattern);
    fs::path base = (!pattern.empty() && pattern[0] == '/') ? fs::path("/") : fs::path(".");
    size_t literal = 0;
    while (literal < parts.size() && !has_wildcard(parts[literal])) {
        base /= parts[literal];
        ++literal;
    }

    std::error_code ec;
    if (literal == parts.size()) {
        if (fs::is_regular_file(base, ec)) out.push_back(base);
        return out;
    }
    if (!fs::is_directory(base, ec)) return out;

    std::string rest;
    bool recursive = false;
    for (size_t i = literal; i < parts.size(); ++i) {
        if (!rest.empty()) rest += '/';
        rest += parts[i];
        if (parts[i] == "**") recursive = true;
    }
    const int max_depth = static_cast<int>(parts.size() - literal) - 1;

    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) return out;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        if (!recursive && it.depth() >= max_depth) {
            it.disable_recursion_pending();
        }
        if (!it->is_regular_file(ec)) continue;
        auto relative = it->path().lexically_relative(base).generic_string();
        if (glob_match_path(rest, relative)) {
            out.push_back(it->path());
        }
    }
    return out;
}

} // namespace linkagent
