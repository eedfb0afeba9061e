#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkagent {

// Shell-style patterns: '*' and '?' within one path component, '[abc]',
// '[a-z]' and negated '[!abc]' classes, and '**' as a whole component
// spanning zero or more directories.

// nullopt when the pattern is well formed, otherwise what is wrong with it
std::optional<std::string> glob_syntax_error(const std::string& pattern);

// Match a single path component (no '/')
bool glob_match_name(const std::string& pattern, const std::string& name);

// Match a '/'-separated relative path component by component
bool glob_match_path(const std::string& pattern, const std::string& path);

// Regular files matching an absolute, well-formed pattern. The walk starts
// at the longest wildcard-free leading directory. Unreadable directories
// are skipped.
std::vector<std::filesystem::path> glob_files(const std::string& pattern);

} // namespace linkagent
