#include "diff.hpp"

#include <algorithm>

namespace linkagent {

namespace {

// Beyond this many stored trace entries the middle section is emitted as a
// plain delete-all/insert-all block instead of a minimal script.
constexpr size_t kMaxTraceEntries = size_t{1} << 24;

std::vector<std::string> tokenize_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < s.size()) {
        size_t nl = s.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back(s.substr(pos));
            break;
        }
        lines.push_back(s.substr(pos, nl - pos + 1));
        pos = nl + 1;
    }
    return lines;
}

// Myers O(ND) on a[a0..a1) vs b[b0..b1), appending ops to out
void myers(const std::vector<std::string>& a, size_t a0, size_t a1,
           const std::vector<std::string>& b, size_t b0, size_t b1,
           std::vector<DiffLine>& out) {
    const long n = static_cast<long>(a1 - a0);
    const long m = static_cast<long>(b1 - b0);
    const long max = n + m;
    if (max == 0) return;

    const long offset = max + 1;
    const size_t width = static_cast<size_t>(2 * max + 3);
    std::vector<long> v(width, 0);
    std::vector<std::vector<long>> trace;

    bool found = false;
    for (long d = 0; d <= max && !found; ++d) {
        if ((trace.size() + 1) * width > kMaxTraceEntries) break;
        trace.push_back(v);
        for (long k = -d; k <= d; k += 2) {
            long x;
            if (k == -d || (k != d && v[k - 1 + offset] < v[k + 1 + offset])) {
                x = v[k + 1 + offset];
            } else {
                x = v[k - 1 + offset] + 1;
            }
            long y = x - k;
            while (x < n && y < m && a[a0 + x] == b[b0 + y]) {
                ++x;
                ++y;
            }
            v[k + offset] = x;
            if (x >= n && y >= m) {
                found = true;
                break;
            }
        }
    }

    if (!found) {
        for (size_t i = a0; i < a1; ++i) out.push_back({DiffTag::Delete, a[i]});
        for (size_t j = b0; j < b1; ++j) out.push_back({DiffTag::Insert, b[j]});
        return;
    }

    // Walk the trace backwards, collecting ops in reverse
    std::vector<DiffLine> rev;
    long x = n;
    long y = m;
    for (long d = static_cast<long>(trace.size()) - 1; d >= 0; --d) {
        const auto& vd = trace[static_cast<size_t>(d)];
        long k = x - y;
        long prev_k;
        if (k == -d || (k != d && vd[k - 1 + offset] < vd[k + 1 + offset])) {
            prev_k = k + 1;
        } else {
            prev_k = k - 1;
        }
        long prev_x = vd[prev_k + offset];
        long prev_y = prev_x - prev_k;

        while (x > prev_x && y > prev_y) {
            rev.push_back({DiffTag::Equal, a[a0 + x - 1]});
            --x;
            --y;
        }
        if (d == 0) break;
        if (x == prev_x) {
            rev.push_back({DiffTag::Insert, b[b0 + y - 1]});
        } else {
            rev.push_back({DiffTag::Delete, a[a0 + x - 1]});
        }
        x = prev_x;
        y = prev_y;
    }
    // Leading snake of d == 0
    while (x > 0 && y > 0) {
        rev.push_back({DiffTag::Equal, a[a0 + x - 1]});
        --x;
        --y;
    }

    out.insert(out.end(), rev.rbegin(), rev.rend());
}

} // namespace

std::vector<DiffLine> diff_lines(const std::string& before, const std::string& after) {
    auto a = tokenize_lines(before);
    auto b = tokenize_lines(after);

    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    std::vector<DiffLine> out;
    out.reserve(a.size() + b.size());
    for (size_t i = 0; i < prefix; ++i) {
        out.push_back({DiffTag::Equal, a[i]});
    }
    myers(a, prefix, a.size() - suffix, b, prefix, b.size() - suffix, out);
    for (size_t i = a.size() - suffix; i < a.size(); ++i) {
        out.push_back({DiffTag::Equal, a[i]});
    }
    return out;
}

DiffStats diff_stats(const std::vector<DiffLine>& lines) {
    DiffStats stats;
    for (const auto& line : lines) {
        if (line.tag == DiffTag::Insert) ++stats.additions;
        else if (line.tag == DiffTag::Delete) ++stats.deletions;
    }
    return stats;
}

std::string unified_diff(const std::vector<DiffLine>& lines, const std::string& path,
                         size_t context) {
    std::string result = "--- " + path + "\n+++ " + path + "\n";

    std::vector<size_t> changes;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].tag != DiffTag::Equal) changes.push_back(i);
    }

    size_t c = 0;
    bool first_hunk = true;
    while (c < changes.size()) {
        // Merge changes separated by at most 2*context unchanged lines
        size_t last = c;
        while (last + 1 < changes.size() &&
               changes[last + 1] - changes[last] - 1 <= 2 * context) {
            ++last;
        }

        size_t begin = changes[c] > context ? changes[c] - context : 0;
        size_t end = std::min(lines.size(), changes[last] + context + 1);

        if (!first_hunk) result += "...\n";
        first_hunk = false;

        for (size_t i = begin; i < end; ++i) {
            switch (lines[i].tag) {
                case DiffTag::Delete: result += '-'; break;
                case DiffTag::Insert: result += '+'; break;
                case DiffTag::Equal:  result += ' '; break;
            }
            result += lines[i].text;
            if (lines[i].text.empty() || lines[i].text.back() != '\n') {
                result += '\n';
            }
        }

        c = last + 1;
    }

    return result;
}

std::string unified_diff(const std::string& before, const std::string& after,
                         const std::string& path, size_t context) {
    return unified_diff(diff_lines(before, after), path, context);
}

} // namespace linkagent
