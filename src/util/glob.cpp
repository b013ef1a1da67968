#include <packmeta/glob.hpp>
#include <vector>

namespace packmeta {

static std::vector<std::string> split_path(const std::string& p) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : p) {
        if (c == '/' || c == '\\') {
            // drop empty and "." segments so "./crates//a/" == "crates/a"
            if (!cur.empty() && cur != ".") segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty() && cur != ".") segs.push_back(cur);
    return segs;
}

// Bracket expression starting at pat[pi] == '['. On success sets `next` to
// the index after ']' and `matched` to whether c is in the class.
static bool match_class(const std::string& pat, size_t pi, char c,
                        size_t& next, bool& matched) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pat.size() && (pat[i] == '!' || pat[i] == '^')) {
        negate = true;
        i++;
    }

    bool hit = false;
    bool first = true;
    while (i < pat.size() && (first || pat[i] != ']')) {
        first = false;
        char lo = pat[i];
        if (i + 2 < pat.size() && pat[i + 1] == '-' && pat[i + 2] != ']') {
            char hi = pat[i + 2];
            if (c >= lo && c <= hi) hit = true;
            i += 3;
        } else {
            if (c == lo) hit = true;
            i++;
        }
    }
    if (i >= pat.size()) return false;  // no closing ']'

    next = i + 1;
    matched = negate ? !hit : hit;
    return true;
}

static bool match_segment(const std::string& pat, const std::string& s) {
    // iterative wildcard match with single-star backtracking
    size_t pi = 0, si = 0;
    size_t star_pi = std::string::npos, star_si = 0;

    while (si < s.size()) {
        if (pi < pat.size()) {
            char pc = pat[pi];
            if (pc == '*') {
                star_pi = pi++;
                star_si = si;
                continue;
            }
            if (pc == '?') {
                pi++;
                si++;
                continue;
            }
            if (pc == '[') {
                size_t next = 0;
                bool matched = false;
                if (match_class(pat, pi, s[si], next, matched)) {
                    if (matched) {
                        pi = next;
                        si++;
                        continue;
                    }
                } else if (s[si] == '[') {
                    // unterminated class: treat '[' literally
                    pi++;
                    si++;
                    continue;
                }
            } else if (pc == s[si]) {
                pi++;
                si++;
                continue;
            }
        }

        if (star_pi == std::string::npos) return false;
        pi = star_pi + 1;
        si = ++star_si;
    }

    while (pi < pat.size() && pat[pi] == '*') pi++;
    return pi == pat.size();
}

static bool match_from(const std::vector<std::string>& pat, size_t pi,
                       const std::vector<std::string>& path, size_t si) {
    if (pi == pat.size()) return si == path.size();

    if (pat[pi] == "**") {
        for (size_t k = si; k <= path.size(); k++) {
            if (match_from(pat, pi + 1, path, k)) return true;
        }
        return false;
    }

    if (si == path.size()) return false;
    if (!match_segment(pat[pi], path[si])) return false;
    return match_from(pat, pi + 1, path, si + 1);
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_from(split_path(pattern), 0, split_path(path), 0);
}

} // namespace packmeta
