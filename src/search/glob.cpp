#include <lode/glob.hpp>
#include <lode/log.hpp>

namespace lode {

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Relative paths never start with "./" or "/"
    while (out.size() >= 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    while (!out.empty() && out[0] == '/') out.erase(0, 1);
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) e--;
    return s.substr(b, e - b);
}

// Index of the ']' closing a bracket class opened at `open`, or npos when the
// class is unterminated (the '[' is then a literal character).
static size_t find_class_end(const std::string& pat, size_t open) {
    size_t i = open + 1;
    if (i < pat.size() && pat[i] == '!') i++;
    // A ']' right after the opening is part of the set
    if (i < pat.size() && pat[i] == ']') i++;
    while (i < pat.size() && pat[i] != ']') {
        if (pat[i] == '/') return std::string::npos;
        i++;
    }
    return i < pat.size() ? i : std::string::npos;
}

static bool class_contains(const std::string& pat, size_t open, size_t close, char c) {
    size_t i = open + 1;
    bool negate = false;
    if (i < close && pat[i] == '!') {
        negate = true;
        i++;
    }
    bool hit = false;
    while (i < close) {
        char lo = pat[i];
        if (i + 2 < close && pat[i + 1] == '-') {
            char hi = pat[i + 2];
            if (c >= lo && c <= hi) hit = true;
            i += 3;
        } else {
            if (c == lo) hit = true;
            i++;
        }
    }
    return negate ? !hit : hit;
}

// Match a single path segment against a pattern segment (no '/' in either).
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            // Consecutive stars in a single segment collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (si == str.size()) return false;

        if (pc == '?') {
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            size_t close = find_class_end(pat, pi);
            if (close != std::string::npos) {
                if (!class_contains(pat, pi, close, str[si])) return false;
                pi = close + 1;
                si++;
                continue;
            }
            // unterminated: fall through as a literal '['
        }

        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    return si == str.size();
}

// Backtracking match over path segments. Each '**' tries every split point,
// so several '**' in one pattern are explored correctly.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            if (pi == pat_segs.size()) return true;
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    // Trailing '**' may match nothing
    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// Can the directory `dir_segs` be a proper prefix of some path matching
// `pat_segs`?
static bool prefix_could_match(const std::vector<std::string>& pat_segs, size_t pi,
                               const std::vector<std::string>& dir_segs, size_t di) {
    if (pi < pat_segs.size() && pat_segs[pi] == "**") return true;
    if (di == dir_segs.size()) return pi < pat_segs.size();
    if (pi == pat_segs.size()) return false;
    if (!match_segment(pat_segs[pi], 0, dir_segs[di], 0)) return false;
    return prefix_could_match(pat_segs, pi + 1, dir_segs, di + 1);
}

// ---- Public API ----

bool glob_match(const std::string& pattern, const std::string& path) {
    auto pat_segs = split_segments(normalize_path(pattern));
    auto path_segs = split_segments(normalize_path(path));
    return match_segments(pat_segs, 0, path_segs, 0);
}

std::vector<std::string> split_alternatives(const std::string& pattern) {
    std::vector<std::string> out;
    std::string cur;
    size_t i = 0;
    while (i < pattern.size()) {
        char c = pattern[i];
        if (c == '[') {
            size_t close = find_class_end(pattern, i);
            if (close != std::string::npos) {
                cur.append(pattern, i, close - i + 1);
                i = close + 1;
                continue;
            }
        }
        if (c == '|') {
            auto alt = trim(cur);
            if (!alt.empty()) out.push_back(alt);
            cur.clear();
        } else {
            cur.push_back(c);
        }
        i++;
    }
    auto alt = trim(cur);
    if (!alt.empty()) out.push_back(alt);
    return out;
}

CompiledGlob CompiledGlob::compile(const std::string& pattern) {
    CompiledGlob glob;
    glob.source_ = pattern;

    for (const auto& raw : split_alternatives(pattern)) {
        std::string text = raw;
        for (char& c : text) {
            if (c == '\\') c = '/';
        }
        // "dir/" selects everything below dir
        if (text.size() > 1 && text.back() == '/') text += "**";
        text = normalize_path(text);
        if (text.empty()) continue;

        GlobAlternative alt;
        alt.source = text;
        alt.bare = text.find('/') == std::string::npos;
        alt.segments = split_segments(text);
        glob.alternatives_.push_back(std::move(alt));
    }

    if (glob.alternatives_.empty()) {
        lode::log::debug("resource pattern '%s' has no usable alternative; nothing will match",
                         pattern.c_str());
    }
    return glob;
}

bool CompiledGlob::matches(const std::string& rel_path) const {
    if (alternatives_.empty()) return false;

    auto norm = normalize_path(rel_path);
    auto path_segs = split_segments(norm);
    const auto& name = path_segs.back();

    for (const auto& alt : alternatives_) {
        if (alt.bare) {
            // A bare name matches the final segment at any depth; this also
            // covers the "ends with /<pattern>" and exact-path cases.
            if (match_segment(alt.source, 0, name, 0)) return true;
            continue;
        }
        if (match_segments(alt.segments, 0, path_segs, 0)) return true;
    }
    return false;
}

bool CompiledGlob::could_match_below(const std::string& rel_dir) const {
    auto norm = normalize_path(rel_dir);
    if (norm.empty()) return !alternatives_.empty();

    auto dir_segs = split_segments(norm);
    for (const auto& alt : alternatives_) {
        if (alt.bare) return true;
        if (prefix_could_match(alt.segments, 0, dir_segs, 0)) return true;
    }
    return false;
}

} // namespace lode
