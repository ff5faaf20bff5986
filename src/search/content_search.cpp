#include <lode/content_search.hpp>
#include <lode/log.hpp>
#include <re2/re2.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace lode {

// ---------------------------------------------------------------------------
// ContentPattern
// ---------------------------------------------------------------------------

Result<ContentPattern> ContentPattern::compile(const std::string& source,
                                               bool case_sensitive) {
    RE2::Options opts;
    opts.set_case_sensitive(case_sensitive);
    opts.set_log_errors(false);

    auto re = std::make_shared<const RE2>(source, opts);
    if (!re->ok()) {
        std::string msg = "Invalid regular expression: /" + source + "/" +
                          (case_sensitive ? "" : "i") + ": " + re->error();
        return LodeError{LodeError::InvalidPattern, std::move(msg)};
    }

    ContentPattern p;
    p.source_ = source;
    p.case_sensitive_ = case_sensitive;
    p.regex_ = std::move(re);
    return Result<ContentPattern>::ok(std::move(p));
}

// ---------------------------------------------------------------------------
// Utf8Validator
// ---------------------------------------------------------------------------

bool Utf8Validator::feed(const char* data, size_t len) {
    for (size_t i = 0; i < len && ok_; i++) {
        auto b = static_cast<unsigned char>(data[i]);

        if (need_ > 0) {
            if (b < lo_ || b > hi_) {
                ok_ = false;
                break;
            }
            lo_ = 0x80;
            hi_ = 0xBF;
            need_--;
            continue;
        }

        if (b < 0x80) continue;
        if (b >= 0xC2 && b <= 0xDF) {
            need_ = 1;
        } else if (b == 0xE0) {
            need_ = 2;
            lo_ = 0xA0;  // no overlong forms
        } else if (b == 0xED) {
            need_ = 2;
            hi_ = 0x9F;  // no surrogates
        } else if (b >= 0xE1 && b <= 0xEF) {
            need_ = 2;
        } else if (b == 0xF0) {
            need_ = 3;
            lo_ = 0x90;
        } else if (b >= 0xF1 && b <= 0xF3) {
            need_ = 3;
        } else if (b == 0xF4) {
            need_ = 3;
            hi_ = 0x8F;  // <= U+10FFFF
        } else {
            ok_ = false;
        }
    }
    return ok_;
}

// ---------------------------------------------------------------------------
// StreamingContentSearcher
// ---------------------------------------------------------------------------

StreamingContentSearcher::StreamingContentSearcher(StreamOptions options)
    : options_(options) {
    if (options_.chunk_size == 0) options_.chunk_size = DEFAULT_CHUNK_SIZE;
}

// Search window[lead, end). The whole window is passed as context, so ^ and
// \b at the range start see the byte before it. Unless the window ends at
// EOF its last byte is context only: $ cannot match there and \b sees the
// real next byte. That byte is searched again in the next window.
static bool search_window(const std::string& window, size_t lead, bool at_eof,
                          const RE2& re) {
    size_t end = at_eof ? window.size() : window.size() - 1;
    if (lead > end) return false;
    return re.Match(re2::StringPiece(window.data(), window.size()), lead, end,
                    RE2::UNANCHORED, nullptr, 0);
}

Result<bool> StreamingContentSearcher::contains_match(const fs::path& file,
                                                      const ContentPattern& pattern) const {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return LodeError{LodeError::IO, "cannot open file: " + file.string()};
    }

    const size_t chunk = options_.chunk_size;
    // Tail kept between windows: the carry-over, the unsearched last byte of
    // the previous window, and one byte of left context
    const size_t keep = options_.carry_over + 2;
    std::vector<char> buf(chunk);
    std::string window;
    window.reserve(keep + chunk);

    Utf8Validator utf8;
    bool trimmed = false;        // bytes before the window were dropped
    bool matched = false;
    bool tested_at_eof = false;

    while (true) {
        in.read(buf.data(), static_cast<std::streamsize>(chunk));
        auto n = static_cast<size_t>(in.gcount());
        if (in.bad()) {
            return LodeError{LodeError::IO, "read error: " + file.string()};
        }
        if (n == 0) break;

        if (!utf8.feed(buf.data(), n)) {
            lode::log::debug("%s is not valid UTF-8; treating as no match",
                             file.string().c_str());
            return Result<bool>::ok(false);
        }
        // Past the first hit only the encoding still matters
        if (matched) continue;

        window.append(buf.data(), n);
        bool at_eof = n < chunk || in.peek() == std::char_traits<char>::eof();

        if (search_window(window, trimmed ? 1 : 0, at_eof, pattern.regex())) {
            matched = true;
            continue;
        }
        if (at_eof) {
            tested_at_eof = true;
            break;
        }

        if (window.size() > keep) {
            window.erase(0, window.size() - keep);
            trimmed = true;
        }
    }

    if (!utf8.complete()) {
        lode::log::debug("%s ends inside a UTF-8 sequence; treating as no match",
                         file.string().c_str());
        return Result<bool>::ok(false);
    }
    if (!matched && !tested_at_eof && !window.empty()) {
        matched = search_window(window, trimmed ? 1 : 0, true, pattern.regex());
    }
    return Result<bool>::ok(matched);
}

// ---------------------------------------------------------------------------
// Match extraction
// ---------------------------------------------------------------------------

static std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

static ContentMatch make_match(const std::vector<std::string>& lines, size_t idx,
                               size_t start, size_t end, size_t context_lines) {
    ContentMatch m;
    m.line_number = idx + 1;
    m.content = lines[idx];
    size_t first = idx >= context_lines ? idx - context_lines : 0;
    size_t last = std::min(lines.size(), idx + 1 + context_lines);
    m.context_before.assign(lines.begin() + static_cast<std::ptrdiff_t>(first),
                            lines.begin() + static_cast<std::ptrdiff_t>(idx));
    m.context_after.assign(lines.begin() + static_cast<std::ptrdiff_t>(idx + 1),
                           lines.begin() + static_cast<std::ptrdiff_t>(last));
    m.match_start = std::min(start, m.content.size());
    m.match_end = std::min(end, m.content.size());
    return m;
}

Result<std::vector<ContentMatch>> find_matches(const fs::path& file,
                                               const ContentPattern& pattern,
                                               size_t context_lines,
                                               size_t max_matches) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return LodeError{LodeError::IO, "cannot open file: " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string text = ss.str();

    std::vector<ContentMatch> out;
    Utf8Validator utf8;
    if (!utf8.feed(text.data(), text.size()) || !utf8.complete()) {
        return Result<std::vector<ContentMatch>>::ok(std::move(out));
    }

    auto lines = split_lines(text);
    std::vector<size_t> line_starts{0};
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == '\n') line_starts.push_back(i + 1);
    }

    const re2::StringPiece subject(text.data(), text.size());
    re2::StringPiece m;
    size_t pos = 0;
    while (pos <= text.size() && out.size() < max_matches) {
        if (!pattern.regex().Match(subject, pos, text.size(), RE2::UNANCHORED, &m, 1)) {
            break;
        }
        auto start = static_cast<size_t>(m.data() - text.data());
        auto idx = static_cast<size_t>(
            std::upper_bound(line_starts.begin(), line_starts.end(), start) -
            line_starts.begin()) - 1;
        size_t col = start - line_starts[idx];
        out.push_back(make_match(lines, idx, col, col + m.size(), context_lines));

        // Resume on the next line; an empty match still advances
        size_t next_line = idx + 1 < line_starts.size() ? line_starts[idx + 1]
                                                        : text.size() + 1;
        pos = std::max(next_line, start + std::max<size_t>(m.size(), 1));
    }
    return Result<std::vector<ContentMatch>>::ok(std::move(out));
}

} // namespace lode
