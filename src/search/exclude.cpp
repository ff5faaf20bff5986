#include <lode/exclude.hpp>
#include <lode/log.hpp>
#include <algorithm>
#include <fstream>

namespace lode {

namespace fs = std::filesystem;

static const char* const BUILTIN_EXCLUDES[] = {".bb", ".git", ".trash"};

static const char* const IGNORE_FILES[] = {
    "tags.ignore",
    ".gitignore",
    ".bb/ignore",
    ".bb/tags.ignore",
};

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> ExcludeRules::read_ignore_file(const fs::path& file) {
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) return out;

    std::ifstream in(file);
    if (!in.is_open()) {
        lode::log::warn("cannot read ignore file %s", file.string().c_str());
        return out;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        size_t b = line.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        size_t e = line.find_last_not_of(" \t");
        line = line.substr(b, e - b + 1);
        if (line[0] == '#') continue;
        size_t slash = line.find_first_not_of('/');
        if (slash == std::string::npos) continue;
        out.push_back(line.substr(slash));
    }
    return out;
}

ExcludeRules ExcludeRules::from_ignore_files(const fs::path& root) {
    ExcludeRules rules;
    for (const char* name : BUILTIN_EXCLUDES) {
        rules.add_pattern(name);
    }
    for (const char* name : IGNORE_FILES) {
        for (const auto& pattern : read_ignore_file(root / name)) {
            rules.add_pattern(pattern);
        }
    }
    lode::log::debug("loaded %zu exclude patterns under %s",
                     rules.patterns_.size(), root.string().c_str());
    return rules;
}

void ExcludeRules::add_pattern(const std::string& pattern) {
    if (pattern.empty()) return;
    if (pattern[0] == '!') {
        lode::log::debug("ignoring negated exclude pattern '%s'", pattern.c_str());
        return;
    }
    if (std::find(patterns_.begin(), patterns_.end(), pattern) != patterns_.end()) {
        return;
    }

    patterns_.push_back(pattern);
    globs_.push_back(CompiledGlob::compile(pattern));

    for (const auto& alt : split_alternatives(pattern)) {
        std::string dir = alt;
        if (ends_with(dir, "/**")) {
            dir.resize(dir.size() - 3);
        } else if (ends_with(dir, "/")) {
            dir.pop_back();
        } else {
            continue;
        }
        if (!dir.empty()) dir_globs_.push_back(CompiledGlob::compile(dir));
    }
}

bool ExcludeRules::excludes_dir(const std::string& rel_dir) const {
    for (const auto& g : globs_) {
        if (g.matches(rel_dir)) return true;
    }
    for (const auto& g : dir_globs_) {
        if (g.matches(rel_dir)) return true;
    }
    return false;
}

bool ExcludeRules::excludes_file(const std::string& rel_path) const {
    for (const auto& g : globs_) {
        if (g.matches(rel_path)) return true;
    }
    return false;
}

} // namespace lode
