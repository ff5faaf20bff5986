// lode_find.cpp
//
// Command-line front end for the search engine. Finds files under a project
// root by name glob, content regex, modification date and size:
//
//     ./lode-find . --resource "*.cpp|*.hpp" --content "TODO"
//     ./lode-find src --after 2024-01-01 --max 4096
//     ./lode-find . --content "[" # bad regex -> 0 results plus the reason
//
// Settings come from ~/.lode/config.toml and <root>/.lode.toml, or from the
// file given with --config.

#include <lode/config.hpp>
#include <lode/log.hpp>
#include <lode/search.hpp>

#include <iostream>
#include <optional>
#include <string>

using namespace lode;

struct CliArgs {
    std::string root;
    SearchRequest request;
    std::optional<std::string> config_file;
    bool include_content = false;
    bool verbose = false;
};

static const char* USAGE =
    "usage: lode-find <root> [--content RE] [--case-sensitive] [--resource GLOB]\n"
    "                 [--after YYYY-MM-DD] [--before YYYY-MM-DD] [--min N] [--max N]\n"
    "                 [--include-content] [--config FILE] [--verbose]";

static Result<CliArgs> parse_args(int argc, char** argv) {
    CliArgs args;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];

        auto next = [&](const std::string& flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return LodeError{LodeError::InvalidArg,
                    flag + " requires a value", USAGE};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (a == "--content" || a == "--resource" || a == "--after" ||
            a == "--before" || a == "--config") {
            auto v = next(a);
            LODE_TRY(v);
            if (a == "--content") args.request.content_pattern = v.value();
            else if (a == "--resource") args.request.resource_pattern = v.value();
            else if (a == "--after") args.request.date_after = v.value();
            else if (a == "--before") args.request.date_before = v.value();
            else args.config_file = v.value();
        } else if (a == "--min" || a == "--max") {
            auto v = next(a);
            LODE_TRY(v);
            auto n = parse_size_arg(a, v.value());
            LODE_TRY(n);
            if (a == "--min") args.request.size_min = n.value();
            else args.request.size_max = n.value();
        } else if (a == "--case-sensitive") {
            args.request.case_sensitive = true;
        } else if (a == "--include-content") {
            args.include_content = true;
        } else if (a == "--verbose" || a == "-v") {
            args.verbose = true;
        } else if (!a.empty() && a[0] == '-') {
            return LodeError{LodeError::InvalidArg, "unknown option " + a, USAGE};
        } else if (args.root.empty()) {
            args.root = a;
        } else {
            return LodeError{LodeError::InvalidArg,
                "unexpected argument '" + a + "'", USAGE};
        }
    }
    if (args.root.empty()) {
        return LodeError{LodeError::InvalidArg, "no search root given", USAGE};
    }
    return Result<CliArgs>::ok(std::move(args));
}

static Result<SearchConfig> load_config(const CliArgs& args) {
    if (args.config_file.has_value()) {
        return SearchConfig::load(*args.config_file);
    }
    return load_layered_config(args.root);
}

static void print_matches(const SearchResult& result) {
    for (const auto& fm : result.content_matches) {
        std::cout << "\n" << fm.path << "\n";
        for (const auto& m : fm.matches) {
            size_t n = m.line_number - m.context_before.size();
            for (const auto& l : m.context_before) std::cout << "  " << n++ << "- " << l << "\n";
            std::cout << "  " << m.line_number << ": " << m.content << "\n";
            n = m.line_number + 1;
            for (const auto& l : m.context_after) std::cout << "  " << n++ << "- " << l << "\n";
        }
    }
}

static Result<SearchResult> run(int argc, char** argv) {
    auto args = parse_args(argc, argv);
    LODE_TRY(args);

    auto config = load_config(args.value());
    LODE_TRY(config);
    config.value().apply_logging();
    if (args.value().verbose) log::set_level(log::Debug);

    auto criteria = SearchCriteria::from_request(args.value().request);
    LODE_TRY(criteria);

    auto options = config.value().to_options(args.value().root);
    if (args.value().include_content) options.include_content = true;

    return search(args.value().root, criteria.value(), std::move(options));
}

int main(int argc, char** argv) {
    log::set_level(log::Warn);

    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }

    std::cout << format_report(result.value()) << "\n";
    print_matches(result.value());
    return 0;
}
