#include "nicefind/cli.h"

#include <algorithm>
#include <sstream>
#include <string_view>

#include "nicefind/utility.h"
#include "nicefind/version.h"

namespace nicefind {

namespace {
constexpr std::string_view kDescription =
    "nicefind: breadth-first file search that streams matches as it finds them and honours .gitignore";

std::vector<std::string> normalize_extensions(const std::vector<std::string>& raw) {
    std::vector<std::string> result;
    for (const auto& item : raw) {
        auto ext = trim(item);
        if (!ext.empty() && ext.front() == '.') {
            ext.remove_prefix(1);
        }
        if (!ext.empty()) {
            result.emplace_back(ext);
        }
    }
    return result;
}
} // namespace

Cli::Cli()
    : app_{std::make_unique<CLI::App>(std::string{kDescription}, "nicefind")} {
    app_->set_version_flag("--version", std::string{kVersion});
    app_->footer(R"(PATTERN is matched naively: every '*' is removed and the remainder must
appear somewhere in the file name ("abc*" matches "xabc.txt" too).

Only the .gitignore directly inside ROOT is read; nested, global and
.git/info/exclude rules are not consulted.

Exit status:
 0  if OK,
 1  if minor problems (e.g., cannot read a subdirectory),
 2  if serious trouble (e.g., the search could not be started).
Invalid command lines exit with CLI11's error codes.)");

    add_search_options();
    add_filter_options();
    add_output_options();

    auto* dump = app_->add_flag("--dump-markdown", options_.dump_markdown, "Print CLI options as markdown and exit");
    dump->configurable(false);
    document_option(dump);
}

Cli::~Cli() = default;

void Cli::add_search_options() {
    auto* root = app_->add_option("root", options_.filter.root, "Directory to search from");
    root->capture_default_str();
    document_option(root);

    auto* depth = app_->add_option("-m,--max-depth", options_.filter.max_depth,
                                   "Maximum directory depth below ROOT (0 lists ROOT only)");
    document_option(depth);

    auto* capacity = app_->add_option("--capacity", options_.channel_capacity,
                                      "Results buffered ahead of the printer before the walk waits");
    capacity->check(CLI::Range(std::size_t{1}, std::size_t{65536}));
    capacity->capture_default_str();
    document_option(capacity);
}

void Cli::add_filter_options() {
    auto filtering = app_->add_option_group("Filtering");

    auto* pattern = filtering->add_option("-p,--pattern", options_.filter.pattern,
                                          "File name pattern ('*' wildcards only)");
    pattern->capture_default_str();
    document_option(pattern);

    auto* extensions = filtering->add_option("-e,--extensions", extensions_,
                                             "Only report files with these extensions (comma separated)");
    extensions->delimiter(',');
    document_option(extensions);

    document_option(filtering->add_flag("-H,--show-hidden", options_.filter.show_hidden,
                                        "Include hidden files and directories"));

    document_option(filtering->add_flag("--include-gitignored", options_.filter.include_ignored,
                                        "Do not skip paths excluded by ROOT/.gitignore"));
}

void Cli::add_output_options() {
    auto output = app_->add_option_group("Output");

    document_option(output->add_flag("-0,--null", options_.null_terminate,
                                     "Print bare paths terminated by NUL"));

    document_option(output->add_flag("--sort", options_.sort_results,
                                     "Print matches sorted once the search finishes"));

    document_option(output->add_flag("-v,--verbose", verbosity_,
                                     "Log progress to stderr (repeat for more detail)"));
}

Config::Options Cli::parse(int argc, const char* const* argv) {
    options_ = Config::Options{};
    extensions_.clear();
    verbosity_ = 0;

    app_->parse(argc, argv);

    if (!extensions_.empty()) {
        options_.filter.extensions = normalize_extensions(extensions_);
    }
    const int level = std::clamp(static_cast<int>(Logger::Level::Error) + verbosity_,
                                 static_cast<int>(Logger::Level::Error), static_cast<int>(Logger::Level::Trace));
    options_.log_level = static_cast<Logger::Level>(level);
    return options_;
}

int Cli::exit(const CLI::ParseError& error) const {
    return app_->exit(error);
}

std::string Cli::usage_markdown() const {
    std::ostringstream out;
    out << "### Command line options\n\n";
    out << "| Option | Description | Default |\n";
    out << "| ------ | ----------- | ------- |\n";
    for (const auto& doc : docs_) {
        out << "| `" << doc.name << "` | " << doc.description << " | " << doc.default_value << " |\n";
    }
    out << '\n';
    return out.str();
}

} // namespace nicefind
