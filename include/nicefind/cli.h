#pragma once

#include <CLI/CLI.hpp>

#include <memory>
#include <string>
#include <vector>

#include "nicefind/config.h"

namespace nicefind {

class Cli {
public:
    Cli();
    ~Cli();

    // Throws CLI::ParseError (including for --help and --version); hand it
    // to exit() for the message and status code.
    Config::Options parse(int argc, const char* const* argv);
    int exit(const CLI::ParseError& error) const;

    std::string usage_markdown() const;

private:
    struct OptionDoc {
        std::string name;
        std::string description;
        std::string default_value;
    };

    template <typename OptionPtr>
    void document_option(const OptionPtr& option);

    void add_search_options();
    void add_filter_options();
    void add_output_options();

    std::unique_ptr<CLI::App> app_;
    Config::Options options_{};
    std::vector<std::string> extensions_;
    int verbosity_ = 0;
    std::vector<OptionDoc> docs_;
};

} // namespace nicefind

#include "nicefind/cli.tpp"
