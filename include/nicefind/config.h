#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nicefind/logger.h"

namespace nicefind {

inline constexpr std::string_view kMatchAllPattern = "*";
inline constexpr std::string_view kIgnoreFileName = ".gitignore";
inline constexpr std::size_t kDefaultChannelCapacity = 100;

// Everything the walker needs for one search. Built once by the caller and
// never modified while a search runs.
struct SearchFilter {
    std::filesystem::path root{"."};
    std::string pattern{kMatchAllPattern};
    std::optional<std::size_t> max_depth;
    // Without the leading dot, compared case-insensitively.
    std::optional<std::vector<std::string>> extensions;
    bool show_hidden = false;
    bool include_ignored = false;
};

class Config {
public:
    struct Options {
        SearchFilter filter;

        std::size_t channel_capacity = kDefaultChannelCapacity;
        bool null_terminate = false;
        bool sort_results = false;
        bool dump_markdown = false;
        Logger::Level log_level = Logger::Level::Error;
    };

    static Config& instance();

    void set_options(Options options);
    const Options& options() const noexcept;

    void set_program_name(std::string_view name);
    std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_;
};

} // namespace nicefind
