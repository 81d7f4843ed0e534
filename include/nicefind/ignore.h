#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace nicefind {

// Compiled rules of the single .gitignore found at the search root. A
// default-constructed matcher has no rules and ignores nothing. Queries are
// const and may run from any thread.
class IgnoreMatcher {
public:
    IgnoreMatcher() = default;

    // Loads root/.gitignore. A missing, unreadable or malformed file yields an
    // empty matcher rather than an error.
    static IgnoreMatcher from_root(const std::filesystem::path& root);

    // Parses rules relative to `base`. Returns std::nullopt if any rule fails
    // to compile.
    static std::optional<IgnoreMatcher> compile(std::istream& input, const std::filesystem::path& base);

    // True when `path`, or the nearest ancestor below the base that any rule
    // matches, is excluded and not re-included by a later '!' rule.
    [[nodiscard]] bool is_ignored(const std::filesystem::path& path, bool is_dir) const;

    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] const std::filesystem::path& base() const noexcept { return base_; }

private:
    struct Rule {
        std::string pattern;
        std::regex regex;
        bool negated = false;
        bool directory_only = false;
        bool anchored = false;
    };

    enum class Verdict {
        None,
        Ignore,
        Include
    };

    static std::optional<Rule> parse_line(std::string_view line);
    Verdict match(const std::string& relative, const std::string& name, bool is_dir) const;

    std::filesystem::path base_;
    std::vector<Rule> rules_;
};

} // namespace nicefind
