#include "nicefind/ignore.h"

#include <cctype>
#include <fstream>
#include <system_error>
#include <utility>

#include "nicefind/config.h"
#include "nicefind/logger.h"

namespace nicefind {
namespace {

void append_literal(std::string& out, char c) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    if (kSpecial.find(c) != std::string_view::npos) {
        out.push_back('\\');
    }
    out.push_back(c);
}

// Appends the bracket expression starting at glob[open] and returns the index
// of its closing ']', or npos when the bracket is never closed.
std::size_t append_class(std::string& out, std::string_view glob, std::size_t open) {
    std::size_t i = open + 1;
    bool negated = false;
    if (i < glob.size() && (glob[i] == '!' || glob[i] == '^')) {
        negated = true;
        ++i;
    }
    std::string body;
    bool first = true;
    for (; i < glob.size(); ++i) {
        const char c = glob[i];
        if (c == ']' && !first) {
            out += negated ? "[^" : "[";
            out += body;
            out += ']';
            return i;
        }
        first = false;
        if (c == '\\' && i + 1 < glob.size()) {
            const char escaped = glob[++i];
            if (std::isalnum(static_cast<unsigned char>(escaped)) == 0) {
                body.push_back('\\');
            }
            body.push_back(escaped);
        } else if (c == '[' || c == ']' || c == '\\') {
            body.push_back('\\');
            body.push_back(c);
        } else {
            body.push_back(c);
        }
    }
    return std::string_view::npos;
}

std::string glob_to_regex(std::string_view glob) {
    std::string out;
    out.reserve(glob.size() * 2);
    for (std::size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];
        switch (c) {
            case '*': {
                std::size_t end = i;
                while (end < glob.size() && glob[end] == '*') {
                    ++end;
                }
                const bool starts_component = i == 0 || glob[i - 1] == '/';
                const bool ends_component = end == glob.size() || glob[end] == '/';
                if (end - i >= 2 && starts_component && ends_component) {
                    if (end == glob.size()) {
                        out += ".*";
                    } else {
                        // "**/" also matches no directory at all
                        out += "(?:.*/)?";
                        ++end;
                    }
                } else {
                    out += "[^/]*";
                }
                i = end - 1;
                break;
            }
            case '?':
                out += "[^/]";
                break;
            case '[': {
                const auto close = append_class(out, glob, i);
                if (close == std::string_view::npos) {
                    out += "\\[";
                } else {
                    i = close;
                }
                break;
            }
            case '\\':
                if (i + 1 < glob.size()) {
                    append_literal(out, glob[++i]);
                } else {
                    out += "\\\\";
                }
                break;
            default:
                append_literal(out, c);
                break;
        }
    }
    return out;
}

std::string_view trim_trailing_spaces(std::string_view line) {
    while (!line.empty() && line.back() == ' ') {
        if (line.size() >= 2 && line[line.size() - 2] == '\\') {
            break;
        }
        line.remove_suffix(1);
    }
    return line;
}

} // namespace

std::optional<IgnoreMatcher::Rule> IgnoreMatcher::parse_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    line = trim_trailing_spaces(line);
    if (line.empty() || line.front() == '#') {
        return std::nullopt;
    }

    Rule rule;
    rule.pattern = std::string{line};
    if (line.front() == '!') {
        rule.negated = true;
        line.remove_prefix(1);
    }
    if (!line.empty() && line.back() == '/') {
        rule.directory_only = true;
        line.remove_suffix(1);
    }
    if (!line.empty() && line.front() == '/') {
        rule.anchored = true;
        line.remove_prefix(1);
    }
    if (line.find('/') != std::string_view::npos) {
        rule.anchored = true;
    }
    if (line.empty()) {
        return std::nullopt;
    }

    rule.regex = std::regex{glob_to_regex(line), std::regex::ECMAScript | std::regex::optimize};
    return rule;
}

std::optional<IgnoreMatcher> IgnoreMatcher::compile(std::istream& input, const std::filesystem::path& base) {
    IgnoreMatcher matcher;
    matcher.base_ = base.lexically_normal();
    if (matcher.base_.filename().empty() && matcher.base_ != matcher.base_.root_path()) {
        matcher.base_ = matcher.base_.parent_path();
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        try {
            if (auto rule = parse_line(line)) {
                matcher.rules_.push_back(std::move(*rule));
            }
        } catch (const std::regex_error& ex) {
            Logger::instance().debug("ignore rule {} '{}' does not compile: {}", line_number, line, ex.what());
            return std::nullopt;
        }
    }
    if (input.bad()) {
        Logger::instance().debug("failed to read ignore rules after line {}", line_number);
        return std::nullopt;
    }
    return matcher;
}

IgnoreMatcher IgnoreMatcher::from_root(const std::filesystem::path& root) {
    const auto file = root / kIgnoreFileName;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        Logger::instance().debug("no ignore file at {}", file.string());
        return {};
    }

    std::ifstream input{file};
    if (!input) {
        Logger::instance().debug("cannot open {}, ignoring nothing", file.string());
        return {};
    }

    auto compiled = compile(input, root);
    if (!compiled) {
        Logger::instance().debug("discarding rules from {}", file.string());
        return {};
    }
    Logger::instance().info("loaded {} ignore rules from {}", compiled->size(), file.string());
    return std::move(*compiled);
}

IgnoreMatcher::Verdict IgnoreMatcher::match(const std::string& relative, const std::string& name,
                                            bool is_dir) const {
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        if (it->directory_only && !is_dir) {
            continue;
        }
        const std::string& subject = it->anchored ? relative : name;
        if (std::regex_match(subject, it->regex)) {
            return it->negated ? Verdict::Include : Verdict::Ignore;
        }
    }
    return Verdict::None;
}

bool IgnoreMatcher::is_ignored(const std::filesystem::path& path, bool is_dir) const {
    if (rules_.empty()) {
        return false;
    }

    const auto relative = path.lexically_normal().lexically_relative(base_);
    std::vector<std::string> parts;
    for (const auto& part : relative) {
        const auto text = part.string();
        if (text == "..") {
            return false;
        }
        if (!text.empty() && text != ".") {
            parts.push_back(text);
        }
    }

    std::string candidate;
    for (std::size_t length = parts.size(); length > 0; --length) {
        candidate.clear();
        for (std::size_t i = 0; i < length; ++i) {
            if (i > 0) {
                candidate.push_back('/');
            }
            candidate += parts[i];
        }
        const bool candidate_is_dir = length == parts.size() ? is_dir : true;
        switch (match(candidate, parts[length - 1], candidate_is_dir)) {
            case Verdict::Ignore:
                return true;
            case Verdict::Include:
                return false;
            case Verdict::None:
                break;
        }
    }
    return false;
}

} // namespace nicefind
