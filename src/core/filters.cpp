#include "nicefind/filters.h"

#include <algorithm>
#include <iterator>

#include "nicefind/utility.h"

namespace nicefind {

bool match_name(std::string_view file_name, std::string_view pattern) {
    if (pattern == kMatchAllPattern) {
        return true;
    }
    std::string literal;
    literal.reserve(pattern.size());
    std::copy_if(pattern.begin(), pattern.end(), std::back_inserter(literal), [](char c) { return c != '*'; });
    return file_name.find(literal) != std::string_view::npos;
}

bool match_extension(const std::filesystem::path& path, const std::optional<std::vector<std::string>>& allowed) {
    if (!allowed) {
        return true;
    }
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    if (ext.empty()) {
        return false;
    }
    return std::any_of(allowed->begin(), allowed->end(), [&](const std::string& candidate) {
        return equals_ignore_case(candidate, ext);
    });
}

bool matches_file(const std::filesystem::path& path, const SearchFilter& filter) {
    const auto name = path.filename().string();
    if (name.empty()) {
        return false;
    }
    return match_name(name, filter.pattern) && match_extension(path, filter.extensions);
}

} // namespace nicefind
