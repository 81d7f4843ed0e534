#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nicefind/config.h"

namespace nicefind {

// Naive name match: "*" accepts everything, otherwise every '*' is removed
// and the rest must occur somewhere in the name (case-sensitive). No
// anchoring, no '?', no classes: "abc*" matches "xabc" as well as "abcx".
[[nodiscard]] bool match_name(std::string_view file_name, std::string_view pattern);

// True when no set is configured, or when the path has a non-empty extension
// equal to one of the entries ignoring ASCII case.
[[nodiscard]] bool match_extension(const std::filesystem::path& path,
                                   const std::optional<std::vector<std::string>>& allowed);

[[nodiscard]] bool matches_file(const std::filesystem::path& path, const SearchFilter& filter);

} // namespace nicefind
