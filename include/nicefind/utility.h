#pragma once

#include <string_view>

namespace nicefind {

[[nodiscard]] bool equals_ignore_case(std::string_view lhs, std::string_view rhs);
[[nodiscard]] std::string_view trim(std::string_view value);

} // namespace nicefind
