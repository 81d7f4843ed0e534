#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <variant>

namespace nicefind {

struct Match {
    std::filesystem::path path;
};

// One directory that could not be listed, one entry whose metadata could not
// be read, or the reason a walk ended early.
struct Failure {
    std::filesystem::path path;
    std::string operation;
    std::error_code error;
    std::string message;
};

using SearchResult = std::variant<Match, Failure>;

[[nodiscard]] Failure make_failure(std::filesystem::path path, std::string operation, std::error_code error);
[[nodiscard]] std::string describe(const Failure& failure);

[[nodiscard]] inline bool is_match(const SearchResult& result) noexcept {
    return std::holds_alternative<Match>(result);
}

} // namespace nicefind
