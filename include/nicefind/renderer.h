#pragma once

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include "nicefind/config.h"
#include "nicefind/result.h"

namespace nicefind {

class Renderer {
public:
    Renderer(const Config::Options& options, std::ostream& output, std::ostream& diagnostics);

    void render(const SearchResult& result);

    // Writes anything held back for sorting.
    void finish();

    [[nodiscard]] std::size_t matches() const noexcept { return matches_; }
    [[nodiscard]] std::size_t failures() const noexcept { return failures_; }

private:
    void write_match(const std::filesystem::path& path);

    const Config::Options& options_;
    std::ostream& out_;
    std::ostream& err_;
    bool flush_each_ = false;
    std::vector<std::filesystem::path> pending_;
    std::size_t matches_ = 0;
    std::size_t failures_ = 0;
};

} // namespace nicefind
