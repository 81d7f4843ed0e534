#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <utility>

#include "nicefind/channel.h"
#include "nicefind/config.h"
#include "nicefind/ignore.h"
#include "nicefind/result.h"

namespace nicefind {

// Breadth-first, non-recursive directory walk. Every directory is listed
// once, in the order it was discovered; matches and failures are sent as they
// are found.
class Walker {
public:
    Walker(SearchFilter filter, IgnoreMatcher ignore);

    // Walks until the frontier is empty or the receiver hangs up. The sink is
    // closed on return, whatever the reason.
    void run(Sender<SearchResult> sink) const;

private:
    using Frontier = std::deque<std::pair<std::filesystem::path, std::size_t>>;

    struct Stats {
        std::size_t directories = 0;
        std::size_t matches = 0;
        std::size_t failures = 0;
    };

    bool walk(Sender<SearchResult>& sink, Stats& stats) const;
    bool scan_directory(const std::filesystem::path& directory, std::size_t depth, Frontier& frontier,
                        Sender<SearchResult>& sink, Stats& stats) const;
    bool visit_entry(const std::filesystem::directory_entry& entry, std::size_t depth, Frontier& frontier,
                     Sender<SearchResult>& sink, Stats& stats) const;
    bool report(Failure failure, Sender<SearchResult>& sink, Stats& stats) const;
    [[nodiscard]] bool within_depth(std::size_t depth) const noexcept;

    SearchFilter filter_;
    IgnoreMatcher ignore_;
};

} // namespace nicefind
