#include "nicefind/walker.h"

#include <exception>
#include <string>
#include <system_error>

#include "nicefind/filters.h"
#include "nicefind/logger.h"
#include "nicefind/platform.h"

namespace nicefind {

Walker::Walker(SearchFilter filter, IgnoreMatcher ignore)
    : filter_{std::move(filter)}, ignore_{std::move(ignore)} {}

void Walker::run(Sender<SearchResult> sink) const {
    auto& log = Logger::instance();
    log.debug("walking {} (pattern '{}', max depth {})", filter_.root.string(), filter_.pattern,
              filter_.max_depth ? std::to_string(*filter_.max_depth) : std::string{"unlimited"});

    Stats stats;
    bool completed = false;
    try {
        completed = walk(sink, stats);
    } catch (const std::filesystem::filesystem_error& ex) {
        Failure failure = make_failure(ex.path1().empty() ? filter_.root : ex.path1(), "search", ex.code());
        failure.message = ex.what();
        report(std::move(failure), sink, stats);
    } catch (const std::exception& ex) {
        Failure failure = make_failure(filter_.root, "search", std::make_error_code(std::errc::io_error));
        failure.message = ex.what();
        report(std::move(failure), sink, stats);
    }

    if (!completed && sink.receiver_closed()) {
        log.debug("receiver closed, stopping walk of {}", filter_.root.string());
    }
    log.info("walked {} directories: {} matches, {} failures", stats.directories, stats.matches, stats.failures);
    sink.close();
}

bool Walker::walk(Sender<SearchResult>& sink, Stats& stats) const {
    Frontier frontier;
    frontier.emplace_back(filter_.root, 0);

    while (!frontier.empty()) {
        auto [directory, depth] = std::move(frontier.front());
        frontier.pop_front();
        if (!within_depth(depth)) {
            continue;
        }
        if (!scan_directory(directory, depth, frontier, sink, stats)) {
            return false;
        }
    }
    return true;
}

bool Walker::scan_directory(const std::filesystem::path& directory, std::size_t depth, Frontier& frontier,
                            Sender<SearchResult>& sink, Stats& stats) const {
    ++stats.directories;
    std::error_code ec;
    std::filesystem::directory_iterator it{directory, ec};
    if (ec) {
        return report(make_failure(directory, "read directory", ec), sink, stats);
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        if (!visit_entry(*it, depth, frontier, sink, stats)) {
            return false;
        }
        it.increment(ec);
        if (ec) {
            return report(make_failure(directory, "read directory", ec), sink, stats);
        }
    }
    return true;
}

bool Walker::visit_entry(const std::filesystem::directory_entry& entry, std::size_t depth, Frontier& frontier,
                         Sender<SearchResult>& sink, Stats& stats) const {
    const auto& path = entry.path();

    if (!filter_.include_ignored && !ignore_.empty()) {
        std::error_code kind_ec;
        const auto kind = entry.symlink_status(kind_ec).type();
        if (ignore_.is_ignored(path, !kind_ec && kind == std::filesystem::file_type::directory)) {
            Logger::instance().trace("ignored {}", path.string());
            return true;
        }
    }

    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (ec) {
        return report(make_failure(path, "query metadata", ec), sink, stats);
    }
    const bool is_dir = status.type() == std::filesystem::file_type::directory;

    const bool hidden = platform::is_hidden(entry, ec);
    if (ec) {
        return report(make_failure(path, "query metadata", ec), sink, stats);
    }

    if (hidden && !filter_.show_hidden) {
        return true;
    }

    if (is_dir) {
        if (within_depth(depth + 1)) {
            frontier.emplace_back(path, depth + 1);
        }
        return true;
    }

    if (!matches_file(path, filter_)) {
        return true;
    }
    ++stats.matches;
    return sink.send(Match{path});
}

bool Walker::report(Failure failure, Sender<SearchResult>& sink, Stats& stats) const {
    ++stats.failures;
    Logger::instance().debug("{}", describe(failure));
    return sink.send(std::move(failure));
}

bool Walker::within_depth(std::size_t depth) const noexcept {
    return !filter_.max_depth || depth <= *filter_.max_depth;
}

} // namespace nicefind
