#include "nicefind/renderer.h"

#include <algorithm>
#include <ostream>
#include <variant>

#include "nicefind/platform.h"

namespace nicefind {

Renderer::Renderer(const Config::Options& options, std::ostream& output, std::ostream& diagnostics)
    : options_{options}, out_{output}, err_{diagnostics}, flush_each_{platform::stdout_is_terminal()} {}

void Renderer::render(const SearchResult& result) {
    if (const auto* match = std::get_if<Match>(&result)) {
        ++matches_;
        if (options_.sort_results) {
            pending_.push_back(match->path);
        } else {
            write_match(match->path);
        }
        return;
    }

    ++failures_;
    err_ << "Error: " << describe(std::get<Failure>(result)) << '\n';
}

void Renderer::finish() {
    if (!pending_.empty()) {
        std::sort(pending_.begin(), pending_.end());
        for (const auto& path : pending_) {
            write_match(path);
        }
        pending_.clear();
    }
    out_.flush();
}

void Renderer::write_match(const std::filesystem::path& path) {
    if (options_.null_terminate) {
        out_ << path.string() << '\0';
    } else {
        out_ << "Found: " << path.string() << '\n';
    }
    if (flush_each_) {
        out_.flush();
    }
}

} // namespace nicefind
