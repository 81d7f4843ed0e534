#include "nicefind/search.h"

#include <utility>

#include "nicefind/ignore.h"
#include "nicefind/logger.h"
#include "nicefind/walker.h"

namespace nicefind {

ResultStream::ResultStream(Receiver<SearchResult> receiver, std::thread producer)
    : receiver_{std::move(receiver)}, producer_{std::move(producer)} {}

ResultStream& ResultStream::operator=(ResultStream&& other) noexcept {
    if (this != &other) {
        close();
        receiver_ = std::move(other.receiver_);
        producer_ = std::move(other.producer_);
    }
    return *this;
}

ResultStream::~ResultStream() {
    close();
}

std::optional<SearchResult> ResultStream::next() {
    return receiver_.receive();
}

void ResultStream::close() noexcept {
    receiver_.close();
    if (producer_.joinable()) {
        producer_.join();
    }
}

ResultStream start_search(SearchFilter filter, std::size_t capacity) {
    IgnoreMatcher ignore;
    if (!filter.include_ignored) {
        ignore = IgnoreMatcher::from_root(filter.root);
    }

    auto [sender, receiver] = make_channel<SearchResult>(capacity);
    Walker walker{std::move(filter), std::move(ignore)};
    std::thread producer{[walker = std::move(walker), sink = std::move(sender)]() mutable {
        walker.run(std::move(sink));
    }};
    return ResultStream{std::move(receiver), std::move(producer)};
}

} // namespace nicefind
