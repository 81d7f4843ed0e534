#pragma once

#include <cstddef>
#include <optional>
#include <thread>

#include "nicefind/channel.h"
#include "nicefind/config.h"
#include "nicefind/result.h"

namespace nicefind {

// Receiving end of a running search. Destroying it (or calling close())
// hangs up on the walker and waits for its thread to finish.
class ResultStream {
public:
    ResultStream(Receiver<SearchResult> receiver, std::thread producer);
    ResultStream(ResultStream&& other) noexcept = default;
    ResultStream& operator=(ResultStream&& other) noexcept;
    ResultStream(const ResultStream&) = delete;
    ResultStream& operator=(const ResultStream&) = delete;
    ~ResultStream();

    // Next message in discovery order, or std::nullopt once the walk is over.
    std::optional<SearchResult> next();

    void close() noexcept;

private:
    Receiver<SearchResult> receiver_;
    std::thread producer_;
};

// Loads the root ignore file unless the filter includes ignored entries,
// then walks on a background thread.
[[nodiscard]] ResultStream start_search(SearchFilter filter, std::size_t capacity = kDefaultChannelCapacity);

} // namespace nicefind
