#include "nicefind/result.h"

#include <fmt/format.h>

#include <utility>

namespace nicefind {

Failure make_failure(std::filesystem::path path, std::string operation, std::error_code error) {
    Failure failure;
    failure.path = std::move(path);
    failure.operation = std::move(operation);
    failure.error = error;
    failure.message = error.message();
    return failure;
}

std::string describe(const Failure& failure) {
    if (failure.path.empty()) {
        return fmt::format("failed to {}: {}", failure.operation, failure.message);
    }
    return fmt::format("failed to {} {}: {}", failure.operation, failure.path.string(), failure.message);
}

} // namespace nicefind
