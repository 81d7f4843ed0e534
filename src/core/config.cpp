#include "nicefind/config.h"

#include <utility>

namespace nicefind {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Config::Options& Config::options() const noexcept {
    return options_;
}

void Config::set_program_name(std::string_view name) {
    auto base = std::filesystem::path{name}.filename().string();
    program_name_ = base.empty() ? std::string{name} : base;
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace nicefind
