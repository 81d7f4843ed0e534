#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

#include "nicefind/result.h"

namespace nicefind::test {

// Fresh directory per test, named after the test and the process so that
// parallel ctest runs do not collide.
class TempTreeTest : public ::testing::Test {
protected:
    std::filesystem::path root_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string{"nicefind_"} + info->test_suite_name() + "_" + info->name() + "_" +
                           std::to_string(
#ifdef _WIN32
                               ::GetCurrentProcessId()
#else
                               ::getpid()
#endif
                           );
        root_ = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path create_file(const std::filesystem::path& relative, const std::string& content = "data") {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream{path} << content;
        return path;
    }

    std::filesystem::path create_directory(const std::filesystem::path& relative) {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path);
        return path;
    }

    void write_gitignore(const std::string& content) {
        std::ofstream{root_ / ".gitignore"} << content;
    }
};

struct Collected {
    std::vector<std::filesystem::path> matches;
    std::vector<Failure> failures;
    std::vector<SearchResult> ordered;

    [[nodiscard]] bool contains(const std::filesystem::path& path) const {
        return std::find(matches.begin(), matches.end(), path) != matches.end();
    }
};

// Drains anything with a next() or receive() returning std::optional<SearchResult>.
template <typename Source, typename Next>
Collected collect(Source& source, Next next) {
    Collected out;
    while (auto result = next(source)) {
        out.ordered.push_back(*result);
        if (const auto* match = std::get_if<Match>(&*result)) {
            out.matches.push_back(match->path);
        } else {
            out.failures.push_back(std::get<Failure>(*result));
        }
    }
    std::sort(out.matches.begin(), out.matches.end());
    return out;
}

inline std::vector<std::filesystem::path> sorted(std::vector<std::filesystem::path> paths) {
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace nicefind::test
