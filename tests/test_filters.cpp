#include "nicefind/filters.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>

namespace nicefind::test {
namespace {

std::string random_ascii(std::mt19937& rng, std::size_t max_length) {
    std::uniform_int_distribution<std::size_t> length{0, max_length};
    std::uniform_int_distribution<int> ch{0, 127};
    std::string out(length(rng), '\0');
    for (auto& c : out) {
        c = static_cast<char>(ch(rng));
    }
    return out;
}

// A narrow alphabet so that substring hits are common.
std::string random_short(std::mt19937& rng) {
    static constexpr std::string_view kAlphabet = "ab*.";
    std::uniform_int_distribution<std::size_t> length{0, 4};
    std::uniform_int_distribution<std::size_t> pick{0, kAlphabet.size() - 1};
    std::string out(length(rng), '\0');
    for (auto& c : out) {
        c = kAlphabet[pick(rng)];
    }
    return out;
}

std::string without_stars(std::string value) {
    value.erase(std::remove(value.begin(), value.end(), '*'), value.end());
    return value;
}

} // namespace

TEST(MatchName, StarMatchesEveryString) {
    std::mt19937 rng{20240611u};
    for (int i = 0; i < 1000; ++i) {
        const auto name = random_ascii(rng, 50);
        EXPECT_TRUE(match_name(name, "*")) << "name of length " << name.size();
    }
    EXPECT_TRUE(match_name("", "*"));
}

TEST(MatchName, StarFreePatternIsSubstringSearch) {
    std::mt19937 rng{7u};
    for (int i = 0; i < 2000; ++i) {
        const auto name = random_ascii(rng, 50);
        const auto pattern = without_stars(random_ascii(rng, 3));
        EXPECT_EQ(match_name(name, pattern), name.find(pattern) != std::string::npos);
    }
    for (int i = 0; i < 2000; ++i) {
        const auto name = random_short(rng);
        const auto pattern = without_stars(random_short(rng));
        EXPECT_EQ(match_name(name, pattern), name.find(pattern) != std::string::npos)
            << "name '" << name << "' pattern '" << pattern << "'";
    }
}

TEST(MatchName, WildcardsAreStrippedNotInterpreted) {
    EXPECT_TRUE(match_name("abc-file.txt", "abc*"));
    EXPECT_TRUE(match_name("xabc", "abc*"));
    EXPECT_TRUE(match_name("xabcx", "*abc*"));
    EXPECT_TRUE(match_name("report.txt", "*.txt"));
    EXPECT_TRUE(match_name("abcdef", "ab*cd"));
    EXPECT_FALSE(match_name("ab-cd", "ab*cd"));
    EXPECT_FALSE(match_name("xyz-file.txt", "abc*"));
    EXPECT_TRUE(match_name("anything", "**"));
    EXPECT_TRUE(match_name("anything", ""));
}

TEST(MatchName, IsCaseSensitive) {
    EXPECT_FALSE(match_name("README.md", "readme"));
    EXPECT_TRUE(match_name("README.md", "README"));
}

TEST(MatchExtension, NoSetAcceptsEverything) {
    EXPECT_TRUE(match_extension("a/b/file.txt", std::nullopt));
    EXPECT_TRUE(match_extension("a/b/Makefile", std::nullopt));
}

TEST(MatchExtension, ComparesIgnoringCase) {
    const std::optional<std::vector<std::string>> allowed{{"txt", "RS"}};
    EXPECT_TRUE(match_extension("notes.txt", allowed));
    EXPECT_TRUE(match_extension("NOTES.TXT", allowed));
    EXPECT_TRUE(match_extension("main.rs", allowed));
    EXPECT_TRUE(match_extension("archive.tar.Txt", allowed));
    EXPECT_FALSE(match_extension("readme.md", allowed));
    EXPECT_FALSE(match_extension("notes.txt.bak", allowed));
}

TEST(MatchExtension, FilesWithoutExtensionNeverMatchARestriction) {
    const std::optional<std::vector<std::string>> allowed{{"txt"}};
    EXPECT_FALSE(match_extension("Makefile", allowed));
    EXPECT_FALSE(match_extension(".txt", allowed));
    EXPECT_FALSE(match_extension("trailing.", allowed));

    const std::optional<std::vector<std::string>> empty_set{std::vector<std::string>{}};
    EXPECT_FALSE(match_extension("notes.txt", empty_set));
}

TEST(MatchesFile, RequiresPatternAndExtension) {
    SearchFilter filter;
    filter.pattern = "report*";
    filter.extensions = std::vector<std::string>{"csv"};

    EXPECT_TRUE(matches_file("data/report-2024.csv", filter));
    EXPECT_FALSE(matches_file("data/report-2024.txt", filter));
    EXPECT_FALSE(matches_file("data/summary.csv", filter));
}

TEST(MatchesFile, PatternAppliesToFileNameOnly) {
    SearchFilter filter;
    filter.pattern = "src";
    EXPECT_FALSE(matches_file("src/main.cpp", filter));
    EXPECT_TRUE(matches_file("lib/src_main.cpp", filter));
}

} // namespace nicefind::test
