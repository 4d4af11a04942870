#include <gtest/gtest.h>
#include "core/changelog.hpp"

#include <regex>

TEST(ChangelogTest, ParsesFourSections) {
    std::string body =
        "## Added\n"
        "- Batch downloads\n"
        "- Subtitle selection\n"
        "\n"
        "## Changed\n"
        "- Faster format probing\n"
        "## Fixed\n"
        "- Crash on empty playlist\n"
        "## Removed\n"
        "- Legacy proxy option\n";

    auto s = parse_changelog_sections(body);
    ASSERT_EQ(s.added.size(), 2u);
    EXPECT_EQ(s.added[0], "Batch downloads");
    EXPECT_EQ(s.added[1], "Subtitle selection");
    ASSERT_EQ(s.changed.size(), 1u);
    EXPECT_EQ(s.changed[0], "Faster format probing");
    ASSERT_EQ(s.fixed.size(), 1u);
    EXPECT_EQ(s.fixed[0], "Crash on empty playlist");
    ASSERT_EQ(s.removed.size(), 1u);
    EXPECT_EQ(s.removed[0], "Legacy proxy option");
}

TEST(ChangelogTest, AcceptsEmojiAndHeaderDepth) {
    std::string body =
        "# \xF0\x9F\x9A\x80 Added\n"        // rocket emoji
        "- New UI\n"
        "### \xF0\x9F\x90\x9B Fixed\n"      // bug emoji
        "- Progress stuck at 99%\n";

    auto s = parse_changelog_sections(body);
    ASSERT_EQ(s.added.size(), 1u);
    EXPECT_EQ(s.added[0], "New UI");
    ASSERT_EQ(s.fixed.size(), 1u);
    EXPECT_EQ(s.fixed[0], "Progress stuck at 99%");
}

TEST(ChangelogTest, HeaderKeywordCaseInsensitive) {
    auto s = parse_changelog_sections("## ADDED\n- One\n## fixed\n- Two\n");
    EXPECT_EQ(s.added.size(), 1u);
    EXPECT_EQ(s.fixed.size(), 1u);
}

TEST(ChangelogTest, SkipsBoldSubheadingsAndEmptyBullets) {
    std::string body =
        "## Added\n"
        "- **Downloader**\n"
        "- Resume support\n"
        "- \n"
        "* star bullets are not items\n";

    auto s = parse_changelog_sections(body);
    ASSERT_EQ(s.added.size(), 1u);
    EXPECT_EQ(s.added[0], "Resume support");
}

TEST(ChangelogTest, BulletsOutsideSectionsIgnored) {
    auto s = parse_changelog_sections("- stray\n## Unknown\n- also stray\n");
    EXPECT_TRUE(s.empty());
}

TEST(ChangelogTest, KeywordMustEndTheWord) {
    auto s = parse_changelog_sections("## Addedfoo\n- nope\n## Fixed: crash\n- yes\n");
    EXPECT_TRUE(s.added.empty());
    ASSERT_EQ(s.fixed.size(), 1u);
    EXPECT_EQ(s.fixed[0], "yes");
}

TEST(ChangelogTest, FourHashesIsNotASection) {
    auto s = parse_changelog_sections("#### Added\n- nope\n");
    EXPECT_TRUE(s.empty());
}

TEST(ChangelogTest, EmptyOrFreeformInput) {
    EXPECT_TRUE(parse_changelog_sections("").empty());
    EXPECT_TRUE(parse_changelog_sections("Just a paragraph of notes.").empty());
}

TEST(ChangelogTest, CrlfLineEndings) {
    auto s = parse_changelog_sections("## Fixed\r\n- Windows paths\r\n");
    ASSERT_EQ(s.fixed.size(), 1u);
    EXPECT_EQ(s.fixed[0], "Windows paths");
}

TEST(ChangelogTest, MultiVersionSplitsBlocks) {
    std::string body =
        "# Changelog\n"
        "\n"
        "## [2.3.0] - 2025-03-01\n"
        "### Added\n"
        "- Playlist export\n"
        "### Fixed\n"
        "- Audio-only downloads\n"
        "\n"
        "## [v2.2.9] - 2025-02-10\n"
        "### Changed\n"
        "- Updated yt-dlp\n"
        "\n"
        "## [2.2.8]\n"
        "Maintenance release.\n"
        "\n"
        "## [2.2.7]\n"
        "### Removed\n"
        "- Old settings page\n";

    auto entries = parse_multi_version(body);
    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].version, "2.3.0");
    EXPECT_EQ(entries[0].date, "2025-03-01");
    EXPECT_EQ(entries[0].sections.added.size(), 1u);
    EXPECT_EQ(entries[0].sections.fixed.size(), 1u);

    EXPECT_EQ(entries[1].version, "2.2.9");
    EXPECT_EQ(entries[1].date, "2025-02-10");
    ASSERT_EQ(entries[1].sections.changed.size(), 1u);
    EXPECT_EQ(entries[1].sections.changed[0], "Updated yt-dlp");

    // 2.2.8 has no bullets and is dropped
    EXPECT_EQ(entries[2].version, "2.2.7");
    EXPECT_TRUE(entries[2].date.empty());
    EXPECT_EQ(entries[2].sections.removed.size(), 1u);
}

TEST(ChangelogTest, MultiVersionWithoutHeaders) {
    EXPECT_TRUE(parse_multi_version("## Added\n- no version header\n").empty());
}

TEST(ChangelogTest, Iso8601Now) {
    std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
    EXPECT_TRUE(std::regex_match(iso8601_now(), iso));
}
