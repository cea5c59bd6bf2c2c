#include <xprimary/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

static const config::markers marks;

TEST(FindBlocks, FindsNonOverlappingBlocksInOrder)
{
    std::vector<std::string> lines = config::split_lines(
        "set $mod Mod4\n"                   // 0
        "#! Primary Monitor Start !#\n"     // 1
        "# output \"DP-1\"\n"               // 2
        "#! Primary Monitor End !#\n"       // 3
        "bindsym $mod+Return exec foot\n"   // 4
        "#! Primary Monitor Start !#\n"     // 5
        "output \"DP-2\"\n"                 // 6
        "#! Primary Monitor End !#\n");     // 7

    std::vector<config::block> blocks = config::find_blocks(lines, marks);

    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].start, 1u);
    EXPECT_EQ(blocks[0].end, 3u);
    EXPECT_EQ(blocks[1].start, 5u);
    EXPECT_EQ(blocks[1].end, 7u);
}

TEST(FindBlocks, UnterminatedBlockStopsTheScan)
{
    std::vector<std::string> lines = config::split_lines(
        "#! Primary Monitor Start !#\n"
        "output \"DP-1\"\n"
        "#! Primary Monitor End !#\n"
        "#! Primary Monitor Start !#\n"
        "output \"DP-2\"\n");

    std::vector<config::block> blocks = config::find_blocks(lines, marks);

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 0u);
    EXPECT_EQ(blocks[0].end, 2u);
}

TEST(FindBlocks, EndMarkerOnTheStartLineDoesNotCloseTheBlock)
{
    std::vector<std::string> lines = config::split_lines(
        "# Primary Monitor Start / Primary Monitor End\n"
        "output \"DP-3\"\n"
        "# Primary Monitor End\n");

    std::vector<config::block> blocks = config::find_blocks(lines, marks);

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 0u);
    EXPECT_EQ(blocks[0].end, 2u);
}

TEST(FindBlocks, StartMarkerInsideABlockIsNotNested)
{
    std::vector<std::string> lines = config::split_lines(
        "Primary Monitor Start\n"
        "Primary Monitor Start\n"
        "Primary Monitor End\n"
        "Primary Monitor End\n");

    std::vector<config::block> blocks = config::find_blocks(lines, marks);

    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].start, 0u);
    EXPECT_EQ(blocks[0].end, 2u);
}

TEST(FindDeclaration, SkipsCommentedLines)
{
    std::vector<std::string> lines = config::split_lines(
        "#! Primary Monitor Start !#\n"
        "  # output \"DP-1\" resolution 1920x1080\n"
        "\t output \"Dell Inc. DELL U2720Q 8LXMZ13\" scale 1.5\n"
        "#! Primary Monitor End !#\n");

    EXPECT_EQ(config::find_declaration(lines, {0, 3}),
              "Dell Inc. DELL U2720Q 8LXMZ13");
}

TEST(FindDeclaration, RequiresAQuotedValueAfterTheKeyword)
{
    std::vector<std::string> lines = config::split_lines(
        "#! Primary Monitor Start !#\n"
        "output DP-1 resolution 1920x1080\n"
        "outputs \"DP-2\"\n"
        "output\"DP-3\"\n"
        "output \"\"\n"
        "output \"unterminated\n"
        "#! Primary Monitor End !#\n");

    EXPECT_EQ(config::find_declaration(lines, {0, 6}), std::nullopt);
}

TEST(GetPreference, ReturnsTheDeclarationInsideTheBlock)
{
    EXPECT_EQ(config::get_preference("#! Primary Monitor Start !#\n"
                                     "output \"X\"\n"
                                     "#! Primary Monitor End !#\n",
                                     marks),
              "X");
}

TEST(GetPreference, CommentedDeclarationYieldsNothing)
{
    EXPECT_EQ(config::get_preference("#! Primary Monitor Start !#\n"
                                     "#output \"X\"\n"
                                     "#! Primary Monitor End !#\n",
                                     marks),
              std::nullopt);
}

TEST(GetPreference, FallsThroughToTheNextBlock)
{
    EXPECT_EQ(config::get_preference("#! Primary Monitor Start !#\n"
                                     "# output \"DP-1\"\n"
                                     "#! Primary Monitor End !#\n"
                                     "output \"HDMI-A-1\"\n"
                                     "#! Primary Monitor Start !#\n"
                                     "output \"DP-2\"\n"
                                     "#! Primary Monitor End !#\n",
                                     marks),
              "DP-2");
}

TEST(GetPreference, FirstMatchingBlockWins)
{
    EXPECT_EQ(config::get_preference("#! Primary Monitor Start !#\n"
                                     "output \"DP-1\"\n"
                                     "output \"DP-9\"\n"
                                     "#! Primary Monitor End !#\n"
                                     "#! Primary Monitor Start !#\n"
                                     "output \"DP-2\"\n"
                                     "#! Primary Monitor End !#\n",
                                     marks),
              "DP-1");
}

TEST(GetPreference, IgnoresDeclarationsOutsideBlocks)
{
    EXPECT_EQ(config::get_preference("output \"DP-1\"\n"
                                     "#! Primary Monitor Start !#\n"
                                     "output \"DP-2\"\n",
                                     marks),
              std::nullopt);
}

TEST(GetPreference, UsesCustomMarkers)
{
    config::markers custom = {.start = "BEGIN PRIMARY", .end = "END PRIMARY"};

    EXPECT_EQ(config::get_preference("# BEGIN PRIMARY\n"
                                     "output \"eDP-1\"\n"
                                     "# END PRIMARY\n",
                                     custom),
              "eDP-1");
}

TEST(ReadPreference, MissingFileYieldsNothing)
{
    EXPECT_EQ(config::read_preference("/nonexistent/sway/config", marks),
              std::nullopt);
    EXPECT_EQ(config::read_preference("", marks), std::nullopt);
}

TEST(ReadPreference, ReadsTheFile)
{
    std::filesystem::path path =
        std::filesystem::temp_directory_path() /
        ("xprimary-config-test-" + std::to_string(getpid()));
    {
        std::ofstream file(path);
        file << "#! Primary Monitor Start !#\r\n"
                "output \"Acer Technologies Acer XF270H B 0x9372943C\" "
                "resolution 1920x1080@144Hz\r\n"
                "#! Primary Monitor End !#\r\n";
    }

    EXPECT_EQ(config::read_preference(path, marks),
              "Acer Technologies Acer XF270H B 0x9372943C");

    std::filesystem::remove(path);
}
