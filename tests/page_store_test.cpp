#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <pagix/pagination/page_store.hpp>

#include "RecordingTarget.hpp"

namespace pg = pagix::pagination;
using pagix::pagination::test::make_pages;

TEST(PageStore, EmptySequenceIsRejected)
{
    EXPECT_THROW(pg::PageStore{std::vector<pg::Page>{}}, std::invalid_argument);
}

TEST(PageStore, PageAtOutOfRangeThrows)
{
    pg::PageStore store{make_pages({"A", "B"})};
    EXPECT_EQ(store.page_count(), 2u);
    EXPECT_EQ(store.page_at(1).content(), "B");
    EXPECT_THROW(store.page_at(2), std::out_of_range);
}

TEST(PageStore, ContentSplitByLines)
{
    const auto pages = pg::pages_from_content("l1\nl2\nl3\nl4\nl5", pg::SplitType::Line, 1900, 2);

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].content(), "Page 1:\nl1\nl2");
    EXPECT_EQ(pages[1].content(), "Page 2:\nl3\nl4");
    EXPECT_EQ(pages[2].content(), "Page 3:\nl5");
}

TEST(PageStore, ContentSplitByCharacters)
{
    const auto pages = pg::pages_from_content("abcdefg", pg::SplitType::Character, 3);

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].content(), "Page 1:\nabc");
    EXPECT_EQ(pages[2].content(), "Page 3:\ng");
}

TEST(PageStore, CharacterSplitKeepsUtf8SequencesWhole)
{
    // "é" is two bytes; a 3-byte cut would land inside the second one
    const auto pages = pg::pages_from_content("aéé", pg::SplitType::Character, 4);

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].content(), "Page 1:\naé");
    EXPECT_EQ(pages[1].content(), "Page 2:\né");
}

TEST(PageStore, EmptyTextIsRejected)
{
    EXPECT_THROW(pg::pages_from_content(""), std::invalid_argument);
    EXPECT_THROW(pg::pages_from_embed(""), std::invalid_argument);
}

TEST(PageStore, EmbedPagesCarryChunkAndFooter)
{
    pg::EmbedBuilder templ;
    templ.title("Log").color(0x00FF00);

    const auto pages = pg::pages_from_embed("one\ntwo\nthree", templ, pg::SplitType::Line, 2000, 1);

    ASSERT_EQ(pages.size(), 3u);
    for (const auto &page : pages)
    {
        ASSERT_TRUE(page.has_embed());
        EXPECT_EQ(page.embed()->title, "Log");
        EXPECT_EQ(page.embed()->color.value_or(0u), 0x00FF00u);
        EXPECT_TRUE(page.content().empty());
    }
    EXPECT_EQ(pages[1].embed()->description, "two");
    ASSERT_TRUE(pages[2].embed()->footer.has_value());
    EXPECT_EQ(pages[2].embed()->footer->text, "Page 3/3");
}

TEST(PageStore, LongLinesAreSplitToFitEmbedDescription)
{
    std::string text;
    for (int i = 0; i < 15; ++i)
    {
        if (i != 0)
            text += '\n';
        text += std::string(400, 'x');
    }

    std::vector<pg::Page> pages;
    ASSERT_NO_THROW(pages = pg::pages_from_embed(text, {}, pg::SplitType::Line));

    ASSERT_EQ(pages.size(), 2u);
    std::size_t total = 0;
    for (const auto &page : pages)
    {
        ASSERT_TRUE(page.has_embed());
        EXPECT_LE(page.embed()->description.size(), pg::EmbedBuilder::kMaxDescription);
        total += page.embed()->description.size();
    }
    EXPECT_EQ(total, text.size());
    EXPECT_EQ(pages[1].embed()->footer->text, "Page 2/2");
}

TEST(PageStore, ContentLineSplitHonoursCharacterLimit)
{
    const auto pages = pg::pages_from_content("abcdef\ngh", pg::SplitType::Line, 4, 15);

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0].content(), "Page 1:\nabcd");
    EXPECT_EQ(pages[1].content(), "Page 2:\nef\ng");
    EXPECT_EQ(pages[2].content(), "Page 3:\nh");
}

TEST(EmbedBuilder, EnforcesLimits)
{
    pg::EmbedBuilder eb;
    EXPECT_THROW(eb.title(std::string(pg::EmbedBuilder::kMaxTitle + 1, 'x')), std::invalid_argument);
    EXPECT_THROW(eb.color(0x1000000u), std::invalid_argument);
    EXPECT_THROW(eb.add_field("", "value"), std::invalid_argument);

    for (std::size_t i = 0; i < pg::EmbedBuilder::kMaxFields; ++i)
        eb.add_field("n", "v");
    EXPECT_THROW(eb.add_field("n", "v"), std::invalid_argument);

    eb.clear_fields();
    EXPECT_NO_THROW(eb.add_field("n", "v", true));
    EXPECT_TRUE(eb.build().fields.front().isInline);
}

TEST(Page, BuiltEmbedIsFrozen)
{
    pg::EmbedBuilder eb;
    eb.description("before");
    pg::Page page{"text", eb};

    eb.description("after");

    ASSERT_TRUE(page.has_embed());
    EXPECT_EQ(page.embed()->description, "before");
    EXPECT_EQ(page.content(), "text");
}
