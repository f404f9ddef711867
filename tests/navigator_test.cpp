#include <gtest/gtest.h>

#include <pagix/pagination/navigator.hpp>

#include "RecordingTarget.hpp"

namespace pg = pagix::pagination;
using pagix::pagination::test::make_pages;

namespace
{
    pg::Navigator make_navigator(pg::PaginationBehaviour behaviour, std::size_t count)
    {
        std::vector<pg::Page> pages;
        for (std::size_t i = 0; i < count; ++i)
            pages.emplace_back("page " + std::to_string(i));
        return pg::Navigator{pg::PageStore{std::move(pages)}, behaviour};
    }
} // namespace

TEST(Navigator, StartsOnFirstPage)
{
    auto nav = make_navigator(pg::PaginationBehaviour::Clamp, 3);
    EXPECT_EQ(nav.current_index(), 0u);
    EXPECT_EQ(nav.current_page().content(), "page 0");
}

TEST(Navigator, ClampAdvanceStopsOnLastPage)
{
    auto nav = make_navigator(pg::PaginationBehaviour::Clamp, 3);
    nav.jump_to_last();
    nav.advance();
    EXPECT_EQ(nav.current_index(), 2u);
}

TEST(Navigator, ClampRetreatStopsOnFirstPage)
{
    auto nav = make_navigator(pg::PaginationBehaviour::Clamp, 3);
    nav.retreat();
    EXPECT_EQ(nav.current_index(), 0u);
}

TEST(Navigator, WrapAroundAdvanceFromLastGoesToFirst)
{
    auto nav = make_navigator(pg::PaginationBehaviour::WrapAround, 4);
    nav.jump_to_last();
    nav.advance();
    EXPECT_EQ(nav.current_index(), 0u);
}

TEST(Navigator, WrapAroundRetreatFromFirstGoesToLast)
{
    auto nav = make_navigator(pg::PaginationBehaviour::WrapAround, 4);
    nav.retreat();
    EXPECT_EQ(nav.current_index(), 3u);
}

TEST(Navigator, WrapAroundAdvanceIsModuloPageCount)
{
    for (std::size_t k = 1; k <= 5; ++k)
    {
        for (std::size_t n = 0; n <= 12; ++n)
        {
            auto nav = make_navigator(pg::PaginationBehaviour::WrapAround, k);
            for (std::size_t i = 0; i < n; ++i)
                nav.advance();
            EXPECT_EQ(nav.current_index(), n % k) << "k=" << k << " n=" << n;
        }
    }
}

TEST(Navigator, SinglePageNeverMoves)
{
    for (auto behaviour : {pg::PaginationBehaviour::Clamp, pg::PaginationBehaviour::WrapAround})
    {
        auto nav = make_navigator(behaviour, 1);
        nav.advance();
        nav.retreat();
        nav.jump_to_last();
        EXPECT_EQ(nav.current_index(), 0u);
    }
}

TEST(Navigator, JumpToLastThenRetreat)
{
    pg::Navigator nav{pg::PageStore{make_pages({"A", "B", "C"})}, pg::PaginationBehaviour::Clamp};

    nav.jump_to_last();
    EXPECT_EQ(nav.current_page().content(), "C");

    nav.retreat();
    EXPECT_EQ(nav.current_page().content(), "B");

    nav.jump_to_first();
    EXPECT_EQ(nav.current_page().content(), "A");
}

TEST(Navigator, BehaviourNames)
{
    EXPECT_EQ(pg::to_string(pg::PaginationBehaviour::Clamp), "clamp");
    EXPECT_EQ(pg::to_string(pg::PaginationBehaviour::WrapAround), "wrap_around");
}
