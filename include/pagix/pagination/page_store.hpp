#ifndef PAGIX_PAGINATION_PAGE_STORE_HPP
#define PAGIX_PAGINATION_PAGE_STORE_HPP

/**
 * @file page_store.hpp
 * @brief Immutable ordered page sequence owned by one session.
 */

#include <cstddef>
#include <string_view>
#include <vector>

#include <pagix/pagination/page.hpp>

namespace pagix::pagination
{
    /// How long text is cut into pages.
    enum class SplitType
    {
        Character, ///< fixed number of characters per page
        Line       ///< fixed number of lines per page
    };

    class PageStore
    {
    public:
        /// @throws std::invalid_argument if @p pages is empty.
        explicit PageStore(std::vector<Page> pages);

        std::size_t page_count() const noexcept { return pages_.size(); }
        std::size_t last_index() const noexcept { return pages_.size() - 1; }

        /// @throws std::out_of_range if @p index >= page_count().
        const Page &page_at(std::size_t index) const;

    private:
        std::vector<Page> pages_;
    };

    /**
     * @brief Cut @p text into content pages ("Page N:\n<chunk>").
     *
     * Character splitting never cuts inside a UTF-8 sequence. Line chunks
     * longer than @p characterLimit are split again by characters.
     * @throws std::invalid_argument if @p text is empty.
     */
    std::vector<Page> pages_from_content(std::string_view text,
                                         SplitType split = SplitType::Character,
                                         std::size_t characterLimit = 1900,
                                         std::size_t lineLimit = 15);

    /**
     * @brief Cut @p text into embed pages. Each page reuses @p templ and gets
     * the chunk as description plus a "Page N/M" footer. @p characterLimit
     * is capped at the embed description limit and applies to both split types.
     * @throws std::invalid_argument if @p text is empty.
     */
    std::vector<Page> pages_from_embed(std::string_view text,
                                       const EmbedBuilder &templ = {},
                                       SplitType split = SplitType::Character,
                                       std::size_t characterLimit = 2000,
                                       std::size_t lineLimit = 15);

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_PAGE_STORE_HPP
