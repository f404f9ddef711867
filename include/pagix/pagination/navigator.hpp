#ifndef PAGIX_PAGINATION_NAVIGATOR_HPP
#define PAGIX_PAGINATION_NAVIGATOR_HPP

/**
 * @file navigator.hpp
 * @brief Page index state machine with a configurable boundary policy.
 *
 * The navigator is not synchronized; PaginationSession serializes every
 * call under its own lock. Whatever the call sequence, the current index
 * stays within [0, last_index()].
 */

#include <cstddef>
#include <string_view>

#include <pagix/pagination/page_store.hpp>

namespace pagix::pagination
{
    enum class PaginationBehaviour
    {
        Clamp,     ///< stop at the first / last page
        WrapAround ///< last -> first and first -> last
    };

    std::string_view to_string(PaginationBehaviour behaviour) noexcept;

    class Navigator
    {
    public:
        Navigator(PageStore pages, PaginationBehaviour behaviour) noexcept
            : pages_(std::move(pages)), behaviour_(behaviour)
        {
        }

        void advance() noexcept;
        void retreat() noexcept;
        void jump_to_first() noexcept { index_ = 0; }
        void jump_to_last() noexcept { index_ = pages_.last_index(); }

        std::size_t current_index() const noexcept { return index_; }
        const Page &current_page() const { return pages_.page_at(index_); }

        std::size_t page_count() const noexcept { return pages_.page_count(); }
        PaginationBehaviour behaviour() const noexcept { return behaviour_; }
        const PageStore &pages() const noexcept { return pages_; }

    private:
        PageStore pages_;
        PaginationBehaviour behaviour_;
        std::size_t index_ = 0;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_NAVIGATOR_HPP
