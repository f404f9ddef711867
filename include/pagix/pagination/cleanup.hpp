#ifndef PAGIX_PAGINATION_CLEANUP_HPP
#define PAGIX_PAGINATION_CLEANUP_HPP

/**
 * @file cleanup.hpp
 * @brief Disposal action applied to the rendered artifact when a session ends.
 */

#include <string_view>

#include <boost/system/error_code.hpp>

#include <pagix/pagination/render_target.hpp>

namespace pagix::pagination
{
    struct PaginationMetrics;

    enum class PaginationDeletion
    {
        DeleteControlMarks,     ///< remove every reaction / control mark
        DeleteRenderedArtifact, ///< delete the message itself
        KeepControlMarks        ///< leave the artifact untouched
    };

    std::string_view to_string(PaginationDeletion deletion) noexcept;

    class CleanupExecutor
    {
    public:
        explicit CleanupExecutor(PaginationMetrics *metrics = nullptr) noexcept
            : metrics_(metrics)
        {
        }

        /**
         * @brief Issue at most one remote call against @p target.
         *
         * Never throws on transport failure: the collaborator's error (or
         * errc::transport_failure if it threw) is logged and returned.
         */
        boost::system::error_code execute(PaginationDeletion deletion,
                                          IRenderTarget &target) const;

    private:
        PaginationMetrics *metrics_;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_CLEANUP_HPP
