#ifndef PAGIX_PAGINATION_ERROR_HPP
#define PAGIX_PAGINATION_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error codes reported by pagination sessions and the paginator.
 *
 * Recoverable conditions travel as boost::system::error_code, the same
 * currency the asio side of the stack uses. Programming errors (empty page
 * sets, out-of-range page access, missing render target) are thrown instead.
 */

#include <string>
#include <type_traits>

#include <boost/system/error_code.hpp>

namespace pagix::pagination
{
    enum class errc
    {
        session_inactive = 1, ///< control registered after completion / disposal
        unknown_control,      ///< token does not map to any bound action
        capability_mismatch,  ///< button token on a reaction session (or reverse)
        no_session,           ///< no live session for the render target
        not_owner,            ///< input from a user other than the session owner
        target_busy,          ///< render target already driven by a live session
        transport_failure     ///< collaborator threw while rendering / cleaning up
    };

    const boost::system::error_category &pagination_category() noexcept;

} // namespace pagix::pagination

namespace boost::system
{
    template <>
    struct is_error_code_enum<pagix::pagination::errc> : std::true_type
    {
    };
} // namespace boost::system

namespace pagix::pagination
{
    inline boost::system::error_code make_error_code(errc e) noexcept
    {
        return {static_cast<int>(e), pagination_category()};
    }

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_ERROR_HPP
