#ifndef PAGIX_PAGINATION_RENDER_TARGET_HPP
#define PAGIX_PAGINATION_RENDER_TARGET_HPP

#include <cstdint>

#include <boost/system/error_code.hpp>

#include <pagix/pagination/controls.hpp>
#include <pagix/pagination/page.hpp>

namespace pagix::pagination
{
    using TargetId = std::uint64_t;
    using UserId = std::uint64_t;

    /**
     * @brief Abstraction over the rendered artifact (usually a chat message).
     *
     * Implemented by the client layer (REST message edit, reaction calls...).
     * The artifact is owned by that layer; sessions only keep a handle to it
     * to issue cleanup calls.
     *
     * Expected semantics:
     *  - render(page)               : replace the displayed content with page
     *  - attach_controls(bindings)  : add the reactions / buttons of bindings
     *  - remove_all_control_marks() : remove every reaction from the artifact
     *  - delete_artifact()          : delete the artifact itself
     *
     * Failures are returned, never thrown. A throwing implementation is
     * tolerated and reported as errc::transport_failure.
     */
    class IRenderTarget
    {
    public:
        virtual ~IRenderTarget() = default;

        virtual TargetId id() const noexcept = 0;

        virtual boost::system::error_code render(const Page &page) = 0;

        virtual boost::system::error_code attach_controls(const ControlBindingSet &bindings) = 0;

        virtual boost::system::error_code remove_all_control_marks() = 0;

        virtual boost::system::error_code delete_artifact() = 0;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_RENDER_TARGET_HPP
