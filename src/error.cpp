#include <pagix/pagination/error.hpp>

namespace pagix::pagination
{
    namespace
    {
        class PaginationCategory final : public boost::system::error_category
        {
        public:
            const char *name() const noexcept override
            {
                return "pagix.pagination";
            }

            std::string message(int ev) const override
            {
                switch (static_cast<errc>(ev))
                {
                case errc::session_inactive:
                    return "session inactive";
                case errc::unknown_control:
                    return "token is not bound to a pagination control";
                case errc::capability_mismatch:
                    return "control kind not supported by this session";
                case errc::no_session:
                    return "no pagination session for this target";
                case errc::not_owner:
                    return "input does not come from the session owner";
                case errc::target_busy:
                    return "render target already has a live pagination session";
                case errc::transport_failure:
                    return "render target call failed";
                }
                return "unknown pagination error";
            }
        };
    } // namespace

    const boost::system::error_category &pagination_category() noexcept
    {
        static const PaginationCategory category;
        return category;
    }

} // namespace pagix::pagination
