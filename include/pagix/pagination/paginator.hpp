#ifndef PAGIX_PAGINATION_PAGINATOR_HPP
#define PAGIX_PAGINATION_PAGINATOR_HPP

/**
 * @file paginator.hpp
 * @brief Collector side of pagination: routes input events to live sessions.
 *
 * The Paginator keeps one live session per render target. The transport
 * layer feeds it every input event it receives; the command handler that
 * created the pagination blocks in paginate() until the session ends.
 *
 * Typical usage:
 *
 *   pagix::pagination::Paginator paginator{ioc.get_executor(), cfg};
 *
 *   // gateway thread
 *   gateway.on_reaction([&](auto user, auto emoji, auto messageId) {
 *       paginator.handle_event({user, ControlToken::reaction(emoji), messageId});
 *   });
 *
 *   // command handler thread
 *   auto session = paginator.create_session(std::move(pages), author, message);
 *   paginator.paginate(session);
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/system/error_code.hpp>

#include <pagix/pagination/config.hpp>
#include <pagix/pagination/session.hpp>

namespace pagix::pagination
{
    /// One raw input already normalized by the transport.
    struct InputEvent
    {
        UserId actor = 0;
        ControlToken token;
        TargetId target = 0;
    };

    class Paginator
    {
    public:
        Paginator(net::any_io_executor executor,
                  PaginationConfig config = {},
                  PaginationMetrics *metrics = nullptr);

        Paginator(const Paginator &) = delete;
        Paginator &operator=(const Paginator &) = delete;

        /// Session with the configured defaults.
        std::shared_ptr<PaginationSession> create_session(std::vector<Page> pages,
                                                          UserId owner,
                                                          std::shared_ptr<IRenderTarget> target) const;

        /// Session with explicit settings.
        std::shared_ptr<PaginationSession> create_session(std::vector<Page> pages,
                                                          UserId owner,
                                                          std::shared_ptr<IRenderTarget> target,
                                                          PaginationBehaviour behaviour,
                                                          PaginationDeletion deletion,
                                                          std::chrono::milliseconds timeout,
                                                          ControlBindingSet bindings) const;

        /**
         * @brief Drive @p session until it ends, then dispose it.
         *
         * Registers the session, attaches its controls, renders the first
         * page and blocks until completion. The session is unregistered and
         * disposed on every exit path. Returns the first transport error
         * (attach, render or cleanup), or errc::target_busy when another
         * live session already drives the same target.
         */
        boost::system::error_code paginate(const std::shared_ptr<PaginationSession> &session);

        /**
         * @brief Route one input event.
         *
         * Returns errc::no_session, errc::not_owner, the session's control
         * error, or the render error. Stop controls complete the session
         * without rendering.
         */
        boost::system::error_code handle_event(const InputEvent &event);

        std::size_t active_sessions() const;

        /// Stop every live session (the blocked paginate() calls then clean up).
        void stop_all();

        const PaginationConfig &config() const noexcept { return config_; }

    private:
        bool register_session(const std::shared_ptr<PaginationSession> &session);
        void unregister_session(const PaginationSession &session);
        std::shared_ptr<PaginationSession> find_session(TargetId target) const;

    private:
        net::any_io_executor executor_;
        PaginationConfig config_;
        PaginationMetrics *metrics_;

        mutable std::mutex sessionsMutex_;
        std::unordered_map<TargetId, std::shared_ptr<PaginationSession>> sessions_;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_PAGINATOR_HPP
