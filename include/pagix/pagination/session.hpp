#ifndef PAGIX_PAGINATION_SESSION_HPP
#define PAGIX_PAGINATION_SESSION_HPP

/**
 * @file session.hpp
 * @brief One live pagination interaction bound to one rendered artifact.
 *
 * Responsibilities:
 *  - Own the page sequence and the navigation state machine.
 *  - Arm a timeout timer at construction (asio steady_timer on a strand).
 *  - Serialize controls, stop() and the timeout under a single lock.
 *  - Fire the completion signal exactly once, whatever races it.
 *  - Run the cleanup policy exactly once on dispose().
 *
 * State machine:
 *
 *   Active --(timeout | stop)--> Completed --(dispose)--> Disposed
 *
 * Every control registered outside Active is rejected with
 * errc::session_inactive and mutates nothing.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>

#include <pagix/pagination/cleanup.hpp>
#include <pagix/pagination/controls.hpp>
#include <pagix/pagination/navigator.hpp>
#include <pagix/pagination/render_target.hpp>

namespace pagix::pagination
{
    namespace net = boost::asio;

    struct PaginationMetrics;

    enum class SessionState
    {
        Active,
        Completed,
        Disposed
    };

    enum class CompletionReason
    {
        None,
        Timeout,
        Stopped,
        Abandoned ///< disposed while still active
    };

    std::string_view to_string(SessionState state) noexcept;
    std::string_view to_string(CompletionReason reason) noexcept;

    /// Outcome of register_control(). `page` stays valid for the session lifetime.
    struct ControlResult
    {
        boost::system::error_code error;
        const Page *page = nullptr;
        bool stillActive = false;

        explicit operator bool() const noexcept { return !error; }
    };

    class PaginationSession : public std::enable_shared_from_this<PaginationSession>
    {
        struct PrivateTag
        {
            explicit PrivateTag() = default;
        };

    public:
        using Executor = net::any_io_executor;
        using CompletionHandler = std::function<void()>;

        /**
         * @brief Build and activate a session. The timeout starts now.
         *
         * @throws std::invalid_argument on empty @p pages or null @p target.
         */
        static std::shared_ptr<PaginationSession> create(Executor executor,
                                                          std::vector<Page> pages,
                                                          UserId owner,
                                                          PaginationBehaviour behaviour,
                                                          PaginationDeletion deletion,
                                                          std::chrono::milliseconds timeout,
                                                          ControlBindingSet bindings,
                                                          std::shared_ptr<IRenderTarget> target,
                                                          PaginationMetrics *metrics = nullptr);

        PaginationSession(PrivateTag,
                          Executor executor,
                          PageStore pages,
                          UserId owner,
                          PaginationBehaviour behaviour,
                          PaginationDeletion deletion,
                          std::chrono::milliseconds timeout,
                          ControlBindingSet bindings,
                          std::shared_ptr<IRenderTarget> target,
                          PaginationMetrics *metrics);

        ~PaginationSession();

        PaginationSession(const PaginationSession &) = delete;
        PaginationSession &operator=(const PaginationSession &) = delete;

        /// Resolve @p token through the binding set, then register_action().
        ControlResult register_control(const ControlToken &token);

        /// Apply @p action and return the page to render.
        ControlResult register_action(ControlAction action);

        /// Complete now (idempotent) and disarm the timeout.
        void stop();

        /// Block the calling thread until completion. Does not hold the lock while waiting.
        void wait_until_complete();

        /// Bounded wait; true if the session completed within @p timeout.
        bool wait_for(std::chrono::milliseconds timeout);

        /// Post @p handler on the session strand once completion fires.
        void async_wait(CompletionHandler handler);

        /**
         * @brief Run the cleanup policy once and move to Disposed.
         *
         * Completes the session first if it is still active. A second call
         * returns errc::session_inactive without touching the target.
         */
        boost::system::error_code dispose();

        /**
         * @brief Move to Disposed without any cleanup call.
         *
         * For sessions that never owned their target (e.g. rejected because
         * another session drives it). Same completion and double-call rules
         * as dispose().
         */
        boost::system::error_code release();

        std::size_t page_count() const noexcept { return pageCount_; }
        std::size_t current_index() const;
        const Page &current_page() const;

        SessionState state() const;
        bool is_active() const;
        CompletionReason completion_reason() const;

        UserId owner() const noexcept { return owner_; }
        IRenderTarget &target() const noexcept { return *target_; }
        PaginationDeletion deletion() const noexcept { return deletion_; }
        PaginationBehaviour behaviour() const noexcept { return behaviour_; }
        const ControlBindingSet &bindings() const noexcept { return bindings_; }
        std::chrono::milliseconds timeout() const noexcept { return timeout_; }

    private:
        boost::system::error_code close(bool runCleanup);

        void arm_timeout();
        void cancel_timeout();
        void on_timeout(const boost::system::error_code &ec);

        // Caller holds mutex_. Returns the waiters to notify once unlocked.
        std::vector<CompletionHandler> mark_completed_locked(CompletionReason reason);
        void finish_completion(CompletionReason reason, std::vector<CompletionHandler> waiters);

        ControlResult reject(boost::system::error_code ec, std::string_view what);

    private:
        net::strand<Executor> strand_;
        net::steady_timer timer_;
        std::chrono::steady_clock::time_point deadline_;

        const UserId owner_;
        const PaginationBehaviour behaviour_;
        const PaginationDeletion deletion_;
        const std::chrono::milliseconds timeout_;
        const ControlBindingSet bindings_;
        const std::shared_ptr<IRenderTarget> target_;
        const std::size_t pageCount_;

        PaginationMetrics *metrics_;
        CleanupExecutor cleanup_;

        mutable std::mutex mutex_;
        std::condition_variable completedCv_;
        Navigator navigator_;
        SessionState state_ = SessionState::Active;
        CompletionReason reason_ = CompletionReason::None;
        bool disposing_ = false;
        std::vector<CompletionHandler> waiters_;
    };

} // namespace pagix::pagination

#endif // PAGIX_PAGINATION_SESSION_HPP
