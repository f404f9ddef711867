#include <pagix/pagination/session.hpp>
#include <pagix/pagination/error.hpp>
#include <pagix/pagination/Metrics.hpp>

#include <stdexcept>

#include <boost/asio/post.hpp>

#include <vix/utils/Logger.hpp>

namespace pagix::pagination
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    std::string_view to_string(SessionState state) noexcept
    {
        switch (state)
        {
        case SessionState::Active:
            return "active";
        case SessionState::Completed:
            return "completed";
        case SessionState::Disposed:
            return "disposed";
        }
        return "unknown";
    }

    std::string_view to_string(CompletionReason reason) noexcept
    {
        switch (reason)
        {
        case CompletionReason::None:
            return "none";
        case CompletionReason::Timeout:
            return "timeout";
        case CompletionReason::Stopped:
            return "stopped";
        case CompletionReason::Abandoned:
            return "abandoned";
        }
        return "unknown";
    }

    std::shared_ptr<PaginationSession> PaginationSession::create(Executor executor,
                                                                 std::vector<Page> pages,
                                                                 UserId owner,
                                                                 PaginationBehaviour behaviour,
                                                                 PaginationDeletion deletion,
                                                                 std::chrono::milliseconds timeout,
                                                                 ControlBindingSet bindings,
                                                                 std::shared_ptr<IRenderTarget> target,
                                                                 PaginationMetrics *metrics)
    {
        if (!target)
            throw std::invalid_argument("[Pagination][Session] render target must not be null");

        PageStore store{std::move(pages)};

        auto session = std::make_shared<PaginationSession>(PrivateTag{},
                                                           std::move(executor),
                                                           std::move(store),
                                                           owner,
                                                           behaviour,
                                                           deletion,
                                                           timeout,
                                                           std::move(bindings),
                                                           std::move(target),
                                                           metrics);

        session->arm_timeout();
        return session;
    }

    PaginationSession::PaginationSession(PrivateTag,
                                         Executor executor,
                                         PageStore pages,
                                         UserId owner,
                                         PaginationBehaviour behaviour,
                                         PaginationDeletion deletion,
                                         std::chrono::milliseconds timeout,
                                         ControlBindingSet bindings,
                                         std::shared_ptr<IRenderTarget> target,
                                         PaginationMetrics *metrics)
        : strand_(net::make_strand(std::move(executor))),
          timer_(strand_),
          deadline_(std::chrono::steady_clock::now() + timeout),
          owner_(owner),
          behaviour_(behaviour),
          deletion_(deletion),
          timeout_(timeout),
          bindings_(std::move(bindings)),
          target_(std::move(target)),
          pageCount_(pages.page_count()),
          metrics_(metrics),
          cleanup_(metrics),
          mutex_(),
          completedCv_(),
          navigator_(std::move(pages), behaviour),
          waiters_()
    {
        if (metrics_)
        {
            metrics_->sessions_total.fetch_add(1, std::memory_order_relaxed);
            metrics_->sessions_active.fetch_add(1, std::memory_order_relaxed);
        }

        logger.log(Logger::Level::DEBUG,
                   "[Pagination][Session] target {} owner {}: {} pages, {}, {}, timeout {}ms",
                   target_->id(), owner_, pageCount_,
                   to_string(behaviour_), to_string(deletion_), timeout_.count());
    }

    PaginationSession::~PaginationSession()
    {
        // dropped without dispose()/release(): keep the gauge honest
        if (metrics_ && state_ != SessionState::Disposed)
            metrics_->sessions_active.fetch_sub(1, std::memory_order_relaxed);
    }

    void PaginationSession::arm_timeout()
    {
        auto self = shared_from_this();

        net::post(
            strand_,
            [this, self]()
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (state_ != SessionState::Active)
                        return;
                }

                timer_.expires_at(deadline_);
                timer_.async_wait(
                    [this, self](const boost::system::error_code &ec)
                    {
                        on_timeout(ec);
                    });
            });
    }

    void PaginationSession::cancel_timeout()
    {
        auto self = shared_from_this();

        net::post(
            strand_,
            [this, self]()
            {
                boost::system::error_code ec;
                timer_.cancel(ec);
            });
    }

    void PaginationSession::on_timeout(const boost::system::error_code &ec)
    {
        if (ec == net::error::operation_aborted)
            return;

        if (ec)
        {
            // completion still fires: a broken timer must not leave the session live
            logger.log(Logger::Level::WARN,
                       "[Pagination][Session] target {} timer error: {}",
                       target_->id(), ec.message());
        }

        std::vector<CompletionHandler> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Active)
                return;

            waiters = mark_completed_locked(CompletionReason::Timeout);
        }

        finish_completion(CompletionReason::Timeout, std::move(waiters));
    }

    std::vector<PaginationSession::CompletionHandler>
    PaginationSession::mark_completed_locked(CompletionReason reason)
    {
        state_ = SessionState::Completed;
        reason_ = reason;

        std::vector<CompletionHandler> waiters;
        waiters.swap(waiters_);
        return waiters;
    }

    void PaginationSession::finish_completion(CompletionReason reason,
                                              std::vector<CompletionHandler> waiters)
    {
        completedCv_.notify_all();
        cancel_timeout();

        for (auto &handler : waiters)
        {
            net::post(strand_, std::move(handler));
        }

        if (metrics_)
        {
            switch (reason)
            {
            case CompletionReason::Timeout:
                metrics_->timeouts_total.fetch_add(1, std::memory_order_relaxed);
                break;
            case CompletionReason::Stopped:
                metrics_->stops_total.fetch_add(1, std::memory_order_relaxed);
                break;
            case CompletionReason::Abandoned:
                metrics_->abandoned_total.fetch_add(1, std::memory_order_relaxed);
                break;
            case CompletionReason::None:
                break;
            }
        }

        logger.log(Logger::Level::INFO,
                   "[Pagination][Session] target {} completed ({})",
                   target_->id(), to_string(reason));
    }

    ControlResult PaginationSession::reject(boost::system::error_code ec, std::string_view what)
    {
        if (metrics_)
            metrics_->controls_rejected_total.fetch_add(1, std::memory_order_relaxed);

        logger.log(Logger::Level::DEBUG,
                   "[Pagination][Session] target {} rejected '{}': {}",
                   target_->id(), what, ec.message());

        return ControlResult{
            .error = ec,
            .page = nullptr,
            .stillActive = false,
        };
    }

    ControlResult PaginationSession::register_control(const ControlToken &token)
    {
        if (!is_active())
            return reject(make_error_code(errc::session_inactive), token.value);

        boost::system::error_code ec;
        const auto action = bindings_.resolve(token, ec);
        if (!action)
            return reject(ec, token.value);

        return register_action(*action);
    }

    ControlResult PaginationSession::register_action(ControlAction action)
    {
        ControlResult result;
        std::vector<CompletionHandler> waiters;
        bool inactive = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (state_ != SessionState::Active)
            {
                inactive = true;
            }
            else
            {
                switch (action)
                {
                case ControlAction::SkipToFirst:
                    navigator_.jump_to_first();
                    break;
                case ControlAction::Previous:
                    navigator_.retreat();
                    break;
                case ControlAction::Next:
                    navigator_.advance();
                    break;
                case ControlAction::SkipToLast:
                    navigator_.jump_to_last();
                    break;
                case ControlAction::Stop:
                    waiters = mark_completed_locked(CompletionReason::Stopped);
                    break;
                }

                result.page = &navigator_.current_page();
                result.stillActive = (state_ == SessionState::Active);
            }
        }

        if (inactive)
            return reject(make_error_code(errc::session_inactive), to_string(action));

        if (metrics_)
            metrics_->controls_total.fetch_add(1, std::memory_order_relaxed);

        if (!result.stillActive)
            finish_completion(CompletionReason::Stopped, std::move(waiters));

        return result;
    }

    void PaginationSession::stop()
    {
        std::vector<CompletionHandler> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SessionState::Active)
                return;

            waiters = mark_completed_locked(CompletionReason::Stopped);
        }

        finish_completion(CompletionReason::Stopped, std::move(waiters));
    }

    void PaginationSession::wait_until_complete()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        completedCv_.wait(lock, [this]
                          { return state_ != SessionState::Active; });
    }

    bool PaginationSession::wait_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return completedCv_.wait_for(lock, timeout, [this]
                                     { return state_ != SessionState::Active; });
    }

    void PaginationSession::async_wait(CompletionHandler handler)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ == SessionState::Active)
            {
                waiters_.push_back(std::move(handler));
                return;
            }
        }

        net::post(strand_, std::move(handler));
    }

    boost::system::error_code PaginationSession::dispose()
    {
        return close(true);
    }

    boost::system::error_code PaginationSession::release()
    {
        return close(false);
    }

    boost::system::error_code PaginationSession::close(bool runCleanup)
    {
        std::vector<CompletionHandler> waiters;
        bool completedHere = false;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (disposing_ || state_ == SessionState::Disposed)
            {
                logger.log(Logger::Level::WARN,
                           "[Pagination][Session] target {} disposed twice",
                           target_->id());
                return make_error_code(errc::session_inactive);
            }

            disposing_ = true;

            if (state_ == SessionState::Active)
            {
                waiters = mark_completed_locked(CompletionReason::Abandoned);
                completedHere = true;
            }
        }

        if (completedHere)
            finish_completion(CompletionReason::Abandoned, std::move(waiters));

        struct DisposedOnExit
        {
            PaginationSession &session;

            ~DisposedOnExit()
            {
                {
                    std::lock_guard<std::mutex> lock(session.mutex_);
                    session.state_ = SessionState::Disposed;
                }

                if (session.metrics_)
                    session.metrics_->sessions_active.fetch_sub(1, std::memory_order_relaxed);
            }
        } guard{*this};

        if (!runCleanup)
        {
            logger.log(Logger::Level::INFO,
                       "[Pagination][Session] target {} released without cleanup",
                       target_->id());
            return {};
        }

        const auto ec = cleanup_.execute(deletion_, *target_);

        logger.log(Logger::Level::INFO,
                   "[Pagination][Session] target {} disposed ({})",
                   target_->id(), ec ? ec.message() : std::string{"clean"});

        return ec;
    }

    std::size_t PaginationSession::current_index() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return navigator_.current_index();
    }

    const Page &PaginationSession::current_page() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return navigator_.current_page();
    }

    SessionState PaginationSession::state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool PaginationSession::is_active() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == SessionState::Active;
    }

    CompletionReason PaginationSession::completion_reason() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

} // namespace pagix::pagination
