#include <pagix/pagination/paginator.hpp>
#include <pagix/pagination/error.hpp>

#include <exception>
#include <functional>
#include <stdexcept>

#include <vix/utils/Logger.hpp>

namespace pagix::pagination
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    namespace
    {
        boost::system::error_code guarded_call(const char *stage,
                                               TargetId target,
                                               const std::function<boost::system::error_code()> &fn)
        {
            try
            {
                return fn();
            }
            catch (const std::exception &e)
            {
                logger.log(Logger::Level::ERROR,
                           "[Pagination][Paginator] {} on target {} threw: {}",
                           stage, target, e.what());
                return make_error_code(errc::transport_failure);
            }
        }
    } // namespace

    Paginator::Paginator(net::any_io_executor executor,
                         PaginationConfig config,
                         PaginationMetrics *metrics)
        : executor_(std::move(executor)),
          config_(std::move(config)),
          metrics_(metrics),
          sessionsMutex_(),
          sessions_()
    {
    }

    std::shared_ptr<PaginationSession> Paginator::create_session(std::vector<Page> pages,
                                                                 UserId owner,
                                                                 std::shared_ptr<IRenderTarget> target) const
    {
        return create_session(std::move(pages),
                              owner,
                              std::move(target),
                              config_.behaviour,
                              config_.deletion,
                              std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout),
                              config_.default_bindings());
    }

    std::shared_ptr<PaginationSession> Paginator::create_session(std::vector<Page> pages,
                                                                 UserId owner,
                                                                 std::shared_ptr<IRenderTarget> target,
                                                                 PaginationBehaviour behaviour,
                                                                 PaginationDeletion deletion,
                                                                 std::chrono::milliseconds timeout,
                                                                 ControlBindingSet bindings) const
    {
        return PaginationSession::create(executor_,
                                         std::move(pages),
                                         owner,
                                         behaviour,
                                         deletion,
                                         timeout,
                                         std::move(bindings),
                                         std::move(target),
                                         metrics_);
    }

    boost::system::error_code Paginator::paginate(const std::shared_ptr<PaginationSession> &session)
    {
        if (!session)
            throw std::invalid_argument("[Pagination][Paginator] session must not be null");

        auto &target = session->target();

        if (!register_session(session))
        {
            logger.log(Logger::Level::WARN,
                       "[Pagination][Paginator] target {} already paginated, rejecting new session",
                       target.id());
            // the live session owns the message: no cleanup for this one
            if (const auto ec = session->release())
                logger.log(Logger::Level::WARN,
                           "[Pagination][Paginator] target {} rejected session release: {}",
                           target.id(), ec.message());
            return make_error_code(errc::target_busy);
        }

        // unregister + dispose on every exit path
        struct Release
        {
            Paginator &paginator;
            PaginationSession &session;

            ~Release()
            {
                paginator.unregister_session(session);
                if (session.state() != SessionState::Disposed)
                {
                    const auto ec = session.dispose();
                    if (ec)
                        logger.log(Logger::Level::WARN,
                                   "[Pagination][Paginator] target {} released with cleanup error: {}",
                                   session.target().id(), ec.message());
                }
            }
        } release{*this, *session};

        auto ec = guarded_call("attach_controls", target.id(),
                               [&]
                               { return target.attach_controls(session->bindings()); });

        if (!ec)
        {
            ec = guarded_call("render", target.id(),
                              [&]
                              { return target.render(session->current_page()); });
        }

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Pagination][Paginator] target {} setup failed: {}",
                       target.id(), ec.message());
            session->stop();
        }
        else
        {
            logger.log(Logger::Level::INFO,
                       "[Pagination][Paginator] target {} paginating {} pages for {}",
                       target.id(), session->page_count(), session->owner());
        }

        session->wait_until_complete();
        unregister_session(*session);

        const auto cleanupEc = session->dispose();
        return ec ? ec : cleanupEc;
    }

    boost::system::error_code Paginator::handle_event(const InputEvent &event)
    {
        auto session = find_session(event.target);
        if (!session)
            return make_error_code(errc::no_session);

        if (event.actor != session->owner())
        {
            logger.log(Logger::Level::DEBUG,
                       "[Pagination][Paginator] target {} ignoring input from {} (owner {})",
                       event.target, event.actor, session->owner());
            return make_error_code(errc::not_owner);
        }

        const auto result = session->register_control(event.token);
        if (!result)
            return result.error;

        if (!result.stillActive)
            return {};

        auto &target = session->target();
        const auto ec = guarded_call("render", target.id(),
                                     [&]
                                     { return target.render(*result.page); });
        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Pagination][Paginator] target {} render failed: {}",
                       target.id(), ec.message());
        }
        return ec;
    }

    std::size_t Paginator::active_sessions() const
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        return sessions_.size();
    }

    void Paginator::stop_all()
    {
        std::vector<std::shared_ptr<PaginationSession>> live;
        {
            std::lock_guard<std::mutex> lock(sessionsMutex_);
            live.reserve(sessions_.size());
            for (auto &entry : sessions_)
                live.push_back(entry.second);
        }

        for (auto &session : live)
            session->stop();
    }

    bool Paginator::register_session(const std::shared_ptr<PaginationSession> &session)
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        auto [it, inserted] = sessions_.emplace(session->target().id(), session);
        return inserted;
    }

    void Paginator::unregister_session(const PaginationSession &session)
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);

        auto it = sessions_.find(session.target().id());
        if (it != sessions_.end() && it->second.get() == &session)
            sessions_.erase(it);
    }

    std::shared_ptr<PaginationSession> Paginator::find_session(TargetId target) const
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);

        auto it = sessions_.find(target);
        if (it == sessions_.end())
            return nullptr;
        return it->second;
    }

} // namespace pagix::pagination
