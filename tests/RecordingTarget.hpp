#ifndef PAGIX_PAGINATION_TESTS_RECORDING_TARGET_HPP
#define PAGIX_PAGINATION_TESTS_RECORDING_TARGET_HPP

#include <atomic>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <pagix/pagination/render_target.hpp>

namespace pagix::pagination::test
{
    /// IRenderTarget double counting every call.
    class RecordingTarget final : public IRenderTarget
    {
    public:
        explicit RecordingTarget(TargetId id = 1001) : id_(id) {}

        TargetId id() const noexcept override { return id_; }

        boost::system::error_code render(const Page &page) override
        {
            renders.fetch_add(1);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                rendered_.push_back(page.content());
            }
            return renderError;
        }

        boost::system::error_code attach_controls(const ControlBindingSet &) override
        {
            attaches.fetch_add(1);
            return attachError;
        }

        boost::system::error_code remove_all_control_marks() override
        {
            removeCalls.fetch_add(1);
            if (throwOnCleanup)
                throw std::runtime_error("connection reset");
            return cleanupError;
        }

        boost::system::error_code delete_artifact() override
        {
            deleteCalls.fetch_add(1);
            if (throwOnCleanup)
                throw std::runtime_error("connection reset");
            return cleanupError;
        }

        std::vector<std::string> rendered() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return rendered_;
        }

        std::atomic<int> renders{0};
        std::atomic<int> attaches{0};
        std::atomic<int> removeCalls{0};
        std::atomic<int> deleteCalls{0};

        boost::system::error_code renderError;
        boost::system::error_code attachError;
        boost::system::error_code cleanupError;
        bool throwOnCleanup = false;

    private:
        TargetId id_;
        mutable std::mutex mutex_;
        std::vector<std::string> rendered_;
    };

    /// io_context running on a background thread for the lifetime of the object.
    class IoThread
    {
    public:
        IoThread()
            : work_(boost::asio::make_work_guard(ioc_)),
              thread_([this]()
                      { ioc_.run(); })
        {
        }

        ~IoThread()
        {
            work_.reset();
            ioc_.stop();
            if (thread_.joinable())
                thread_.join();
        }

        boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

    private:
        boost::asio::io_context ioc_;
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
        std::thread thread_;
    };

    inline std::vector<Page> make_pages(std::initializer_list<const char *> contents)
    {
        std::vector<Page> pages;
        for (const char *c : contents)
            pages.emplace_back(c);
        return pages;
    }

} // namespace pagix::pagination::test

#endif // PAGIX_PAGINATION_TESTS_RECORDING_TARGET_HPP
