#include <pagix/pagination/cleanup.hpp>
#include <pagix/pagination/error.hpp>
#include <pagix/pagination/Metrics.hpp>

#include <exception>

#include <vix/utils/Logger.hpp>

namespace pagix::pagination
{
    using Logger = vix::utils::Logger;

    static Logger &logger = Logger::getInstance();

    std::string_view to_string(PaginationDeletion deletion) noexcept
    {
        switch (deletion)
        {
        case PaginationDeletion::DeleteControlMarks:
            return "delete_emojis";
        case PaginationDeletion::DeleteRenderedArtifact:
            return "delete_message";
        case PaginationDeletion::KeepControlMarks:
            return "keep_emojis";
        }
        return "unknown";
    }

    boost::system::error_code CleanupExecutor::execute(PaginationDeletion deletion,
                                                       IRenderTarget &target) const
    {
        boost::system::error_code ec;

        try
        {
            switch (deletion)
            {
            case PaginationDeletion::DeleteControlMarks:
                ec = target.remove_all_control_marks();
                break;

            case PaginationDeletion::DeleteRenderedArtifact:
                ec = target.delete_artifact();
                break;

            case PaginationDeletion::KeepControlMarks:
                break;
            }
        }
        catch (const std::exception &e)
        {
            logger.log(Logger::Level::ERROR,
                       "[Pagination][Cleanup] target {} threw during {}: {}",
                       target.id(), to_string(deletion), e.what());
            ec = make_error_code(errc::transport_failure);
        }

        if (metrics_)
        {
            metrics_->cleanups_total.fetch_add(1, std::memory_order_relaxed);
            if (ec)
                metrics_->cleanup_failures_total.fetch_add(1, std::memory_order_relaxed);
        }

        if (ec)
        {
            logger.log(Logger::Level::WARN,
                       "[Pagination][Cleanup] {} failed on target {}: {}",
                       to_string(deletion), target.id(), ec.message());
        }
        else
        {
            logger.log(Logger::Level::DEBUG,
                       "[Pagination][Cleanup] {} done on target {}",
                       to_string(deletion), target.id());
        }

        return ec;
    }

} // namespace pagix::pagination
