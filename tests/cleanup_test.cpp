#include <gtest/gtest.h>

#include <pagix/pagination/cleanup.hpp>
#include <pagix/pagination/error.hpp>
#include <pagix/pagination/Metrics.hpp>

#include "RecordingTarget.hpp"

namespace pg = pagix::pagination;
using pagix::pagination::test::RecordingTarget;

TEST(Cleanup, DeleteControlMarksRemovesReactionsOnly)
{
    RecordingTarget target;
    pg::CleanupExecutor cleanup;

    EXPECT_FALSE(cleanup.execute(pg::PaginationDeletion::DeleteControlMarks, target));
    EXPECT_EQ(target.removeCalls.load(), 1);
    EXPECT_EQ(target.deleteCalls.load(), 0);
}

TEST(Cleanup, DeleteRenderedArtifactDeletesMessageOnly)
{
    RecordingTarget target;
    pg::CleanupExecutor cleanup;

    EXPECT_FALSE(cleanup.execute(pg::PaginationDeletion::DeleteRenderedArtifact, target));
    EXPECT_EQ(target.removeCalls.load(), 0);
    EXPECT_EQ(target.deleteCalls.load(), 1);
}

TEST(Cleanup, KeepControlMarksIssuesNothing)
{
    RecordingTarget target;
    pg::CleanupExecutor cleanup;

    EXPECT_FALSE(cleanup.execute(pg::PaginationDeletion::KeepControlMarks, target));
    EXPECT_EQ(target.removeCalls.load(), 0);
    EXPECT_EQ(target.deleteCalls.load(), 0);
}

TEST(Cleanup, TransportErrorsAreReturnedAndCounted)
{
    RecordingTarget target;
    target.cleanupError = boost::system::errc::make_error_code(boost::system::errc::timed_out);

    pg::PaginationMetrics metrics;
    pg::CleanupExecutor cleanup{&metrics};

    EXPECT_EQ(cleanup.execute(pg::PaginationDeletion::DeleteControlMarks, target),
              boost::system::errc::timed_out);

    target.throwOnCleanup = true;
    EXPECT_EQ(cleanup.execute(pg::PaginationDeletion::DeleteRenderedArtifact, target),
              pg::errc::transport_failure);

    EXPECT_EQ(metrics.cleanups_total.load(), 2u);
    EXPECT_EQ(metrics.cleanup_failures_total.load(), 2u);
}

TEST(Cleanup, DeletionNames)
{
    EXPECT_EQ(pg::to_string(pg::PaginationDeletion::DeleteControlMarks), "delete_emojis");
    EXPECT_EQ(pg::to_string(pg::PaginationDeletion::DeleteRenderedArtifact), "delete_message");
    EXPECT_EQ(pg::to_string(pg::PaginationDeletion::KeepControlMarks), "keep_emojis");
}
