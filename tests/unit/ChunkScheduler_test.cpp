#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <map>

#include <sharemirror/chunkscheduler.h>

#include "FakeShare.h"
#include "TemporaryDirectory.h"

using namespace sharemirror;
using namespace ::testing;

namespace
{

class MockShareClient : public ShareClient
{
public:
    MOCK_METHOD(ErrorOr<NodeInfo>, getMetadata, (const std::string&), (override));

    MOCK_METHOD(ErrorOr<ChildPage>,
                listChildren,
                (const std::string&, const std::optional<std::string>&),
                (override));

    MOCK_METHOD(ErrorOr<std::string>, fetchRange, (const std::string&, m_off_t, m_off_t), (override));
}; // MockShareClient

Node fileNode(const std::string& id, m_off_t size)
{
    Node node;

    node.mId = id;
    node.mName = id;
    node.mKind = NodeKind::FILE;
    node.mSize = size;

    return node;
}

RetryPolicy immediateRetries(unsigned limit)
{
    RetryPolicy policy;

    policy.mRetryLimit = limit;
    policy.mRetryDelay = std::chrono::milliseconds(0);

    return policy;
}

} // anonymous

TEST(ChunkScheduler, partition)
{
    auto tasks = ChunkScheduler::partition("f", 10, 3);

    ASSERT_EQ(4u, tasks.size());
    EXPECT_EQ(4u, ChunkScheduler::chunkCount(10, 3));

    m_off_t offset = 0;

    for (auto& task : tasks)
    {
        EXPECT_EQ("f", task.mFileId);
        EXPECT_EQ(offset, task.mOffset);
        offset += task.mLength;
    }

    EXPECT_EQ(10, offset);
    EXPECT_EQ(1, tasks.back().mLength);

    tasks = ChunkScheduler::partition("f", 9, 3);

    ASSERT_EQ(3u, tasks.size());
    EXPECT_EQ(3, tasks.back().mLength);

    tasks = ChunkScheduler::partition("f", 2, 100);

    ASSERT_EQ(1u, tasks.size());
    EXPECT_EQ(2, tasks[0].mLength);

    EXPECT_TRUE(ChunkScheduler::partition("f", 0, 3).empty());
    EXPECT_EQ(0u, ChunkScheduler::chunkCount(0, 3));
}

TEST(ChunkScheduler, emptyFileHasNoChunks)
{
    FakeShare share;

    share.addFile("f", "f", "");

    ChunkScheduler scheduler(share);

    auto stream = scheduler.scheduleFile(fileNode("f", 0), 4, 4);
    ChunkResult result;

    EXPECT_EQ(0u, stream.total());
    EXPECT_EQ(0u, stream.workerCount());
    EXPECT_FALSE(stream.next(result));
    EXPECT_EQ(0u, share.rangeRequests());
}

TEST(ChunkScheduler, defaultStreamIsEmpty)
{
    ChunkStream stream;
    ChunkResult result;

    EXPECT_EQ(0u, stream.total());
    EXPECT_FALSE(stream.next(result));

    stream.cancel();
    EXPECT_FALSE(stream.cancelled());
}

TEST(ChunkScheduler, reassembledChunksMatchContent)
{
    FakeShare share;
    auto content = pattern(1000, 3);

    share.addFile("f", "f", content);

    ChunkScheduler scheduler(share, immediateRetries(3));

    auto stream = scheduler.scheduleFile(fileNode("f", 1000), 64, 4);
    std::string assembled(content.size(), '\0');
    std::map<m_off_t, unsigned> seen;
    ChunkResult result;

    EXPECT_EQ(16u, stream.total());
    EXPECT_EQ(4u, stream.workerCount());

    while (stream.next(result))
    {
        ASSERT_TRUE(result.succeeded()) << result.mOutcome;
        EXPECT_EQ(1u, result.mAttempts);
        ASSERT_EQ(result.mLength, static_cast<m_off_t>(result.mData.size()));

        assembled.replace(static_cast<std::size_t>(result.mOffset),
                          result.mData.size(),
                          result.mData);

        ++seen[result.mOffset];
    }

    EXPECT_EQ(16u, stream.received());
    EXPECT_EQ(16u, seen.size());
    EXPECT_EQ(content, assembled);
    EXPECT_EQ(16u, share.rangeRequests());
}

TEST(ChunkScheduler, workerCountBoundsConcurrency)
{
    FakeShare share;

    share.addFile("f", "f", pattern(200));
    share.setRangeDelay(std::chrono::milliseconds(10));

    ChunkScheduler scheduler(share);

    auto stream = scheduler.scheduleFile(fileNode("f", 200), 10, 3);
    ChunkResult result;
    std::size_t count = 0;

    while (stream.next(result))
    {
        EXPECT_TRUE(result.succeeded());
        ++count;
    }

    EXPECT_EQ(20u, count);
    EXPECT_EQ(3u, stream.workerCount());
    EXPECT_LE(share.maxConcurrentRanges(), 3u);
    EXPECT_GE(share.maxConcurrentRanges(), 1u);
}

TEST(ChunkScheduler, workersDontOutnumberChunks)
{
    FakeShare share;

    share.addFile("f", "f", "abc");

    ChunkScheduler scheduler(share);

    auto stream = scheduler.scheduleFile(fileNode("f", 3), 2, 8);
    ChunkResult result;

    EXPECT_EQ(2u, stream.workerCount());

    while (stream.next(result))
        EXPECT_TRUE(result.succeeded());
}

TEST(ChunkScheduler, transientFailuresAreRetried)
{
    FakeShare share;

    share.addFile("f", "f", "abcdef");
    share.failRange("f", 3, Error(API_EAGAIN, "HTTP 503"), 3);

    ChunkScheduler scheduler(share, immediateRetries(3));

    auto stream = scheduler.scheduleFile(fileNode("f", 6), 3, 2);
    ChunkResult result;
    std::map<m_off_t, ChunkResult> results;

    while (stream.next(result))
        results[result.mOffset] = result;

    ASSERT_EQ(2u, results.size());
    EXPECT_TRUE(results[0].succeeded());
    EXPECT_EQ(1u, results[0].mAttempts);

    ASSERT_TRUE(results[3].succeeded()) << results[3].mOutcome;
    EXPECT_EQ("def", results[3].mData);
    EXPECT_EQ(4u, results[3].mAttempts);
    EXPECT_EQ(4u, share.rangeRequests("f", 3));
}

TEST(ChunkScheduler, retriesAreBounded)
{
    FakeShare share;

    share.addFile("f", "f", "abcdef");
    share.failRange("f", 0, Error(LOCAL_ETIMEOUT, "Operation timed out"));

    ChunkScheduler scheduler(share, immediateRetries(2));

    auto stream = scheduler.scheduleFile(fileNode("f", 6), 6, 1);
    ChunkResult result;

    ASSERT_TRUE(stream.next(result));
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(LOCAL_ETIMEOUT, result.mOutcome);
    EXPECT_EQ(3u, result.mAttempts);
    EXPECT_TRUE(result.mData.empty());
    EXPECT_EQ(3u, share.rangeRequests("f", 0));

    EXPECT_FALSE(stream.next(result));
}

TEST(ChunkScheduler, permanentFailuresArentRetried)
{
    MockShareClient client;

    EXPECT_CALL(client, fetchRange("f", 0, 4))
      .Times(1)
      .WillOnce(Return(ErrorOr<std::string>(unexpected(Error(API_EFAILED, "HTTP 403")))));

    EXPECT_CALL(client, fetchRange("f", 4, 4))
      .Times(1)
      .WillOnce(Return(ErrorOr<std::string>(unexpected(Error(API_ERANGE, "short read")))));

    ChunkScheduler scheduler(client, immediateRetries(5));

    auto stream = scheduler.scheduleFile(fileNode("f", 8), 4, 2);
    ChunkResult result;
    std::map<m_off_t, ChunkResult> results;

    while (stream.next(result))
        results[result.mOffset] = result;

    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(API_EFAILED, results[0].mOutcome);
    EXPECT_EQ(1u, results[0].mAttempts);
    EXPECT_EQ(API_ERANGE, results[4].mOutcome);
    EXPECT_EQ(1u, results[4].mAttempts);
}

TEST(ChunkScheduler, cancelledTasksStillReport)
{
    FakeShare share;

    share.addFile("f", "f", pattern(100));
    share.setRangeDelay(std::chrono::milliseconds(5));

    ChunkScheduler scheduler(share);

    auto stream = scheduler.scheduleFile(fileNode("f", 100), 1, 2);
    std::map<m_off_t, unsigned> seen;
    std::size_t cancelled = 0;
    ChunkResult result;

    ASSERT_TRUE(stream.next(result));
    ++seen[result.mOffset];

    stream.cancel();
    EXPECT_TRUE(stream.cancelled());

    while (stream.next(result))
    {
        ++seen[result.mOffset];

        if (!result.succeeded())
        {
            EXPECT_EQ(LOCAL_ECANCELLED, result.mOutcome);
            ++cancelled;
        }
    }

    EXPECT_EQ(100u, seen.size());
    EXPECT_EQ(100u, stream.received());
    EXPECT_GT(cancelled, 0u);
    EXPECT_LT(share.rangeRequests(), 100u);

    for (auto& entry : seen)
        EXPECT_EQ(1u, entry.second) << entry.first;
}

TEST(ChunkScheduler, cancelInterruptsBackoff)
{
    FakeShare share;

    share.addFile("f", "f", "abc");
    share.failRange("f", 0, Error(API_EAGAIN, "HTTP 503"));

    RetryPolicy policy;

    policy.mRetryLimit = 10;
    policy.mRetryDelay = std::chrono::hours(1);

    ChunkScheduler scheduler(share, policy);

    auto stream = scheduler.scheduleFile(fileNode("f", 3), 3, 1);
    ChunkResult result;

    stream.cancel();

    ASSERT_TRUE(stream.next(result));
    EXPECT_EQ(LOCAL_ECANCELLED, result.mOutcome);
}

TEST(ChunkScheduler, undrainedStreamCanBeDestroyed)
{
    FakeShare share;

    share.addFile("f", "f", pattern(64));
    share.setRangeDelay(std::chrono::milliseconds(2));

    ChunkScheduler scheduler(share);

    {
        auto stream = scheduler.scheduleFile(fileNode("f", 64), 1, 4);
        ChunkResult result;

        ASSERT_TRUE(stream.next(result));
    }

    EXPECT_LT(share.rangeRequests(), 64u);
}
