#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "FlushCoordinator.hpp"
#include "MockRemoteSink.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class FlushCoordinatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        queue = std::make_shared<EventQueue>();
        recording = std::make_shared<RecordingSink>();
        reporter = [this](const std::string &message)
        {
            std::lock_guard<std::mutex> lock(errorsMutex);
            errors.push_back(message);
        };
    }

    std::unique_ptr<FlushCoordinator> makeCoordinator(std::shared_ptr<RemoteSink> sink,
                                                      std::chrono::milliseconds interval = std::chrono::milliseconds(3000))
    {
        auto destinations = std::make_shared<DestinationNameProvider>(sink, "group", "app");
        return std::make_unique<FlushCoordinator>(queue, destinations, sink, interval, reporter);
    }

    void fill(size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            queue->add("event " + std::to_string(i));
        }
    }

    std::vector<std::string> reportedErrors()
    {
        std::lock_guard<std::mutex> lock(errorsMutex);
        return errors;
    }

    std::shared_ptr<EventQueue> queue;
    std::shared_ptr<RecordingSink> recording;
    FlushCoordinator::ErrorReporter reporter;
    std::mutex errorsMutex;
    std::vector<std::string> errors;
};

TEST_F(FlushCoordinatorTest, RejectsMissingComponents)
{
    auto destinations = std::make_shared<DestinationNameProvider>(recording, "group", "app");
    EXPECT_THROW(FlushCoordinator(nullptr, destinations, recording), std::invalid_argument);
    EXPECT_THROW(FlushCoordinator(queue, nullptr, recording), std::invalid_argument);
    EXPECT_THROW(FlushCoordinator(queue, destinations, nullptr), std::invalid_argument);
}

TEST_F(FlushCoordinatorTest, RejectsNonPositiveInterval)
{
    auto destinations = std::make_shared<DestinationNameProvider>(recording, "group", "app");
    EXPECT_THROW(FlushCoordinator(queue, destinations, recording, std::chrono::milliseconds(0)),
                 std::invalid_argument);
}

TEST_F(FlushCoordinatorTest, DefaultIntervalIsThreeSeconds)
{
    auto destinations = std::make_shared<DestinationNameProvider>(recording, "group", "app");
    FlushCoordinator coordinator(queue, destinations, recording);
    EXPECT_EQ(coordinator.flushInterval(), std::chrono::milliseconds(3000));
}

TEST_F(FlushCoordinatorTest, EmptyQueueMakesNoSinkCalls)
{
    auto mock = std::make_shared<::testing::StrictMock<MockRemoteSink>>();
    EXPECT_CALL(*mock, close()).Times(1);
    auto coordinator = makeCoordinator(mock);

    EXPECT_EQ(coordinator->flush(), 0u);
    EXPECT_EQ(coordinator->flushCycles(), 1u);
    coordinator->close();
}

TEST_F(FlushCoordinatorTest, FlushDrainsQueueInLegalBatches)
{
    auto coordinator = makeCoordinator(recording);
    fill(10001);

    EXPECT_EQ(coordinator->flush(), 10001u);
    EXPECT_EQ(queue->size(), 0u);

    ASSERT_EQ(recording->batches.size(), 2u);
    EXPECT_EQ(recording->batches[0].size(), 10000u);
    EXPECT_EQ(recording->batches[1].size(), 1u);
    EXPECT_EQ(recording->batches[0].front().message, "event 0");
    EXPECT_EQ(recording->batches[1].front().message, "event 10000");
    EXPECT_EQ(recording->destinations[0], recording->destinations[1]);
    EXPECT_EQ(recording->created.size(), 1u);
    EXPECT_TRUE(reportedErrors().empty());
}

TEST_F(FlushCoordinatorTest, FailedSubmissionDropsOnlyThatBatch)
{
    auto mock = std::make_shared<NiceMock<MockRemoteSink>>();
    auto coordinator = makeCoordinator(mock);
    fill(10001);

    std::vector<LogEvent> delivered;
    EXPECT_CALL(*mock, submitBatch("group", _, _))
        .WillOnce(Throw(SinkError("throttled")))
        .WillOnce([&delivered](const std::string &, const std::string &, const std::vector<LogEvent> &events)
                  { delivered = events; });

    EXPECT_EQ(coordinator->flush(), 0u);
    EXPECT_EQ(coordinator->droppedEvents(), 10000u);
    EXPECT_EQ(queue->size(), 1u);

    auto reported = reportedErrors();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_THAT(reported[0], HasSubstr("Failed to flush logs"));
    EXPECT_THAT(reported[0], HasSubstr("throttled"));

    // The next cycle picks up what was left behind
    EXPECT_EQ(coordinator->flush(), 1u);
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0].message, "event 10000");
    EXPECT_EQ(coordinator->droppedEvents(), 10000u);
}

TEST_F(FlushCoordinatorTest, DestinationFailureDropsBatch)
{
    auto mock = std::make_shared<NiceMock<MockRemoteSink>>();
    auto coordinator = makeCoordinator(mock);
    fill(3);

    EXPECT_CALL(*mock, describeExisting(_, _)).WillOnce(Throw(SinkError("unreachable")));
    EXPECT_CALL(*mock, submitBatch(_, _, _)).Times(0);

    EXPECT_EQ(coordinator->flush(), 0u);
    EXPECT_EQ(coordinator->droppedEvents(), 3u);
    EXPECT_EQ(queue->size(), 0u);
    EXPECT_EQ(reportedErrors().size(), 1u);
}

TEST_F(FlushCoordinatorTest, TimerFlushesPeriodically)
{
    auto coordinator = makeCoordinator(recording, std::chrono::milliseconds(20));
    ASSERT_TRUE(coordinator->start());
    EXPECT_TRUE(coordinator->isRunning());

    fill(5);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (recording->eventCount() < 5 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(recording->eventCount(), 5u);
    EXPECT_GE(coordinator->flushCycles(), 1u);

    coordinator->close();
    EXPECT_FALSE(coordinator->isRunning());
}

TEST_F(FlushCoordinatorTest, RestartReplacesTimer)
{
    auto coordinator = makeCoordinator(recording, std::chrono::milliseconds(20));
    ASSERT_TRUE(coordinator->start());
    ASSERT_TRUE(coordinator->start());
    EXPECT_TRUE(coordinator->isRunning());
    coordinator->close();
    EXPECT_FALSE(coordinator->isRunning());
}

TEST_F(FlushCoordinatorTest, CloseFlushesRemainingEventsAndClosesSink)
{
    auto coordinator = makeCoordinator(recording, std::chrono::milliseconds(60000));
    ASSERT_TRUE(coordinator->start());
    fill(42);

    coordinator->close();

    EXPECT_TRUE(coordinator->isClosed());
    EXPECT_EQ(recording->eventCount(), 42u);
    EXPECT_EQ(recording->closeCalls, 1u);
    EXPECT_EQ(queue->size(), 0u);
}

TEST_F(FlushCoordinatorTest, CloseIsIdempotent)
{
    auto coordinator = makeCoordinator(recording);
    fill(1);
    coordinator->close();
    coordinator->close();
    EXPECT_EQ(recording->closeCalls, 1u);
    EXPECT_EQ(recording->batchCount(), 1u);
}

TEST_F(FlushCoordinatorTest, NothingIsShippedAfterClose)
{
    auto coordinator = makeCoordinator(recording);
    coordinator->close();

    fill(3);
    EXPECT_EQ(coordinator->flush(), 0u);
    EXPECT_EQ(recording->batchCount(), 0u);
    EXPECT_EQ(queue->size(), 3u);
}

TEST_F(FlushCoordinatorTest, StartAfterCloseIsRefused)
{
    auto coordinator = makeCoordinator(recording);
    coordinator->close();

    EXPECT_FALSE(coordinator->start());
    EXPECT_FALSE(coordinator->isRunning());
    auto reported = reportedErrors();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_THAT(reported[0], HasSubstr("Cannot start after close"));
}

TEST_F(FlushCoordinatorTest, SinkCloseFailureIsReported)
{
    auto mock = std::make_shared<NiceMock<MockRemoteSink>>();
    EXPECT_CALL(*mock, close()).WillOnce(Throw(SinkError("connection reset")));
    auto coordinator = makeCoordinator(mock);

    EXPECT_NO_THROW(coordinator->close());
    auto reported = reportedErrors();
    ASSERT_EQ(reported.size(), 1u);
    EXPECT_THAT(reported[0], HasSubstr("Failed to close sink"));
}

TEST_F(FlushCoordinatorTest, CyclesNeverOverlap)
{
    auto mock = std::make_shared<NiceMock<MockRemoteSink>>();
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<size_t> shipped{0};

    ON_CALL(*mock, submitBatch(_, _, _))
        .WillByDefault([&](const std::string &, const std::string &, const std::vector<LogEvent> &events)
                       {
            int now = ++active;
            int seen = maxActive.load();
            while (now > seen && !maxActive.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            shipped += events.size();
            --active; });

    auto coordinator = makeCoordinator(mock, std::chrono::milliseconds(5));
    ASSERT_TRUE(coordinator->start());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([this, &coordinator]()
                             {
            for (int i = 0; i < 50; ++i)
            {
                queue->add("x");
                coordinator->flush();
            } });
    }
    for (auto &thread : threads)
    {
        thread.join();
    }
    coordinator->close();

    EXPECT_EQ(maxActive.load(), 1);
    EXPECT_EQ(shipped.load(), 200u);
    EXPECT_EQ(coordinator->droppedEvents(), 0u);
}

TEST_F(FlushCoordinatorTest, RejectsIntervalLongerThanADay)
{
    auto destinations = std::make_shared<DestinationNameProvider>(recording, "group", "app");
    EXPECT_THROW(FlushCoordinator(queue, destinations, recording, std::chrono::milliseconds::max()),
                 std::invalid_argument);
    EXPECT_THROW(FlushCoordinator(queue, destinations, recording,
                                  FlushCoordinator::MAX_FLUSH_INTERVAL + std::chrono::milliseconds(1)),
                 std::invalid_argument);

    FlushCoordinator longest(queue, destinations, recording, FlushCoordinator::MAX_FLUSH_INTERVAL);
    EXPECT_TRUE(longest.start());
    longest.close();
    EXPECT_FALSE(longest.isRunning());
}

TEST_F(FlushCoordinatorTest, ThrowingReporterDoesNotEscape)
{
    auto mock = std::make_shared<NiceMock<MockRemoteSink>>();
    ON_CALL(*mock, submitBatch(_, _, _)).WillByDefault(Throw(SinkError("rejected")));
    ON_CALL(*mock, close()).WillByDefault(Throw(SinkError("already gone")));

    std::atomic<size_t> reports{0};
    auto destinations = std::make_shared<DestinationNameProvider>(mock, "group", "app");
    auto coordinator = std::make_unique<FlushCoordinator>(
        queue, destinations, mock, std::chrono::milliseconds(10),
        [&reports](const std::string &)
        {
            ++reports;
            throw std::runtime_error("reporter broke");
        });

    fill(3);
    EXPECT_NO_THROW(coordinator->flush());
    EXPECT_EQ(coordinator->droppedEvents(), 3u);

    // The timer thread keeps cycling through the same failure
    ASSERT_TRUE(coordinator->start());
    fill(2);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (coordinator->droppedEvents() < 5u && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(coordinator->droppedEvents(), 5u);
    EXPECT_TRUE(coordinator->isRunning());

    EXPECT_NO_THROW(coordinator.reset());
    EXPECT_GE(reports.load(), 3u);
}
