#include <gtest/gtest.h>
#include "LogEvent.hpp"
#include <chrono>
#include <string>
#include <vector>

TEST(LogEventTest, SerializeDeserializeBatch)
{
    std::vector<LogEvent> events = {
        LogEvent("first", 1000),
        LogEvent("", 1001),
        LogEvent(std::string("bin\0ary", 7), -5),
        LogEvent("\xF0\x9F\x98\x80 unicode", 1735787045000)};

    std::vector<uint8_t> data = LogEvent::serializeBatch(events);
    std::vector<LogEvent> decoded = LogEvent::deserializeBatch(data);

    EXPECT_EQ(decoded, events);
}

TEST(LogEventTest, EmptyBatch)
{
    std::vector<uint8_t> data = LogEvent::serializeBatch({});
    EXPECT_EQ(data.size(), sizeof(uint32_t));
    EXPECT_TRUE(LogEvent::deserializeBatch(data).empty());
}

TEST(LogEventTest, SerializedSizeIsExact)
{
    std::vector<LogEvent> events = {LogEvent("abc", 1), LogEvent("de", 2)};
    // count + per event (entry size + timestamp + length + bytes)
    size_t expected = 4 + (4 + 8 + 4 + 3) + (4 + 8 + 4 + 2);
    EXPECT_EQ(LogEvent::serializeBatch(events).size(), expected);
}

TEST(LogEventTest, TruncatedBatchThrows)
{
    std::vector<uint8_t> data = LogEvent::serializeBatch({LogEvent("hello world", 42)});
    data.resize(data.size() - 3);
    EXPECT_THROW(LogEvent::deserializeBatch(data), std::runtime_error);
}

TEST(LogEventTest, MissingCountThrows)
{
    std::vector<uint8_t> data = {0x01, 0x00};
    EXPECT_THROW(LogEvent::deserializeBatch(data), std::runtime_error);
}

TEST(LogEventTest, TrailingBytesThrow)
{
    std::vector<uint8_t> data = LogEvent::serializeBatch({LogEvent("x", 1)});
    data.push_back(0xFF);
    EXPECT_THROW(LogEvent::deserializeBatch(data), std::runtime_error);
}

TEST(LogEventTest, InconsistentEntrySizeThrows)
{
    std::vector<uint8_t> data = LogEvent::serializeBatch({LogEvent("abcd", 1)});
    // Entry size lives right after the count
    data[4] = static_cast<uint8_t>(data[4] - 1);
    EXPECT_THROW(LogEvent::deserializeBatch(data), std::runtime_error);
}

TEST(LogEventTest, HugeCountInSmallBatchThrows)
{
    std::vector<uint8_t> data = LogEvent::serializeBatch({LogEvent("only one", 7)});
    // Claim four billion events in a buffer that holds one
    data[0] = 0xFF;
    data[1] = 0xFF;
    data[2] = 0xFF;
    data[3] = 0xFF;
    EXPECT_THROW(LogEvent::deserializeBatch(data), std::runtime_error);

    std::vector<uint8_t> countOnly = {0xFF, 0xFF, 0xFF, 0xFF};
    EXPECT_THROW(LogEvent::deserializeBatch(countOnly), std::runtime_error);
}

TEST(LogEventTest, NowMillisTracksSystemClock)
{
    int64_t before = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    int64_t now = LogEvent::nowMillis();
    EXPECT_GE(now, before);
    EXPECT_LT(now - before, 1000);
}
