#include <gtest/gtest.h>
#include "Compression.hpp"
#include "LogEvent.hpp"
#include <vector>
#include <string>

class CompressionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        for (int i = 0; i < 200; ++i)
        {
            events.emplace_back("GET /api/orders/" + std::to_string(i % 7) + " 200 12ms", 1735787045000 + i);
        }
    }

    std::vector<LogEvent> events;
};

// Test compressing and decompressing a serialized batch of events
TEST_F(CompressionTest, CompressDecompressBatch)
{
    std::vector<uint8_t> serialized = LogEvent::serializeBatch(events);
    std::vector<uint8_t> compressed = Compression::compress(serialized);

    ASSERT_GT(compressed.size(), 0u);
    // Repetitive log lines shrink
    EXPECT_LT(compressed.size(), serialized.size());

    std::vector<LogEvent> recovered = LogEvent::deserializeBatch(Compression::decompress(compressed));
    EXPECT_EQ(recovered, events);
}

TEST_F(CompressionTest, EmptyInput)
{
    EXPECT_TRUE(Compression::compress({}).empty());
    EXPECT_TRUE(Compression::decompress({}).empty());
}

TEST_F(CompressionTest, EveryLevelDecodesTheSame)
{
    std::vector<uint8_t> serialized = LogEvent::serializeBatch(events);
    for (int level = 1; level <= 9; ++level)
    {
        EXPECT_EQ(Compression::decompress(Compression::compress(serialized, level)), serialized)
            << "level " << level;
    }
}

TEST_F(CompressionTest, LargeInputSpansSeveralChunks)
{
    std::vector<uint8_t> data(1024 * 1024);
    for (size_t i = 0; i < data.size(); ++i)
    {
        data[i] = static_cast<uint8_t>((i * 31) ^ (i >> 7));
    }
    EXPECT_EQ(Compression::decompress(Compression::compress(data, 1)), data);
}

TEST_F(CompressionTest, InvalidDataThrows)
{
    std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(Compression::decompress(garbage), std::runtime_error);
}

TEST_F(CompressionTest, TruncatedStreamThrows)
{
    std::vector<uint8_t> compressed = Compression::compress(LogEvent::serializeBatch(events));
    compressed.resize(compressed.size() / 2);
    EXPECT_THROW(Compression::decompress(compressed), std::runtime_error);
}

TEST_F(CompressionTest, OversizedOutputIsRefused)
{
    std::vector<uint8_t> zeros(Compression::MAX_DECOMPRESSED_SIZE + 1, 0);
    std::vector<uint8_t> bomb = Compression::compress(zeros, 9);
    ASSERT_LT(bomb.size(), 1024u * 1024u);
    EXPECT_THROW(Compression::decompress(bomb), std::runtime_error);
}
