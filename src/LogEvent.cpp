#include "LogEvent.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace
{
    void appendToVector(std::vector<uint8_t> &vec, const void *data, size_t size)
    {
        const uint8_t *bytes = static_cast<const uint8_t *>(data);
        vec.insert(vec.end(), bytes, bytes + size);
    }

    bool extractFromVector(const std::vector<uint8_t> &vec, size_t &offset, void *data, size_t size)
    {
        if (offset + size > vec.size())
        {
            return false;
        }
        std::memcpy(data, vec.data() + offset, size);
        offset += size;
        return true;
    }
}

int64_t LogEvent::nowMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::vector<uint8_t> LogEvent::serializeBatch(const std::vector<LogEvent> &events)
{
    size_t totalSize = sizeof(uint32_t);
    for (const auto &event : events)
    {
        totalSize += sizeof(uint32_t) + sizeof(int64_t) + sizeof(uint32_t) + event.message.size();
    }

    std::vector<uint8_t> result;
    result.reserve(totalSize);

    uint32_t count = static_cast<uint32_t>(events.size());
    appendToVector(result, &count, sizeof(count));

    for (const auto &event : events)
    {
        uint32_t messageSize = static_cast<uint32_t>(event.message.size());
        uint32_t entrySize = static_cast<uint32_t>(sizeof(int64_t) + sizeof(uint32_t) + messageSize);

        appendToVector(result, &entrySize, sizeof(entrySize));
        appendToVector(result, &event.timestamp, sizeof(event.timestamp));
        appendToVector(result, &messageSize, sizeof(messageSize));
        if (messageSize > 0)
        {
            appendToVector(result, event.message.data(), messageSize);
        }
    }

    return result;
}

std::vector<LogEvent> LogEvent::deserializeBatch(const std::vector<uint8_t> &batchData)
{
    size_t offset = 0;
    uint32_t count = 0;
    if (!extractFromVector(batchData, offset, &count, sizeof(count)))
    {
        throw std::runtime_error("Batch too small - missing event count");
    }

    // Entry size, timestamp and message length take 16 bytes even for an empty message
    const size_t minEventBytes = sizeof(uint32_t) + sizeof(int64_t) + sizeof(uint32_t);
    std::vector<LogEvent> events;
    events.reserve(std::min<size_t>(count, (batchData.size() - offset) / minEventBytes));

    for (uint32_t i = 0; i < count; ++i)
    {
        uint32_t entrySize = 0;
        if (!extractFromVector(batchData, offset, &entrySize, sizeof(entrySize)) ||
            offset + entrySize > batchData.size())
        {
            throw std::runtime_error("Batch truncated at event " + std::to_string(i));
        }
        const size_t entryEnd = offset + entrySize;

        LogEvent event;
        uint32_t messageSize = 0;
        if (!extractFromVector(batchData, offset, &event.timestamp, sizeof(event.timestamp)) ||
            !extractFromVector(batchData, offset, &messageSize, sizeof(messageSize)) ||
            offset + messageSize != entryEnd)
        {
            throw std::runtime_error("Malformed event " + std::to_string(i) + " in batch");
        }

        event.message.assign(reinterpret_cast<const char *>(batchData.data() + offset), messageSize);
        offset = entryEnd;
        events.emplace_back(std::move(event));
    }

    if (offset != batchData.size())
    {
        throw std::runtime_error("Trailing bytes after last event in batch");
    }

    return events;
}
