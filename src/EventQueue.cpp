#include "EventQueue.hpp"
#include <cstring>

namespace
{
    // A UTF-8 lead byte carries at most three continuation bytes
    const size_t MAX_CONTINUATION_BYTES = 3;

    // Each lead byte starts a unit. Continuation bytes that no lead byte can
    // own (leading ones, or more than three in a row) are units of their own.
    bool startsUnit(unsigned char byte, size_t &continuationRun)
    {
        if ((byte & 0xC0) != 0x80)
        {
            continuationRun = 0;
            return true;
        }
        return ++continuationRun > MAX_CONTINUATION_BYTES;
    }

    size_t countCodePoints(const std::string &text)
    {
        size_t count = 0;
        size_t run = MAX_CONTINUATION_BYTES;
        for (unsigned char byte : text)
        {
            if (startsUnit(byte, run))
            {
                ++count;
            }
        }
        return count;
    }

    // Byte length of the first codePoints code points of text
    size_t prefixBytes(const std::string &text, size_t codePoints)
    {
        size_t seen = 0;
        size_t run = MAX_CONTINUATION_BYTES;
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (startsUnit(static_cast<unsigned char>(text[i]), run))
            {
                if (seen == codePoints)
                {
                    return i;
                }
                ++seen;
            }
        }
        return text.size();
    }
}

size_t EventQueue::eventSize(const std::string &message)
{
    return message.size() + EVENT_OVERHEAD;
}

std::string EventQueue::truncate(const std::string &message)
{
    if (message.size() <= MAX_EVENT_BYTES)
    {
        return message;
    }

    const size_t suffixSize = std::strlen(TRUNCATION_SUFFIX);

    // Binary search for the longest prefix (in code points) that still fits with the suffix
    size_t low = 0;
    size_t high = countCodePoints(message);
    while (low < high)
    {
        size_t mid = (low + high + 1) / 2;
        if (prefixBytes(message, mid) + suffixSize <= MAX_EVENT_BYTES)
        {
            low = mid;
        }
        else
        {
            high = mid - 1;
        }
    }

    std::string truncated = message.substr(0, prefixBytes(message, low));
    truncated += TRUNCATION_SUFFIX;
    return truncated;
}

void EventQueue::add(std::string message)
{
    if (message.size() > MAX_EVENT_BYTES)
    {
        message = truncate(message);
    }
    LogEvent event(std::move(message), LogEvent::nowMillis());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(std::move(event));
}

EventQueue::Batch EventQueue::getNextBatch()
{
    Batch batch;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_events.empty())
    {
        return batch;
    }

    size_t batchBytes = 0;
    size_t count = 0;
    for (const auto &event : m_events)
    {
        size_t bytes = eventSize(event.message);
        if (batchBytes + bytes > MAX_BATCH_BYTES || count >= MAX_EVENTS_PER_BATCH)
        {
            break;
        }
        batchBytes += bytes;
        ++count;
    }

    batch.events.reserve(count);
    for (size_t i = 0; i < count; ++i)
    {
        batch.events.push_back(std::move(m_events.front()));
        m_events.pop_front();
    }
    batch.hasMore = !m_events.empty();

    return batch;
}

std::vector<LogEvent> EventQueue::get() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<LogEvent>(m_events.begin(), m_events.end());
}

size_t EventQueue::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_events.size();
}

void EventQueue::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}
