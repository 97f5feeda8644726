#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include "LogEvent.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief In-memory FIFO of log events that slices itself into sink-legal batches
 *
 * Every stored event fits the per-event byte limit of the sink; oversized
 * messages are truncated on insertion and marked with TRUNCATION_SUFFIX.
 * Sizes are UTF-8 byte counts, not character counts.
 */
class EventQueue
{
public:
    static constexpr size_t MAX_BATCH_BYTES = 1048576; // 1 MiB
    static constexpr size_t EVENT_OVERHEAD = 26;       // per-event bytes charged by the sink
    static constexpr size_t MAX_EVENT_BYTES = MAX_BATCH_BYTES - EVENT_OVERHEAD;
    static constexpr size_t MAX_EVENTS_PER_BATCH = 10000;
    static constexpr const char *TRUNCATION_SUFFIX = "[TRUNCATED]";

    struct Batch
    {
        std::vector<LogEvent> events;
        bool hasMore = false;
    };

    EventQueue() = default;

    EventQueue(const EventQueue &) = delete;
    EventQueue &operator=(const EventQueue &) = delete;

    /**
     * @brief Queues a message stamped with the current time
     *
     * Never fails for size: messages above MAX_EVENT_BYTES are truncated.
     */
    void add(std::string message);

    /**
     * @brief Removes and returns the longest queue prefix within the batch limits
     *
     * Scanning stops at the first event that would push the byte sum over
     * MAX_BATCH_BYTES or the count over MAX_EVENTS_PER_BATCH. The returned
     * events are gone from the queue whatever happens to them afterwards.
     */
    Batch getNextBatch();

    std::vector<LogEvent> get() const;
    size_t size() const;
    void reset();

    // Bytes the sink charges for one event: encoded message plus overhead
    static size_t eventSize(const std::string &message);

    // Longest code-point prefix of message that fits MAX_EVENT_BYTES once suffixed
    static std::string truncate(const std::string &message);

private:
    std::deque<LogEvent> m_events;
    mutable std::mutex m_mutex;
};

#endif
