#ifndef LOG_EVENT_HPP
#define LOG_EVENT_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

struct LogEvent
{
    std::string message;
    int64_t timestamp = 0; // milliseconds since epoch

    LogEvent() = default;
    LogEvent(std::string msg, int64_t ts)
        : message(std::move(msg)), timestamp(ts) {}

    bool operator==(const LogEvent &other) const
    {
        return timestamp == other.timestamp && message == other.message;
    }
    bool operator!=(const LogEvent &other) const { return !(*this == other); }

    /*
     * Batch format:
     * [4 bytes]    Number of events (N)
     * N times:
     *   [4 bytes]  Size of the serialized event (S)
     *   [8 bytes]  Timestamp in milliseconds
     *   [4 bytes]  Message length (L)
     *   [L bytes]  Message bytes
     */
    static std::vector<uint8_t> serializeBatch(const std::vector<LogEvent> &events);
    static std::vector<LogEvent> deserializeBatch(const std::vector<uint8_t> &batchData);

    static int64_t nowMillis();
};

#endif
