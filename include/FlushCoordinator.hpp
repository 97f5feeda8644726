#ifndef FLUSH_COORDINATOR_HPP
#define FLUSH_COORDINATOR_HPP

#include "EventQueue.hpp"
#include "DestinationNameProvider.hpp"
#include "RemoteSink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief Drains an EventQueue into a RemoteSink on a timer and on close
 *
 * Flush cycles are serialized by a single flush mutex: the timer thread,
 * manual flush() calls and the final flush of close() never overlap.
 * A failed cycle drops the batch it was submitting, reports the error and
 * leaves the rest of the queue to the next tick.
 */
class FlushCoordinator
{
public:
    using ErrorReporter = std::function<void(const std::string &)>;

    static constexpr std::chrono::milliseconds DEFAULT_FLUSH_INTERVAL{3000};
    // One day; longer waits overflow the timer's deadline arithmetic
    static constexpr std::chrono::milliseconds MAX_FLUSH_INTERVAL{24 * 60 * 60 * 1000};

    FlushCoordinator(std::shared_ptr<EventQueue> queue,
                     std::shared_ptr<DestinationNameProvider> destinations,
                     std::shared_ptr<RemoteSink> sink,
                     std::chrono::milliseconds flushInterval = DEFAULT_FLUSH_INTERVAL,
                     ErrorReporter errorReporter = ErrorReporter());

    ~FlushCoordinator();

    FlushCoordinator(const FlushCoordinator &) = delete;
    FlushCoordinator &operator=(const FlushCoordinator &) = delete;

    // (Re)starts the periodic timer; returns false once closed
    bool start();

    /**
     * @brief Runs one flush cycle under the flush lock
     *
     * @return Number of events the sink accepted during this cycle
     */
    size_t flush();

    // Stops the timer, flushes what is queued and closes the sink
    void close();

    bool isRunning() const;
    bool isClosed() const;
    std::chrono::milliseconds flushInterval() const { return m_flushInterval; }

    size_t flushCycles() const;
    size_t droppedEvents() const;

private:
    void runTimer();
    void stopTimer();
    void reportError(const std::string &message);

    std::shared_ptr<EventQueue> m_queue;
    std::shared_ptr<DestinationNameProvider> m_destinations;
    std::shared_ptr<RemoteSink> m_sink;
    const std::chrono::milliseconds m_flushInterval;
    ErrorReporter m_errorReporter;

    std::unique_ptr<std::thread> m_timerThread;
    std::mutex m_timerMutex; // guards m_stopRequested
    std::condition_variable m_timerCV;
    bool m_stopRequested{false};
    std::atomic<bool> m_running{false};

    std::mutex m_flushMutex;     // one flush cycle at a time
    std::mutex m_lifecycleMutex; // serializes start() and close()
    std::atomic<bool> m_closed{false};

    std::atomic<size_t> m_flushCycles{0};
    std::atomic<size_t> m_droppedEvents{0};
};

#endif
