#include "FlushCoordinator.hpp"
#include <iostream>
#include <stdexcept>

FlushCoordinator::FlushCoordinator(std::shared_ptr<EventQueue> queue,
                                   std::shared_ptr<DestinationNameProvider> destinations,
                                   std::shared_ptr<RemoteSink> sink,
                                   std::chrono::milliseconds flushInterval,
                                   ErrorReporter errorReporter)
    : m_queue(std::move(queue)),
      m_destinations(std::move(destinations)),
      m_sink(std::move(sink)),
      m_flushInterval(flushInterval),
      m_errorReporter(std::move(errorReporter))
{
    if (!m_queue || !m_destinations || !m_sink)
    {
        throw std::invalid_argument("FlushCoordinator requires a queue, a destination provider and a sink");
    }
    if (m_flushInterval <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument("Flush interval must be positive");
    }
    if (m_flushInterval > MAX_FLUSH_INTERVAL)
    {
        throw std::invalid_argument("Flush interval must be at most one day");
    }
}

FlushCoordinator::~FlushCoordinator()
{
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        std::cerr << "FlushCoordinator: Error during shutdown: " << e.what() << std::endl;
    }
}

bool FlushCoordinator::start()
{
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (m_closed.load(std::memory_order_acquire))
    {
        reportError("Cannot start after close");
        return false;
    }

    // Replace any running timer
    stopTimer();

    {
        std::lock_guard<std::mutex> timerLock(m_timerMutex);
        m_stopRequested = false;
    }
    m_running.store(true, std::memory_order_release);
    m_timerThread.reset(new std::thread(&FlushCoordinator::runTimer, this));
    return true;
}

void FlushCoordinator::stopTimer()
{
    {
        std::lock_guard<std::mutex> timerLock(m_timerMutex);
        m_stopRequested = true;
    }
    m_timerCV.notify_all();

    if (m_timerThread && m_timerThread->joinable())
    {
        m_timerThread->join();
    }
    m_timerThread.reset();
    m_running.store(false, std::memory_order_release);
}

void FlushCoordinator::runTimer()
{
    std::unique_lock<std::mutex> lock(m_timerMutex);
    while (!m_stopRequested)
    {
        if (m_timerCV.wait_for(lock, m_flushInterval, [this]
                               { return m_stopRequested; }))
        {
            break;
        }

        lock.unlock();
        flush();
        lock.lock();
    }
}

size_t FlushCoordinator::flush()
{
    std::lock_guard<std::mutex> lock(m_flushMutex);

    if (m_closed.load(std::memory_order_acquire))
    {
        return 0;
    }

    m_flushCycles.fetch_add(1, std::memory_order_relaxed);

    size_t shipped = 0;
    size_t inFlight = 0;
    try
    {
        bool hasMore = true;
        while (hasMore)
        {
            EventQueue::Batch batch = m_queue->getNextBatch();
            if (batch.events.empty())
            {
                break;
            }
            inFlight = batch.events.size();

            std::string destination = m_destinations->currentDestinationName();
            m_sink->submitBatch(m_destinations->groupId(), destination, batch.events);

            shipped += inFlight;
            inFlight = 0;
            hasMore = batch.hasMore;
        }
    }
    catch (const std::exception &e)
    {
        // The batch already left the queue, so its events are lost
        m_droppedEvents.fetch_add(inFlight, std::memory_order_relaxed);
        reportError(std::string("Failed to flush logs: ") + e.what());
    }

    return shipped;
}

void FlushCoordinator::close()
{
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);

    if (m_closed.load(std::memory_order_acquire))
    {
        return;
    }

    stopTimer();
    flush();

    {
        std::lock_guard<std::mutex> flushLock(m_flushMutex);
        m_closed.store(true, std::memory_order_release);
    }

    try
    {
        m_sink->close();
    }
    catch (const std::exception &e)
    {
        reportError(std::string("Failed to close sink: ") + e.what());
    }
}

bool FlushCoordinator::isRunning() const
{
    return m_running.load(std::memory_order_acquire);
}

bool FlushCoordinator::isClosed() const
{
    return m_closed.load(std::memory_order_acquire);
}

size_t FlushCoordinator::flushCycles() const
{
    return m_flushCycles.load(std::memory_order_relaxed);
}

size_t FlushCoordinator::droppedEvents() const
{
    return m_droppedEvents.load(std::memory_order_relaxed);
}

void FlushCoordinator::reportError(const std::string &message)
{
    if (m_errorReporter)
    {
        try
        {
            m_errorReporter(message);
            return;
        }
        catch (const std::exception &e)
        {
            std::cerr << "FlushCoordinator: Error reporter failed: " << e.what() << std::endl;
        }
    }
    std::cerr << "FlushCoordinator: " << message << std::endl;
}
