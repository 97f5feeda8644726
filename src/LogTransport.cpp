#include "LogTransport.hpp"
#include <iostream>

std::string extractMessage(const LogRecord &record)
{
    if (record.formattedMessage)
    {
        return *record.formattedMessage;
    }
    return record.message.value_or("");
}

std::unique_ptr<LogTransport> LogTransport::create(const ShipperConfig &config,
                                                   std::shared_ptr<RemoteSink> sink,
                                                   FlushCoordinator::ErrorReporter errorReporter,
                                                   DestinationNameProvider::Clock clock)
{
    validateConfig(config);

    std::unique_ptr<LogTransport> transport(
        new LogTransport(config, std::move(sink), std::move(errorReporter), std::move(clock)));
    transport->m_coordinator->start();
    transport->m_acceptingEntries.store(true, std::memory_order_release);
    return transport;
}

LogTransport::LogTransport(const ShipperConfig &config,
                           std::shared_ptr<RemoteSink> sink,
                           FlushCoordinator::ErrorReporter errorReporter,
                           DestinationNameProvider::Clock clock)
    : m_queue(std::make_shared<EventQueue>()),
      m_errorReporter(errorReporter)
{
    m_destinations = std::make_shared<DestinationNameProvider>(
        sink, config.logGroupName, config.streamNamePrefix, std::move(clock));
    m_coordinator.reset(new FlushCoordinator(
        m_queue, m_destinations, std::move(sink), config.flushInterval, std::move(errorReporter)));
}

LogTransport::~LogTransport()
{
    try
    {
        close();
    }
    catch (const std::exception &e)
    {
        std::cerr << "LogTransport: Error during shutdown: " << e.what() << std::endl;
    }
}

void LogTransport::log(const LogRecord &record, const Ack &ack)
{
    if (!m_acceptingEntries.load(std::memory_order_acquire))
    {
        reportError("Not accepting entries");
    }
    else
    {
        try
        {
            m_queue->add(extractMessage(record));
        }
        catch (const std::exception &e)
        {
            reportError(std::string("Failed to queue log: ") + e.what());
        }
    }

    if (ack)
    {
        ack();
    }
}

void LogTransport::close()
{
    m_acceptingEntries.store(false, std::memory_order_release);
    m_coordinator->close();
}

void LogTransport::reportError(const std::string &message)
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
            std::cerr << "LogTransport: Error reporter failed: " << e.what() << std::endl;
        }
    }
    std::cerr << "LogTransport: " << message << std::endl;
}
