#ifndef LOG_TRANSPORT_HPP
#define LOG_TRANSPORT_HPP

#include "Config.hpp"
#include "EventQueue.hpp"
#include "DestinationNameProvider.hpp"
#include "FlushCoordinator.hpp"
#include "RemoteSink.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

// Structured record handed over by the logging framework
struct LogRecord
{
    std::optional<std::string> formattedMessage; // final rendered line, set by the formatter
    std::optional<std::string> message;
    // Structured metadata from the framework; carried along but never shipped
    std::map<std::string, std::string> fields;

    LogRecord() = default;
    // A plain string record is already the rendered line
    LogRecord(std::string text) : formattedMessage(std::move(text)) {}
    LogRecord(const char *text) : formattedMessage(std::string(text)) {}
};

// Rendered line if present, else the message field, else empty text.
// fields are never consulted.
std::string extractMessage(const LogRecord &record);

/**
 * @brief Logging-framework facing entry point of the shipper
 *
 * Owns the event queue, the destination provider and the flush coordinator.
 * log() only queues in memory and always acknowledges the producer.
 */
class LogTransport
{
public:
    using Ack = std::function<void()>;

    /**
     * @brief Builds a transport and starts its flush timer
     *
     * Performs no sink calls.
     * @throws std::invalid_argument on an invalid configuration
     */
    static std::unique_ptr<LogTransport> create(const ShipperConfig &config,
                                                std::shared_ptr<RemoteSink> sink,
                                                FlushCoordinator::ErrorReporter errorReporter = FlushCoordinator::ErrorReporter(),
                                                DestinationNameProvider::Clock clock = DestinationNameProvider::Clock());

    ~LogTransport();

    LogTransport(const LogTransport &) = delete;
    LogTransport &operator=(const LogTransport &) = delete;

    void log(const LogRecord &record, const Ack &ack);

    // Final flush, then releases the sink
    void close();

    size_t pending() const { return m_queue->size(); }
    FlushCoordinator &coordinator() { return *m_coordinator; }

private:
    LogTransport(const ShipperConfig &config,
                 std::shared_ptr<RemoteSink> sink,
                 FlushCoordinator::ErrorReporter errorReporter,
                 DestinationNameProvider::Clock clock);

    void reportError(const std::string &message);

    std::shared_ptr<EventQueue> m_queue;
    std::shared_ptr<DestinationNameProvider> m_destinations;
    std::unique_ptr<FlushCoordinator> m_coordinator;
    FlushCoordinator::ErrorReporter m_errorReporter;
    std::atomic<bool> m_acceptingEntries{false};
};

#endif
