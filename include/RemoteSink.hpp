#ifndef REMOTE_SINK_HPP
#define REMOTE_SINK_HPP

#include "LogEvent.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Transport-level failure of a sink operation
class SinkError : public std::runtime_error
{
public:
    explicit SinkError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Log-ingestion service that receives batches in named destinations
 *
 * Destinations live inside a log group. Every operation may throw SinkError.
 * Implementations are called from one flush cycle at a time.
 */
class RemoteSink
{
public:
    virtual ~RemoteSink() = default;

    // Names of existing destinations in groupId starting with namePrefix
    virtual std::vector<std::string> describeExisting(const std::string &groupId,
                                                      const std::string &namePrefix) = 0;

    virtual void createDestination(const std::string &groupId, const std::string &name) = 0;

    virtual void submitBatch(const std::string &groupId,
                             const std::string &destinationName,
                             const std::vector<LogEvent> &events) = 0;

    // Releases connections/descriptors; no operation is valid afterwards
    virtual void close() = 0;
};

#endif
