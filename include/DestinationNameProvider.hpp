#ifndef DESTINATION_NAME_PROVIDER_HPP
#define DESTINATION_NAME_PROVIDER_HPP

#include "RemoteSink.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>

/**
 * @brief Names the destination for the current UTC hour and makes sure it exists
 *
 * Names look like "{prefix}-YYYY-MM-DD-HH-UTC" (no dash when the prefix is
 * empty). A name confirmed to exist is remembered for the lifetime of the
 * object, so each hour costs at most one lookup and one creation.
 *
 * Not thread-safe: FlushCoordinator calls it from inside its flush lock.
 */
class DestinationNameProvider
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /**
     * @throws std::invalid_argument if groupId is empty or whitespace only
     */
    DestinationNameProvider(std::shared_ptr<RemoteSink> sink,
                            std::string groupId,
                            std::string prefix = "",
                            Clock clock = Clock());

    /**
     * @brief Returns the current destination name, creating it remotely if needed
     *
     * @throws SinkError from the lookup or creation; the name is not cached then
     */
    std::string currentDestinationName();

    std::string destinationNameFor(std::chrono::system_clock::time_point when) const;

    bool isCached(const std::string &name) const;
    const std::string &groupId() const { return m_groupId; }

private:
    void ensureDestinationExists(const std::string &name);

    std::shared_ptr<RemoteSink> m_sink;
    std::string m_groupId;
    std::string m_prefix;
    Clock m_clock;
    std::unordered_set<std::string> m_checkedDestinations;
};

#endif
