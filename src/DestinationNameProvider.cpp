#include "DestinationNameProvider.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

DestinationNameProvider::DestinationNameProvider(std::shared_ptr<RemoteSink> sink,
                                                 std::string groupId,
                                                 std::string prefix,
                                                 Clock clock)
    : m_sink(std::move(sink)),
      m_groupId(std::move(groupId)),
      m_prefix(std::move(prefix)),
      m_clock(std::move(clock))
{
    bool blank = std::all_of(m_groupId.begin(), m_groupId.end(),
                             [](unsigned char c)
                             { return std::isspace(c) != 0; });
    if (blank)
    {
        throw std::invalid_argument("Log group name cannot be empty");
    }
    if (!m_sink)
    {
        throw std::invalid_argument("DestinationNameProvider requires a sink");
    }
    if (!m_clock)
    {
        m_clock = []()
        { return std::chrono::system_clock::now(); };
    }
}

std::string DestinationNameProvider::destinationNameFor(std::chrono::system_clock::time_point when) const
{
    std::time_t timeT = std::chrono::system_clock::to_time_t(when);
    std::tm timeInfo;
    gmtime_r(&timeT, &timeInfo);

    std::ostringstream ss;
    if (!m_prefix.empty())
    {
        ss << m_prefix << "-";
    }
    ss << std::put_time(&timeInfo, "%Y-%m-%d-%H") << "-UTC";
    return ss.str();
}

std::string DestinationNameProvider::currentDestinationName()
{
    std::string name = destinationNameFor(m_clock());
    ensureDestinationExists(name);
    return name;
}

bool DestinationNameProvider::isCached(const std::string &name) const
{
    return m_checkedDestinations.count(name) > 0;
}

void DestinationNameProvider::ensureDestinationExists(const std::string &name)
{
    if (isCached(name))
    {
        return;
    }

    // The lookup is prefix based, so only an exact match counts
    std::vector<std::string> existing = m_sink->describeExisting(m_groupId, name);
    bool exists = std::find(existing.begin(), existing.end(), name) != existing.end();
    if (!exists)
    {
        m_sink->createDestination(m_groupId, name);
    }

    m_checkedDestinations.insert(name);
}
