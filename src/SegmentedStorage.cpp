#include "SegmentedStorage.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>

SegmentedStorage::SegmentedStorage(const std::string &basePath,
                                   size_t maxSegmentSize,
                                   size_t maxAttempts,
                                   std::chrono::milliseconds baseRetryDelay,
                                   size_t maxOpenFiles)
    : m_basePath(basePath),
      m_maxSegmentSize(maxSegmentSize),
      m_maxAttempts(maxAttempts),
      m_baseRetryDelay(baseRetryDelay),
      m_cache(maxOpenFiles, this)
{
    std::filesystem::create_directories(m_basePath);
}

SegmentedStorage::~SegmentedStorage()
{
    try
    {
        closeAll();
    }
    catch (const std::exception &e)
    {
        std::cerr << "SegmentedStorage: Error closing segments in " << m_basePath << ": " << e.what() << std::endl;
    }
}

// LRUCache methods
SegmentedStorage::OpenSegment &SegmentedStorage::LRUCache::get(const std::string &streamName)
{
    // Called with m_parent->m_mutex held
    auto it = m_cache.find(streamName);
    if (it != m_cache.end())
    {
        m_lruList.splice(m_lruList.begin(), m_lruList, it->second.lruIt);
        return it->second.segment;
    }

    OpenSegment segment = m_parent->openLatestSegment(streamName);

    if (m_cache.size() >= m_capacity)
    {
        evictLRU();
    }

    m_lruList.push_front(streamName);
    CacheData &data = m_cache[streamName];
    data.segment = segment;
    data.lruIt = m_lruList.begin();
    return data.segment;
}

void SegmentedStorage::LRUCache::evictLRU()
{
    if (m_lruList.empty())
        return;

    auto it = m_cache.find(m_lruList.back());
    if (it != m_cache.end())
    {
        int fd = it->second.segment.fd;
        m_cache.erase(it);
        if (fd >= 0)
        {
            m_parent->fsyncRetry(fd);
            ::close(fd);
        }
    }
    m_lruList.pop_back();
}

void SegmentedStorage::LRUCache::flushAll()
{
    for (const auto &pair : m_cache)
    {
        if (pair.second.segment.fd >= 0)
        {
            m_parent->fsyncRetry(pair.second.segment.fd);
        }
    }
}

void SegmentedStorage::LRUCache::closeAll()
{
    for (auto &pair : m_cache)
    {
        int fd = pair.second.segment.fd;
        pair.second.segment.fd = -1;
        if (fd >= 0)
        {
            m_parent->fsyncRetry(fd);
            ::close(fd);
        }
    }
    m_cache.clear();
    m_lruList.clear();
}

bool SegmentedStorage::parseSegmentName(const std::string &filename, std::string &streamName, size_t &segmentIndex)
{
    const std::string extension = ".log";
    if (filename.size() <= extension.size() ||
        filename.compare(filename.size() - extension.size(), extension.size(), extension) != 0)
    {
        return false;
    }

    std::string stem = filename.substr(0, filename.size() - extension.size());
    size_t lastUnderscore = stem.find_last_of('_');
    if (lastUnderscore == std::string::npos || lastUnderscore == 0 || lastUnderscore + 1 == stem.size())
    {
        return false;
    }

    std::string indexStr = stem.substr(lastUnderscore + 1);
    if (!std::all_of(indexStr.begin(), indexStr.end(), [](unsigned char c)
                     { return std::isdigit(c) != 0; }))
    {
        return false;
    }

    streamName = stem.substr(0, lastUnderscore);
    segmentIndex = static_cast<size_t>(std::stoull(indexStr));
    return true;
}

std::vector<std::string> SegmentedStorage::listStreams(const std::string &basePath)
{
    std::set<std::string> names;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(basePath, ec))
    {
        std::string streamName;
        size_t index = 0;
        if (entry.is_regular_file() && parseSegmentName(entry.path().filename().string(), streamName, index))
        {
            names.insert(streamName);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::vector<std::string> SegmentedStorage::getSegmentFiles(const std::string &basePath, const std::string &streamName)
{
    std::vector<std::pair<size_t, std::string>> segments;
    std::error_code ec;
    for (const auto &entry : std::filesystem::directory_iterator(basePath, ec))
    {
        std::string name;
        size_t index = 0;
        if (entry.is_regular_file() &&
            parseSegmentName(entry.path().filename().string(), name, index) &&
            name == streamName)
        {
            segments.emplace_back(index, entry.path().string());
        }
    }

    std::sort(segments.begin(), segments.end());

    std::vector<std::string> files;
    files.reserve(segments.size());
    for (auto &segment : segments)
    {
        files.push_back(std::move(segment.second));
    }
    return files;
}

bool SegmentedStorage::exists(const std::string &streamName) const
{
    return !getSegmentFiles(m_basePath, streamName).empty();
}

void SegmentedStorage::create(const std::string &streamName)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (exists(streamName))
    {
        throw std::runtime_error("Stream already exists: " + streamName);
    }
    m_cache.get(streamName);
}

SegmentedStorage::OpenSegment SegmentedStorage::openLatestSegment(const std::string &streamName)
{
    OpenSegment segment;

    std::vector<std::string> files = getSegmentFiles(m_basePath, streamName);
    if (!files.empty())
    {
        std::string name;
        parseSegmentName(std::filesystem::path(files.back()).filename().string(), name, segment.segmentIndex);
    }

    std::string path = generateSegmentPath(streamName, segment.segmentIndex);
    segment.fd = openWithRetry(path, O_CREAT | O_WRONLY | O_APPEND);

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    segment.currentOffset = ec ? 0 : static_cast<size_t>(size);

    return segment;
}

size_t SegmentedStorage::writeToStream(const std::string &streamName, const std::vector<uint8_t> &data)
{
    size_t size = data.size();
    if (size == 0)
        return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    OpenSegment &segment = m_cache.get(streamName);

    if (segment.currentOffset > 0 && segment.currentOffset + size > m_maxSegmentSize)
    {
        rotateSegment(streamName, segment);
    }

    try
    {
        writeFull(segment.fd, data.data(), size);
    }
    catch (const std::runtime_error &)
    {
        // Cut a partial frame off again; if that fails too, leave the segment behind
        if (::ftruncate(segment.fd, static_cast<off_t>(segment.currentOffset)) != 0)
        {
            segment.currentOffset = m_maxSegmentSize;
        }
        throw;
    }
    segment.currentOffset += size;
    return size;
}

void SegmentedStorage::flush()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.flushAll();
}

void SegmentedStorage::closeAll()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.closeAll();
}

void SegmentedStorage::rotateSegment(const std::string &streamName, OpenSegment &segment)
{
    // The current segment stays in place until its successor is open
    size_t nextIndex = segment.segmentIndex + 1;
    int fd = openWithRetry(generateSegmentPath(streamName, nextIndex), O_CREAT | O_WRONLY | O_APPEND);

    if (segment.fd >= 0)
    {
        try
        {
            fsyncRetry(segment.fd);
        }
        catch (const std::runtime_error &)
        {
            ::close(fd);
            throw;
        }
        ::close(segment.fd);
    }

    segment.fd = fd;
    segment.segmentIndex = nextIndex;
    segment.currentOffset = 0;
}

std::string SegmentedStorage::generateSegmentPath(const std::string &streamName, size_t segmentIndex) const
{
    std::stringstream ss;
    ss << m_basePath << "/";
    ss << streamName << "_";
    ss << std::setw(6) << std::setfill('0') << segmentIndex << ".log";
    return ss.str();
}
