#ifndef SEGMENTED_STORAGE_HPP
#define SEGMENTED_STORAGE_HPP

#include <string>
#include <vector>
#include <mutex>
#include <filesystem>
#include <cstdint>
#include <unordered_map>
#include <fcntl.h>  // for open flags
#include <unistd.h> // for close, write, fsync
#include <cerrno>
#include <chrono>
#include <thread>
#include <stdexcept>
#include <list> // For LRU cache

/**
 * @brief Append-only storage of named streams split into size-bounded segments
 *
 * Stream "name" lives in files "{basePath}/name_NNNNNN.log". A write that
 * would push the current segment past maxSegmentSize goes to a new segment;
 * a write larger than maxSegmentSize gets a segment of its own.
 */
class SegmentedStorage
{
public:
    SegmentedStorage(const std::string &basePath,
                     size_t maxSegmentSize = 100 * 1024 * 1024, // 100 MB default
                     size_t maxAttempts = 5,
                     std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1),
                     size_t maxOpenFiles = 64);

    ~SegmentedStorage();

    SegmentedStorage(const SegmentedStorage &) = delete;
    SegmentedStorage &operator=(const SegmentedStorage &) = delete;

    // Creates the first, empty segment of a new stream
    void create(const std::string &streamName);
    bool exists(const std::string &streamName) const;

    size_t writeToStream(const std::string &streamName, const std::vector<uint8_t> &data);
    void flush();
    void closeAll();

    const std::string &getBasePath() const { return m_basePath; }

    // Directory scans, usable without opening a storage
    static std::vector<std::string> listStreams(const std::string &basePath);
    static std::vector<std::string> getSegmentFiles(const std::string &basePath, const std::string &streamName);

private:
    std::string m_basePath;
    size_t m_maxSegmentSize;
    size_t m_maxAttempts;
    std::chrono::milliseconds m_baseRetryDelay;

    struct OpenSegment
    {
        int fd{-1};
        size_t segmentIndex{0};
        size_t currentOffset{0};
    };

    // Keeps at most `capacity` descriptors open, evicting the least recently used
    class LRUCache
    {
    public:
        LRUCache(size_t capacity, SegmentedStorage *parent) : m_capacity(capacity), m_parent(parent) {}

        OpenSegment &get(const std::string &streamName);
        void flushAll();
        void closeAll();

    private:
        size_t m_capacity;
        SegmentedStorage *m_parent;

        std::list<std::string> m_lruList;
        struct CacheData
        {
            OpenSegment segment;
            std::list<std::string>::iterator lruIt;
        };
        std::unordered_map<std::string, CacheData> m_cache;

        void evictLRU();
    };

    mutable std::mutex m_mutex; // guards m_cache and every descriptor in it
    LRUCache m_cache;

    OpenSegment openLatestSegment(const std::string &streamName);
    void rotateSegment(const std::string &streamName, OpenSegment &segment);
    std::string generateSegmentPath(const std::string &streamName, size_t segmentIndex) const;
    static bool parseSegmentName(const std::string &filename, std::string &streamName, size_t &segmentIndex);

    // Retry helpers use member-configured parameters
    template <typename Func>
    auto retryWithBackoff(Func &&f)
    {
        for (size_t attempt = 1;; ++attempt)
        {
            try
            {
                return f();
            }
            catch (const std::runtime_error &)
            {
                if (attempt >= m_maxAttempts)
                    throw;
                auto delay = m_baseRetryDelay * (1 << (attempt - 1));
                std::this_thread::sleep_for(delay);
            }
        }
    }

    int openWithRetry(const std::string &path, int flags)
    {
        return retryWithBackoff([&]()
                                {
            int fd = ::open(path.c_str(), flags, 0644);
            if (fd < 0) throw std::runtime_error("open failed: " + path);
            return fd; });
    }

    void writeFull(int fd, const uint8_t *buf, size_t count)
    {
        size_t total = 0;
        while (total < count)
        {
            ssize_t written = ::write(fd, buf + total, count - total);
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                throw std::runtime_error("write failed");
            }
            total += static_cast<size_t>(written);
        }
    }

    void fsyncRetry(int fd)
    {
        retryWithBackoff([&]()
                         {
            if (::fsync(fd) < 0) throw std::runtime_error("fsync failed");
            return 0; });
    }
};

#endif
