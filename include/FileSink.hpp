#ifndef FILE_SINK_HPP
#define FILE_SINK_HPP

#include "RemoteSink.hpp"
#include "SegmentedStorage.hpp"
#include "Crypto.hpp"
#include "Config.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief RemoteSink that stores every log group as a directory of segmented streams
 *
 * Layout: {basePath}/{groupId}/{destination}_NNNNNN.log. Each submitted batch
 * becomes one frame: [4 bytes length][payload], where the payload is the
 * serialized batch, zlib-compressed when compressionLevel > 0 and
 * AES-256-GCM sealed when encryption is on. The sink enforces the same
 * per-call limits as a remote ingestion service.
 */
class FileSink : public RemoteSink
{
public:
    FileSink(const std::string &basePath,
             bool useEncryption = false,
             int compressionLevel = 0,
             std::vector<uint8_t> encryptionKey = {},
             size_t maxSegmentSize = 100 * 1024 * 1024,
             size_t maxAttempts = 5,
             std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1),
             size_t maxOpenFiles = 64);

    ~FileSink() override;

    // Reads the key from config.encryptionKeyPath when encryption is on
    static std::shared_ptr<FileSink> fromConfig(const ShipperConfig &config);

    std::vector<std::string> describeExisting(const std::string &groupId,
                                              const std::string &namePrefix) override;
    void createDestination(const std::string &groupId, const std::string &name) override;
    void submitBatch(const std::string &groupId,
                     const std::string &destinationName,
                     const std::vector<LogEvent> &events) override;
    void close() override;

    size_t batchesWritten() const;

private:
    SegmentedStorage &storageFor(const std::string &groupId);
    std::string groupPath(const std::string &groupId) const;
    std::vector<uint8_t> encodeFrame(const std::vector<LogEvent> &events);
    void ensureOpen() const;

    std::string m_basePath;
    bool m_useEncryption;
    int m_compressionLevel;
    std::vector<uint8_t> m_encryptionKey;
    size_t m_maxSegmentSize;
    size_t m_maxAttempts;
    std::chrono::milliseconds m_baseRetryDelay;
    size_t m_maxOpenFiles;

    Crypto m_crypto;
    std::map<std::string, std::unique_ptr<SegmentedStorage>> m_groups;
    mutable std::mutex m_mutex;
    bool m_closed{false};
    size_t m_batchesWritten{0};
};

// Reads a raw 32-byte key file
std::vector<uint8_t> loadKeyFile(const std::string &path);

#endif
