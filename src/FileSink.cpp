#include "FileSink.hpp"
#include "Compression.hpp"
#include "EventQueue.hpp"
#include <cstring>
#include <fstream>
#include <iterator>

namespace
{
    // Names become path components, so keep them to a single one
    bool isValidName(const std::string &name)
    {
        return !name.empty() && name != "." && name != ".." &&
               name.find('/') == std::string::npos && name.find('\0') == std::string::npos;
    }
}

std::vector<uint8_t> loadKeyFile(const std::string &path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error("Failed to open key file: " + path);
    }
    std::vector<uint8_t> key((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (key.size() != Crypto::KEY_SIZE)
    {
        throw std::runtime_error("Key file " + path + " must contain exactly " +
                                 std::to_string(Crypto::KEY_SIZE) + " bytes");
    }
    return key;
}

FileSink::FileSink(const std::string &basePath,
                   bool useEncryption,
                   int compressionLevel,
                   std::vector<uint8_t> encryptionKey,
                   size_t maxSegmentSize,
                   size_t maxAttempts,
                   std::chrono::milliseconds baseRetryDelay,
                   size_t maxOpenFiles)
    : m_basePath(basePath),
      m_useEncryption(useEncryption),
      m_compressionLevel(compressionLevel),
      m_encryptionKey(std::move(encryptionKey)),
      m_maxSegmentSize(maxSegmentSize),
      m_maxAttempts(maxAttempts),
      m_baseRetryDelay(baseRetryDelay),
      m_maxOpenFiles(maxOpenFiles)
{
    if (m_useEncryption && m_encryptionKey.size() != Crypto::KEY_SIZE)
    {
        throw std::invalid_argument("Encryption key must be " + std::to_string(Crypto::KEY_SIZE) + " bytes");
    }
    if (m_compressionLevel < 0 || m_compressionLevel > 9)
    {
        throw std::invalid_argument("Compression level must be between 0 and 9");
    }
    std::filesystem::create_directories(m_basePath);
}

FileSink::~FileSink() = default;

std::shared_ptr<FileSink> FileSink::fromConfig(const ShipperConfig &config)
{
    std::vector<uint8_t> key;
    if (config.useEncryption)
    {
        key = loadKeyFile(config.encryptionKeyPath);
    }
    return std::make_shared<FileSink>(config.sinkBasePath,
                                      config.useEncryption,
                                      config.compressionLevel,
                                      std::move(key),
                                      config.maxSegmentSize,
                                      config.maxAttempts,
                                      config.baseRetryDelay,
                                      config.maxOpenFiles);
}

std::string FileSink::groupPath(const std::string &groupId) const
{
    return m_basePath + "/" + groupId;
}

void FileSink::ensureOpen() const
{
    if (m_closed)
    {
        throw SinkError("Sink is closed");
    }
}

SegmentedStorage &FileSink::storageFor(const std::string &groupId)
{
    // Called with m_mutex held
    if (!isValidName(groupId))
    {
        throw SinkError("Invalid log group name: " + groupId);
    }

    auto it = m_groups.find(groupId);
    if (it == m_groups.end())
    {
        try
        {
            it = m_groups.emplace(groupId, std::make_unique<SegmentedStorage>(
                                               groupPath(groupId), m_maxSegmentSize, m_maxAttempts,
                                               m_baseRetryDelay, m_maxOpenFiles))
                     .first;
        }
        catch (const std::exception &e)
        {
            throw SinkError("Failed to open log group " + groupId + ": " + e.what());
        }
    }
    return *it->second;
}

std::vector<std::string> FileSink::describeExisting(const std::string &groupId,
                                                    const std::string &namePrefix)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureOpen();

    SegmentedStorage &storage = storageFor(groupId);
    std::vector<std::string> matches;
    for (auto &name : SegmentedStorage::listStreams(storage.getBasePath()))
    {
        if (name.compare(0, namePrefix.size(), namePrefix) == 0)
        {
            matches.push_back(std::move(name));
        }
    }
    return matches;
}

void FileSink::createDestination(const std::string &groupId, const std::string &name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureOpen();

    if (!isValidName(name))
    {
        throw SinkError("Invalid destination name: " + name);
    }

    SegmentedStorage &storage = storageFor(groupId);
    if (storage.exists(name))
    {
        throw SinkError("Destination already exists: " + groupId + "/" + name);
    }

    try
    {
        storage.create(name);
    }
    catch (const std::runtime_error &e)
    {
        throw SinkError("Failed to create destination " + groupId + "/" + name + ": " + e.what());
    }
}

std::vector<uint8_t> FileSink::encodeFrame(const std::vector<LogEvent> &events)
{
    std::vector<uint8_t> payload = LogEvent::serializeBatch(events);

    if (m_compressionLevel > 0)
    {
        payload = Compression::compress(payload, m_compressionLevel);
    }
    if (m_useEncryption)
    {
        payload = m_crypto.encrypt(payload, m_encryptionKey);
    }

    uint32_t payloadSize = static_cast<uint32_t>(payload.size());
    std::vector<uint8_t> frame(sizeof(payloadSize) + payload.size());
    std::memcpy(frame.data(), &payloadSize, sizeof(payloadSize));
    std::memcpy(frame.data() + sizeof(payloadSize), payload.data(), payload.size());
    return frame;
}

void FileSink::submitBatch(const std::string &groupId,
                           const std::string &destinationName,
                           const std::vector<LogEvent> &events)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureOpen();

    if (events.empty())
    {
        throw SinkError("Batch must contain at least one event");
    }
    if (events.size() > EventQueue::MAX_EVENTS_PER_BATCH)
    {
        throw SinkError("Batch exceeds " + std::to_string(EventQueue::MAX_EVENTS_PER_BATCH) + " events");
    }

    size_t batchBytes = 0;
    for (const auto &event : events)
    {
        batchBytes += EventQueue::eventSize(event.message);
    }
    if (batchBytes > EventQueue::MAX_BATCH_BYTES)
    {
        throw SinkError("Batch of " + std::to_string(batchBytes) + " bytes exceeds " +
                        std::to_string(EventQueue::MAX_BATCH_BYTES) + " bytes");
    }

    SegmentedStorage &storage = storageFor(groupId);
    if (!isValidName(destinationName) || !storage.exists(destinationName))
    {
        throw SinkError("Destination does not exist: " + groupId + "/" + destinationName);
    }

    try
    {
        storage.writeToStream(destinationName, encodeFrame(events));
    }
    catch (const std::runtime_error &e)
    {
        throw SinkError("Failed to write batch to " + groupId + "/" + destinationName + ": " + e.what());
    }
    ++m_batchesWritten;
}

void FileSink::close()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed)
    {
        return;
    }
    m_closed = true;

    for (auto &group : m_groups)
    {
        group.second->closeAll();
    }
    m_groups.clear();
}

size_t FileSink::batchesWritten() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_batchesWritten;
}
