#include "SinkReader.hpp"
#include "SegmentedStorage.hpp"
#include "Compression.hpp"
#include "FileSink.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

// Read pipeline per frame:
// 1. Read the length-prefixed payload from the segment
// 2. Decrypt and decompress it as configured
// 3. Deserialize the batch of events

SinkReader::SinkReader(const std::string& basePath,
                       bool useEncryption,
                       int compressionLevel,
                       std::vector<uint8_t> encryptionKey)
    : m_basePath(basePath)
    , m_useEncryption(useEncryption)
    , m_compressionLevel(compressionLevel)
    , m_encryptionKey(std::move(encryptionKey))
{
    if (m_useEncryption && m_encryptionKey.size() != Crypto::KEY_SIZE) {
        throw std::invalid_argument("Encryption key must be " + std::to_string(Crypto::KEY_SIZE) + " bytes");
    }
}

std::unique_ptr<SinkReader> SinkReader::fromConfig(const ShipperConfig& config)
{
    std::vector<uint8_t> key;
    if (config.useEncryption) {
        key = loadKeyFile(config.encryptionKeyPath);
    }
    return std::make_unique<SinkReader>(config.sinkBasePath, config.useEncryption,
                                        config.compressionLevel, std::move(key));
}

std::vector<std::string> SinkReader::listDestinations(const std::string& groupId) const
{
    return SegmentedStorage::listStreams(m_basePath + "/" + groupId);
}

std::vector<LogEvent> SinkReader::readDestination(const std::string& groupId,
                                                  const std::string& destinationName) const
{
    std::vector<LogEvent> events;

    auto segmentFiles = SegmentedStorage::getSegmentFiles(m_basePath + "/" + groupId, destinationName);
    if (segmentFiles.empty()) {
        std::cerr << "SinkReader: No segments found for " << groupId << "/" << destinationName << std::endl;
        return events;
    }

    for (const auto& segmentFile : segmentFiles) {
        auto fileEvents = readSegmentFile(segmentFile);
        events.insert(events.end(),
                      std::make_move_iterator(fileEvents.begin()),
                      std::make_move_iterator(fileEvents.end()));
    }
    return events;
}

size_t SinkReader::exportDestination(const std::string& groupId,
                                     const std::string& destinationName,
                                     std::ostream& out) const
{
    auto events = readDestination(groupId, destinationName);
    for (const auto& event : events) {
        out << event.timestamp << " " << event.message << "\n";
    }
    out.flush();
    return events.size();
}

std::vector<uint8_t> SinkReader::decodePayload(std::vector<uint8_t>&& payload) const
{
    std::vector<uint8_t> data = std::move(payload);
    if (m_useEncryption) {
        data = m_crypto.decrypt(data, m_encryptionKey);
    }
    if (m_compressionLevel > 0) {
        data = Compression::decompress(data);
    }
    return data;
}

std::vector<LogEvent> SinkReader::readSegmentFile(const std::string& segmentFile) const
{
    std::vector<LogEvent> events;

    std::ifstream inputFile(segmentFile, std::ios::binary | std::ios::ate);
    if (!inputFile.is_open()) {
        std::cerr << "SinkReader: Failed to open segment file: " << segmentFile << std::endl;
        return events;
    }

    std::streamoff fileSize = inputFile.tellg();
    if (fileSize <= 0) {
        return events;
    }

    inputFile.seekg(0);
    std::vector<uint8_t> fileData(static_cast<size_t>(fileSize));
    inputFile.read(reinterpret_cast<char*>(fileData.data()), fileSize);
    if (!inputFile) {
        std::cerr << "SinkReader: Failed to read segment file: " << segmentFile << std::endl;
        return events;
    }

    size_t offset = 0;
    size_t frameCount = 0;
    while (offset < fileData.size()) {
        ++frameCount;

        if (offset + sizeof(uint32_t) > fileData.size()) {
            std::cerr << "SinkReader: Truncated frame header at offset " << offset
                      << " in " << segmentFile << std::endl;
            break;
        }

        uint32_t payloadSize;
        std::memcpy(&payloadSize, fileData.data() + offset, sizeof(payloadSize));
        offset += sizeof(payloadSize);

        if (offset + payloadSize > fileData.size()) {
            std::cerr << "SinkReader: Truncated frame " << frameCount << " in " << segmentFile
                      << " (need " << payloadSize << ", have " << (fileData.size() - offset) << ")" << std::endl;
            break;
        }

        std::vector<uint8_t> payload(fileData.begin() + offset, fileData.begin() + offset + payloadSize);
        offset += payloadSize;

        try {
            auto frameEvents = LogEvent::deserializeBatch(decodePayload(std::move(payload)));
            events.insert(events.end(),
                          std::make_move_iterator(frameEvents.begin()),
                          std::make_move_iterator(frameEvents.end()));
        } catch (const std::exception& e) {
            std::cerr << "SinkReader: Skipping frame " << frameCount << " in " << segmentFile
                      << ": " << e.what() << std::endl;
        }
    }

    return events;
}
