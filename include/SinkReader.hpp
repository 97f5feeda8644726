#pragma once
#include "LogEvent.hpp"
#include "Crypto.hpp"
#include "Config.hpp"
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Decodes what FileSink wrote; must be built with the sink's encryption/compression settings
class SinkReader {
public:
    SinkReader(const std::string& basePath,
               bool useEncryption,
               int compressionLevel,
               std::vector<uint8_t> encryptionKey = {});

    static std::unique_ptr<SinkReader> fromConfig(const ShipperConfig& config);

    std::vector<std::string> listDestinations(const std::string& groupId) const;

    // Events of all segments of a destination, in write order; bad frames are skipped
    std::vector<LogEvent> readDestination(const std::string& groupId,
                                          const std::string& destinationName) const;

    // One "<timestamp-ms> <message>" line per event; returns the number written
    size_t exportDestination(const std::string& groupId,
                             const std::string& destinationName,
                             std::ostream& out) const;

private:
    std::string m_basePath;
    bool m_useEncryption;
    int m_compressionLevel;
    std::vector<uint8_t> m_encryptionKey;
    mutable Crypto m_crypto;

    std::vector<LogEvent> readSegmentFile(const std::string& segmentFile) const;
    std::vector<uint8_t> decodePayload(std::vector<uint8_t>&& payload) const;
};
