#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>
#include <chrono>

struct ShipperConfig
{
    // destination
    std::string logGroupName;     // required
    std::string streamNamePrefix; // optional, prepended to the hourly name
    // flushing
    std::chrono::milliseconds flushInterval = std::chrono::milliseconds(3000);
    size_t batchSize = 0; // accepted for compatibility, batching always uses the sink limits
    // file sink
    std::string sinkBasePath = "./shipped";
    bool useEncryption = false;
    std::string encryptionKeyPath; // raw 32-byte key, required with encryption
    int compressionLevel = 0; // 0 = no compression, 1-9 = compression levels
    size_t maxSegmentSize = 100 * 1024 * 1024; // 100 MB
    size_t maxAttempts = 5;
    std::chrono::milliseconds baseRetryDelay = std::chrono::milliseconds(1);
    size_t maxOpenFiles = 64;
};

// Reads key=value lines; throws std::runtime_error on I/O, syntax or validation errors
ShipperConfig loadConfig(const std::string &configFilePath);

// Throws std::invalid_argument describing the first invalid setting
void validateConfig(const ShipperConfig &config);

#endif
