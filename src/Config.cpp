#include "Config.hpp"
#include "FlushCoordinator.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &text)
    {
        auto notSpace = [](unsigned char c)
        { return std::isspace(c) == 0; };
        auto begin = std::find_if(text.begin(), text.end(), notSpace);
        auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
        return begin < end ? std::string(begin, end) : std::string();
    }

    size_t parseSize(const std::string &key, const std::string &value)
    {
        size_t pos = 0;
        unsigned long long parsed = 0;
        try
        {
            if (!value.empty() && value[0] == '-')
            {
                throw std::invalid_argument("negative");
            }
            parsed = std::stoull(value, &pos);
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Invalid number for " + key + ": " + value);
        }
        if (pos != value.size())
        {
            throw std::runtime_error("Invalid number for " + key + ": " + value);
        }
        return static_cast<size_t>(parsed);
    }

    // Range-checked before narrowing so oversized values cannot wrap
    size_t parseBounded(const std::string &key, const std::string &value, size_t maxValue)
    {
        size_t parsed = parseSize(key, value);
        if (parsed > maxValue)
        {
            throw std::runtime_error("Value out of range for " + key + ": " + value);
        }
        return parsed;
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes")
        {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no")
        {
            return false;
        }
        throw std::runtime_error("Invalid boolean for " + key + ": " + value);
    }

    void applySetting(ShipperConfig &config, const std::string &key, const std::string &value)
    {
        if (key == "log_group_name")
            config.logGroupName = value;
        else if (key == "stream_name_prefix")
            config.streamNamePrefix = value;
        else if (key == "flush_interval_ms")
            config.flushInterval = std::chrono::milliseconds(
                parseBounded(key, value, static_cast<size_t>(FlushCoordinator::MAX_FLUSH_INTERVAL.count())));
        else if (key == "batch_size")
            config.batchSize = parseSize(key, value);
        else if (key == "sink_base_path")
            config.sinkBasePath = value;
        else if (key == "use_encryption")
            config.useEncryption = parseBool(key, value);
        else if (key == "encryption_key_file")
            config.encryptionKeyPath = value;
        else if (key == "compression_level")
            config.compressionLevel = static_cast<int>(parseBounded(key, value, 9));
        else if (key == "max_segment_size")
            config.maxSegmentSize = parseSize(key, value);
        else if (key == "max_attempts")
            config.maxAttempts = parseSize(key, value);
        else if (key == "base_retry_delay_ms")
            config.baseRetryDelay = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "max_open_files")
            config.maxOpenFiles = parseSize(key, value);
        else
            throw std::runtime_error("Unknown config key: " + key);
    }
}

ShipperConfig loadConfig(const std::string &configFilePath)
{
    std::ifstream file(configFilePath);
    if (!file)
    {
        throw std::runtime_error("Failed to load config file: " + configFilePath);
    }

    ShipperConfig config;
    std::string line;
    size_t lineNumber = 0;
    while (std::getline(file, line))
    {
        ++lineNumber;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#')
        {
            continue;
        }

        size_t separator = content.find('=');
        if (separator == std::string::npos)
        {
            throw std::runtime_error(configFilePath + ":" + std::to_string(lineNumber) +
                                     ": expected key=value");
        }
        applySetting(config, trim(content.substr(0, separator)), trim(content.substr(separator + 1)));
    }

    try
    {
        validateConfig(config);
    }
    catch (const std::invalid_argument &e)
    {
        throw std::runtime_error(configFilePath + ": " + e.what());
    }
    return config;
}

void validateConfig(const ShipperConfig &config)
{
    if (trim(config.logGroupName).empty())
    {
        throw std::invalid_argument("log_group_name is required");
    }
    if (config.flushInterval <= std::chrono::milliseconds::zero())
    {
        throw std::invalid_argument("flush_interval_ms must be positive");
    }
    if (config.flushInterval > FlushCoordinator::MAX_FLUSH_INTERVAL)
    {
        throw std::invalid_argument("flush_interval_ms must be at most " +
                                    std::to_string(FlushCoordinator::MAX_FLUSH_INTERVAL.count()));
    }
    if (config.compressionLevel < 0 || config.compressionLevel > 9)
    {
        throw std::invalid_argument("compression_level must be between 0 and 9");
    }
    if (config.useEncryption && config.encryptionKeyPath.empty())
    {
        throw std::invalid_argument("encryption_key_file is required when use_encryption is set");
    }
    if (config.maxSegmentSize == 0)
    {
        throw std::invalid_argument("max_segment_size must be positive");
    }
    if (config.maxAttempts == 0)
    {
        throw std::invalid_argument("max_attempts must be positive");
    }
    if (config.maxOpenFiles == 0)
    {
        throw std::invalid_argument("max_open_files must be positive");
    }
}
