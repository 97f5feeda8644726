#include "Compression.hpp"
#include <stdexcept>
#include <cstring>
#include <string>

std::vector<uint8_t> Compression::compress(const std::vector<uint8_t> &data, int level)
{
    if (data.empty())
    {
        return std::vector<uint8_t>();
    }

    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressedData(compressedSize);

    int ret = compress2(compressedData.data(), &compressedSize,
                        data.data(), static_cast<uLong>(data.size()), level);
    if (ret != Z_OK)
    {
        throw std::runtime_error("zlib compression failed with code " + std::to_string(ret));
    }

    compressedData.resize(compressedSize);
    return compressedData;
}

std::vector<uint8_t> Compression::decompress(const std::vector<uint8_t> &compressedData)
{
    if (compressedData.empty())
    {
        return std::vector<uint8_t>();
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit(&zs) != Z_OK)
    {
        throw std::runtime_error("Failed to initialize zlib inflate");
    }

    zs.next_in = const_cast<Bytef *>(compressedData.data());
    zs.avail_in = static_cast<uInt>(compressedData.size());

    std::vector<uint8_t> decompressedData;
    uint8_t chunk[32768];
    int ret = Z_OK;

    while (ret == Z_OK)
    {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
        {
            inflateEnd(&zs);
            throw std::runtime_error("zlib decompression failed with code " + std::to_string(ret));
        }

        size_t produced = sizeof(chunk) - zs.avail_out;
        if (decompressedData.size() + produced > MAX_DECOMPRESSED_SIZE)
        {
            inflateEnd(&zs);
            throw std::runtime_error("Decompressed data exceeds size limit");
        }
        decompressedData.insert(decompressedData.end(), chunk, chunk + produced);

        // Input exhausted without reaching the end of the stream
        if (ret == Z_OK && zs.avail_in == 0 && produced == 0)
        {
            inflateEnd(&zs);
            throw std::runtime_error("Truncated zlib stream");
        }
    }

    inflateEnd(&zs);
    return decompressedData;
}
