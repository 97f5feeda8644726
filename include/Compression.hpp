#ifndef COMPRESSION_HPP
#define COMPRESSION_HPP

#include <vector>
#include <cstdint>
#include <zlib.h>

class Compression
{
public:
    // Upper bound accepted by decompress(), guards against inflating garbage
    static constexpr size_t MAX_DECOMPRESSED_SIZE = 64 * 1024 * 1024;

    static std::vector<uint8_t> compress(const std::vector<uint8_t> &data, int level = Z_DEFAULT_COMPRESSION);

    static std::vector<uint8_t> decompress(const std::vector<uint8_t> &compressedData);
};

#endif
