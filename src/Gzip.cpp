#include "Gzip.h"

#include <array>
#include <stdexcept>
#include <string>

#include <zlib.h>

#include "VolumeErrors.h"

namespace
{

constexpr std::size_t kChunkSize = 1 << 16;

// 15 window bits + 16 selects the gzip wrapper instead of raw zlib.
constexpr int kGzipWindowBits = 15 + 16;

// RAII wrapper for an inflate stream; ends it on scope exit.
class InflateStream
{
public:
    InflateStream()
    {
        if (inflateInit2(&zs_, kGzipWindowBits) != Z_OK)
            throw DecompressionError("Failed to initialise gzip decoder");
    }

    ~InflateStream() { inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &zs_; }

private:
    z_stream zs_{};
};

} // namespace

bool isGzip(const std::vector<uint8_t>& bytes)
{
    return bytes.size() >= 2 && bytes[0] == 0x1F && bytes[1] == 0x8B;
}

std::vector<uint8_t> gunzip(const std::vector<uint8_t>& compressed)
{
    if (!isGzip(compressed))
        throw DecompressionError("Input is not a gzip stream");

    InflateStream stream;
    z_stream* zs = stream.get();
    zs->next_in = const_cast<Bytef*>(compressed.data());
    zs->avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> out;
    out.reserve(compressed.size() * 4);
    std::array<uint8_t, kChunkSize> chunk{};

    while (true)
    {
        zs->next_out = chunk.data();
        zs->avail_out = static_cast<uInt>(chunk.size());

        int ret = inflate(zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END)
        {
            std::string why = zs->msg ? zs->msg : "zlib error " + std::to_string(ret);
            throw DecompressionError("Failed to decompress gzip data: " + why);
        }

        out.insert(out.end(), chunk.data(), chunk.data() + (chunk.size() - zs->avail_out));

        if (ret == Z_STREAM_END)
        {
            // Concatenated members: restart on whatever input is left.
            if (zs->avail_in == 0)
                break;
            if (zs->avail_in >= 2 && zs->next_in[0] == 0x1F && zs->next_in[1] == 0x8B)
            {
                if (inflateReset(zs) != Z_OK)
                    throw DecompressionError("Failed to reset gzip decoder");
                continue;
            }
            // Trailing padding after the last member is ignored.
            break;
        }

        if (zs->avail_in == 0 && zs->avail_out != 0)
            throw DecompressionError("Truncated gzip stream");
    }

    return out;
}

std::vector<uint8_t> decompressIfNeeded(std::vector<uint8_t> bytes)
{
    if (isGzip(bytes))
        return gunzip(bytes);
    return bytes;
}

std::vector<uint8_t> gzipCompress(const std::vector<uint8_t>& raw)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("Failed to initialise gzip encoder");

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(raw.size())) + 32);
    zs.next_in = const_cast<Bytef*>(raw.data());
    zs.avail_in = static_cast<uInt>(raw.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&zs, Z_FINISH);
    std::size_t written = out.size() - zs.avail_out;
    deflateEnd(&zs);

    if (ret != Z_STREAM_END)
        throw std::runtime_error("Failed to gzip-compress buffer");

    out.resize(written);
    return out;
}
