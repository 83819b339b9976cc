#include "Anvil/Region/Compression.h"

#include "Anvil/Region/RegionError.h"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <string>

namespace Anvil::Region {

namespace {

constexpr int kZlibWindowBits = 15;
constexpr int kGzipWindowBits = 16 + 15;
constexpr size_t kInflateChunk = 64 * 1024;

class InflateStream {
public:
    explicit InflateStream(int windowBits) {
        m_stream.zalloc = Z_NULL;
        m_stream.zfree = Z_NULL;
        m_stream.opaque = Z_NULL;
        m_stream.next_in = Z_NULL;
        m_stream.avail_in = 0;
        int status = inflateInit2(&m_stream, windowBits);
        if (status != Z_OK) {
            throw RegionError(ErrorKind::DecompressError,
                "inflateInit2 failed with status " + std::to_string(status));
        }
    }

    ~InflateStream() {
        inflateEnd(&m_stream);
    }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream& get() { return m_stream; }

private:
    z_stream m_stream{};
};

std::vector<uint8_t> inflateAll(std::span<const uint8_t> compressed, int windowBits, size_t maxOutput) {
    if (compressed.size() > std::numeric_limits<uInt>::max()) {
        throw RegionError(ErrorKind::DecompressError, "compressed payload too large for zlib");
    }

    InflateStream inflater(windowBits);
    z_stream& stream = inflater.get();
    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> out;
    out.reserve(std::min(maxOutput, std::max(compressed.size() * 4, kInflateChunk)));

    int status = Z_OK;
    while (status != Z_STREAM_END) {
        size_t produced = out.size();
        if (produced >= maxOutput) {
            throw RegionError(ErrorKind::DecompressError,
                "inflated data exceeds limit of " + std::to_string(maxOutput) + " bytes");
        }
        size_t grow = std::min(kInflateChunk, maxOutput - produced);
        out.resize(produced + grow);
        stream.next_out = out.data() + produced;
        stream.avail_out = static_cast<uInt>(grow);

        status = inflate(&stream, Z_NO_FLUSH);
        out.resize(produced + (grow - stream.avail_out));

        switch (status) {
        case Z_OK:
        case Z_STREAM_END:
            break;
        case Z_BUF_ERROR:
            if (stream.avail_in == 0) {
                throw RegionError(ErrorKind::DecompressError, "compressed stream is truncated");
            }
            break;
        case Z_NEED_DICT:
            throw RegionError(ErrorKind::DecompressError, "compressed stream requires a preset dictionary");
        case Z_DATA_ERROR:
            throw RegionError(ErrorKind::DecompressError,
                std::string("corrupt compressed stream: ") + (stream.msg ? stream.msg : "data error"));
        case Z_MEM_ERROR:
            throw RegionError(ErrorKind::DecompressError, "out of memory while inflating");
        default:
            throw RegionError(ErrorKind::DecompressError,
                "inflate failed with status " + std::to_string(status));
        }

        if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            throw RegionError(ErrorKind::DecompressError, "compressed stream is truncated");
        }
    }
    return out;
}

} // namespace

std::optional<CompressionType> compressionTypeFromByte(uint8_t tag) {
    switch (tag) {
    case 1:
        return CompressionType::GZip;
    case 2:
        return CompressionType::Zlib;
    case 3:
        return CompressionType::Uncompressed;
    case 4:
        return CompressionType::Lz4;
    case 127:
        return CompressionType::Custom;
    default:
        return std::nullopt;
    }
}

const char* compressionTypeName(uint8_t tag) {
    auto type = compressionTypeFromByte(tag);
    if (!type) {
        return "unknown";
    }
    switch (*type) {
    case CompressionType::GZip:
        return "gzip";
    case CompressionType::Zlib:
        return "zlib";
    case CompressionType::Uncompressed:
        return "uncompressed";
    case CompressionType::Lz4:
        return "lz4";
    case CompressionType::Custom:
        return "custom";
    }
    return "unknown";
}

std::vector<uint8_t> decompress(uint8_t tag, std::span<const uint8_t> compressed, size_t maxOutput) {
    auto type = compressionTypeFromByte(tag);
    if (!type) {
        throw RegionError::unsupportedCompression(tag);
    }

    switch (*type) {
    case CompressionType::Zlib:
        return inflateAll(compressed, kZlibWindowBits, maxOutput);
    case CompressionType::GZip:
        return inflateAll(compressed, kGzipWindowBits, maxOutput);
    case CompressionType::Uncompressed:
        if (compressed.size() > maxOutput) {
            throw RegionError(ErrorKind::DecompressError,
                "stored data exceeds limit of " + std::to_string(maxOutput) + " bytes");
        }
        return std::vector<uint8_t>(compressed.begin(), compressed.end());
    case CompressionType::Lz4:
    case CompressionType::Custom:
        break;
    }
    throw RegionError::unsupportedCompression(tag);
}

} // namespace Anvil::Region
