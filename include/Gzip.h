#pragma once

#include <cstdint>
#include <vector>

/// True if the buffer starts with the gzip magic bytes 0x1F 0x8B.
bool isGzip(const std::vector<uint8_t>& bytes);

/// Inflate a complete gzip stream (one or more concatenated members) into
/// a single contiguous buffer.
/// @throws DecompressionError if the stream is corrupt or truncated.
std::vector<uint8_t> gunzip(const std::vector<uint8_t>& compressed);

/// Return gunzip(bytes) for gzip input, otherwise the bytes unchanged.
std::vector<uint8_t> decompressIfNeeded(std::vector<uint8_t> bytes);

/// Compress a buffer into a single gzip member.  Used when writing test
/// fixtures and by tools that emit .nii.gz.
/// @throws std::runtime_error on zlib failure.
std::vector<uint8_t> gzipCompress(const std::vector<uint8_t>& raw);
