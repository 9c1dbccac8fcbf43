#include "Volume.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

#include "ByteOrder.h"
#include "Gzip.h"
#include "VolumeErrors.h"

namespace
{

template <typename T>
void decodeSamples(const uint8_t* body, std::size_t count, double slope, double inter,
                   std::vector<float>& out)
{
    for (std::size_t i = 0; i < count; ++i)
    {
        double raw = static_cast<double>(readLittleEndian<T>(body + i * sizeof(T)));
        out[i] = static_cast<float>(raw * slope + inter);
    }
}

bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Decode the voxel body that starts at `bodyOffset` inside `buffer`.
NiftiLoadResult decodeVolume(const NiftiHeader& hdr, const std::vector<uint8_t>& buffer,
                             std::size_t bodyOffset)
{
    NiftiLoadResult result;
    Volume& vol = result.volume;

    auto dims = hdr.spatialDims();
    auto spacing = hdr.spatialSpacing();
    vol.header = hdr;
    vol.dimensions = glm::ivec3(dims[0], dims[1], dims[2]);
    vol.voxelSize = glm::dvec3(spacing[0], spacing[1], spacing[2]);

    const std::size_t count = hdr.voxelCount();
    const std::size_t width = bytesPerVoxel(hdr.datatype);
    const std::size_t needed = count * width;

    if (bodyOffset > buffer.size() || buffer.size() - bodyOffset < needed)
        throw MalformedInputError("Truncated NIfTI voxel data: need " + std::to_string(needed) +
                                  " bytes at offset " + std::to_string(bodyOffset) +
                                  ", buffer has " + std::to_string(buffer.size()));

    const uint8_t* body = buffer.data() + bodyOffset;
    const double slope = hdr.sclSlope;
    const double inter = hdr.sclInter;

    vol.data.resize(count);  // std::bad_alloc propagates naturally

    switch (static_cast<NiftiDataType>(hdr.datatype))
    {
    case NiftiDataType::UInt8:   decodeSamples<uint8_t>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::Int16:   decodeSamples<int16_t>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::Int32:   decodeSamples<int32_t>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::Float32: decodeSamples<float>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::Float64: decodeSamples<double>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::Int8:    decodeSamples<int8_t>(body, count, slope, inter, vol.data); break;
    case NiftiDataType::UInt16:  decodeSamples<uint16_t>(body, count, slope, inter, vol.data); break;
    default:
        result.warnings.push_back({ DecodeWarning::Kind::UnsupportedDataType,
                                    "Unknown datatype: " + std::to_string(hdr.datatype) +
                                        ", treating as UINT8" });
        decodeSamples<uint8_t>(body, count, slope, inter, vol.data);
        break;
    }

    std::size_t nonFinite = 0;
    for (float& v : vol.data)
    {
        if (!std::isfinite(v))
        {
            v = 0.0f;
            ++nonFinite;
        }
    }
    if (nonFinite > 0)
    {
        result.warnings.push_back({ DecodeWarning::Kind::NonFiniteSamples,
                                    std::to_string(nonFinite) +
                                        " non-finite samples replaced with 0" });
    }

    return result;
}

} // namespace

Volume::Volume()
{
    dimensions = glm::ivec3(0, 0, 0);
}

Volume::~Volume() {}

Volume::Volume(Volume&& other) noexcept
    : dimensions(other.dimensions),
      voxelSize(other.voxelSize),
      data(std::move(other.data)),
      min_value(other.min_value),
      max_value(other.max_value),
      header(other.header)
{
    other.dimensions = glm::ivec3(0, 0, 0);
    other.min_value = 0.0f;
    other.max_value = 1.0f;
}

Volume& Volume::operator=(Volume&& other) noexcept {
    if (this != &other) {
        dimensions = other.dimensions;
        voxelSize = other.voxelSize;
        data = std::move(other.data);
        min_value = other.min_value;
        max_value = other.max_value;
        header = other.header;

        other.dimensions = glm::ivec3(0, 0, 0);
        other.min_value = 0.0f;
        other.max_value = 1.0f;
    }
    return *this;
}

NiftiLoadResult Volume::fromBytes(const std::vector<uint8_t>& bytes)
{
    NiftiHeader hdr = parseNiftiHeader(bytes);
    NiftiLoadResult result = decodeVolume(hdr, bytes, hdr.bodyOffset());
    result.volume.updateRange();
    return result;
}

NiftiLoadResult Volume::fromHeaderAndImage(const std::vector<uint8_t>& header,
                                           const std::vector<uint8_t>& image)
{
    NiftiHeader hdr = parseNiftiHeader(header);
    NiftiLoadResult result = decodeVolume(hdr, image, hdr.bodyOffset(false));
    result.volume.updateRange();
    return result;
}

Volume Volume::fromSamples(const glm::ivec3& dims, const glm::dvec3& spacing,
                           std::vector<float> samples)
{
    if (dims.x < 1 || dims.y < 1 || dims.z < 1)
        throw std::invalid_argument("Volume dimensions must be positive");

    Volume vol;
    vol.dimensions = dims;
    vol.voxelSize = glm::abs(spacing);
    vol.header.dim = { 3, static_cast<int16_t>(dims.x), static_cast<int16_t>(dims.y),
                       static_cast<int16_t>(dims.z), 1, 1, 1, 1 };
    vol.header.datatype = static_cast<int16_t>(NiftiDataType::Float32);
    vol.header.bitpix = 32;
    vol.header.pixdim = { 1.0f, static_cast<float>(vol.voxelSize.x),
                          static_cast<float>(vol.voxelSize.y),
                          static_cast<float>(vol.voxelSize.z), 1.0f, 1.0f, 1.0f, 1.0f };

    const std::size_t expected = static_cast<std::size_t>(dims.x) * dims.y * dims.z;
    if (samples.size() != expected)
        throw std::invalid_argument("Sample count " + std::to_string(samples.size()) +
                                    " does not match dimensions (" +
                                    std::to_string(expected) + ")");
    vol.data = std::move(samples);
    vol.updateRange();
    return vol;
}

NiftiLoadResult Volume::load(const std::string& filename)
{
    if (filename.empty())
        throw std::runtime_error("Empty filename provided");

    std::vector<uint8_t> bytes = decompressIfNeeded(readFileBytes(filename));

    // Analyze-style pair: voxels live in the companion .img file.
    std::string stem;
    if (endsWith(filename, ".hdr"))
        stem = filename.substr(0, filename.size() - 4);
    else if (endsWith(filename, ".hdr.gz"))
        stem = filename.substr(0, filename.size() - 7);

    if (!stem.empty())
    {
        NiftiHeader hdr = parseNiftiHeader(bytes);
        if (!hdr.singleFile)
        {
            std::string imagePath = stem + ".img";
            std::ifstream probe(imagePath, std::ios::binary);
            if (!probe)
                imagePath += ".gz";
            std::vector<uint8_t> image = decompressIfNeeded(readFileBytes(imagePath));
            return fromHeaderAndImage(bytes, image);
        }
    }

    return fromBytes(bytes);
}

void Volume::generateTestData(int n)
{
    if (n < 2)
        throw std::invalid_argument("Test volume needs at least 2 voxels per axis");

    dimensions = glm::ivec3(n, n, n);
    voxelSize = glm::dvec3(1.0, 1.0, 1.0);
    header = NiftiHeader{};
    header.dim = { 3, static_cast<int16_t>(n), static_cast<int16_t>(n),
                   static_cast<int16_t>(n), 1, 1, 1, 1 };
    header.pixdim = { 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f };
    header.datatype = static_cast<int16_t>(NiftiDataType::Float32);
    header.bitpix = 32;

    data.assign(static_cast<std::size_t>(n) * n * n, 0.0f);

    const float c = (n - 1) * 0.5f;
    const float outer = n * 0.42f;
    const float inner = n * 0.30f;

    for (int z = 0; z < n; ++z)
    {
        for (int y = 0; y < n; ++y)
        {
            for (int x = 0; x < n; ++x)
            {
                float dx = x - c;
                float dy = (y - c) * 1.15f;  // slightly elongated front-to-back
                float dz = z - c;
                float r = std::sqrt(dx * dx + dy * dy + dz * dz);

                float val = 10.0f;
                if (r < inner)
                    val = 120.0f;
                else if (r < outer)
                    val = 220.0f;

                data[(static_cast<std::size_t>(z) * n + y) * n + x] = val;
            }
        }
    }

    updateRange();
}

float Volume::get(int x, int y, int z) const
{
    if (x < 0 || x >= dimensions.x ||
        y < 0 || y >= dimensions.y ||
        z < 0 || z >= dimensions.z) return 0.0f;

    return data[(static_cast<std::size_t>(z) * dimensions.y + y) * dimensions.x + x];
}

float Volume::normalize(float raw) const
{
    float span = max_value - min_value;
    if (!(span > 0.0f))
        span = 1.0f;
    return (raw - min_value) / span;
}

float Volume::normalized(int x, int y, int z) const
{
    return normalize(get(x, y, z));
}

glm::dvec3 Volume::physicalSize() const
{
    return glm::dvec3(dimensions) * voxelSize;
}

void Volume::updateRange()
{
    if (data.empty())
    {
        min_value = 0.0f;
        max_value = 1.0f;
        return;
    }

    min_value = std::numeric_limits<float>::max();
    max_value = std::numeric_limits<float>::lowest();

    for (float v : data)
    {
        if (v < min_value) min_value = v;
        if (v > max_value) max_value = v;
    }
}

std::vector<uint8_t> readFileBytes(const std::string& filename)
{
    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs)
        throw std::runtime_error("Cannot open file: " + filename);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                               std::istreambuf_iterator<char>());
    if (ifs.bad())
        throw std::runtime_error("Error reading file: " + filename);
    return bytes;
}
