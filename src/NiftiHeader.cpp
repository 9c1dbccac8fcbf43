#include "NiftiHeader.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <string>

#include "ByteOrder.h"
#include "VolumeErrors.h"

namespace
{

// Field offsets inside the NIfTI-1 header.
constexpr std::size_t kOffSizeofHdr = 0;
constexpr std::size_t kOffDim       = 40;
constexpr std::size_t kOffDatatype  = 70;
constexpr std::size_t kOffBitpix    = 72;
constexpr std::size_t kOffPixdim    = 76;
constexpr std::size_t kOffVoxOffset = 108;
constexpr std::size_t kOffSclSlope  = 112;
constexpr std::size_t kOffSclInter  = 116;
constexpr std::size_t kOffQformCode = 252;
constexpr std::size_t kOffSformCode = 254;

constexpr char kMagicSingle[4] = { 'n', '+', '1', '\0' };
constexpr char kMagicPair[4]   = { 'n', 'i', '1', '\0' };

} // namespace

std::size_t NiftiHeader::bodyOffset(bool contiguous) const
{
    double declared = std::isfinite(voxOffset) && voxOffset > 0.0f
                          ? static_cast<double>(voxOffset)
                          : 0.0;
    if (declared >= static_cast<double>(std::numeric_limits<std::size_t>::max()))
        throw MalformedInputError("vox_offset out of range: " + std::to_string(voxOffset));

    std::size_t offset = static_cast<std::size_t>(declared);
    if (!contiguous)
        return offset;
    return std::max(kNiftiMinBodyOffset, offset);
}

std::array<int, 3> NiftiHeader::spatialDims() const
{
    std::array<int, 3> out{ 1, 1, 1 };
    for (int axis = 0; axis < 3; ++axis)
    {
        if (axis + 1 <= dim[0])
            out[axis] = dim[axis + 1];
    }
    return out;
}

std::array<double, 3> NiftiHeader::spatialSpacing() const
{
    std::array<double, 3> out{ 1.0, 1.0, 1.0 };
    for (int axis = 0; axis < 3; ++axis)
    {
        double s = std::abs(static_cast<double>(pixdim[axis + 1]));
        if (std::isfinite(s) && s > 0.0)
            out[axis] = s;
    }
    return out;
}

std::size_t NiftiHeader::voxelCount() const
{
    auto d = spatialDims();
    return static_cast<std::size_t>(d[0]) * static_cast<std::size_t>(d[1]) *
           static_cast<std::size_t>(d[2]);
}

bool isSupportedDataType(int16_t code)
{
    switch (static_cast<NiftiDataType>(code))
    {
    case NiftiDataType::UInt8:
    case NiftiDataType::Int16:
    case NiftiDataType::Int32:
    case NiftiDataType::Float32:
    case NiftiDataType::Float64:
    case NiftiDataType::Int8:
    case NiftiDataType::UInt16:
        return true;
    }
    return false;
}

std::size_t bytesPerVoxel(int16_t code)
{
    switch (static_cast<NiftiDataType>(code))
    {
    case NiftiDataType::UInt8:
    case NiftiDataType::Int8:
        return 1;
    case NiftiDataType::Int16:
    case NiftiDataType::UInt16:
        return 2;
    case NiftiDataType::Int32:
    case NiftiDataType::Float32:
        return 4;
    case NiftiDataType::Float64:
        return 8;
    }
    return 1;
}

std::string dataTypeName(int16_t code)
{
    switch (static_cast<NiftiDataType>(code))
    {
    case NiftiDataType::UInt8:   return "uint8";
    case NiftiDataType::Int16:   return "int16";
    case NiftiDataType::Int32:   return "int32";
    case NiftiDataType::Float32: return "float32";
    case NiftiDataType::Float64: return "float64";
    case NiftiDataType::Int8:    return "int8";
    case NiftiDataType::UInt16:  return "uint16";
    }
    return "unknown(" + std::to_string(code) + ")";
}

NiftiHeader parseNiftiHeader(const std::vector<uint8_t>& bytes)
{
    if (bytes.size() < kNiftiHeaderSize)
        throw MalformedInputError("Truncated NIfTI header: " +
                                  std::to_string(bytes.size()) + " bytes, need " +
                                  std::to_string(kNiftiHeaderSize));

    const uint8_t* p = bytes.data();

    NiftiHeader hdr;
    const uint8_t* magic = p + kNiftiMagicOffset;
    if (std::memcmp(magic, kMagicSingle, 4) == 0)
        hdr.singleFile = true;
    else if (std::memcmp(magic, kMagicPair, 4) == 0)
        hdr.singleFile = false;
    else
        throw MalformedInputError("Invalid NIfTI file: bad magic number");

    hdr.sizeofHdr = readLittleEndian<int32_t>(p + kOffSizeofHdr);
    for (int i = 0; i < 8; ++i)
    {
        hdr.dim[i]    = readLittleEndian<int16_t>(p + kOffDim + i * 2);
        hdr.pixdim[i] = readLittleEndian<float>(p + kOffPixdim + i * 4);
    }
    hdr.datatype  = readLittleEndian<int16_t>(p + kOffDatatype);
    hdr.bitpix    = readLittleEndian<int16_t>(p + kOffBitpix);
    hdr.voxOffset = readLittleEndian<float>(p + kOffVoxOffset);
    hdr.sclSlope  = readLittleEndian<float>(p + kOffSclSlope);
    hdr.sclInter  = readLittleEndian<float>(p + kOffSclInter);
    hdr.qformCode = readLittleEndian<int16_t>(p + kOffQformCode);
    hdr.sformCode = readLittleEndian<int16_t>(p + kOffSformCode);

    // A stored slope of zero means "no scaling".
    if (hdr.sclSlope == 0.0f || !std::isfinite(hdr.sclSlope))
        hdr.sclSlope = 1.0f;
    if (!std::isfinite(hdr.sclInter))
        hdr.sclInter = 0.0f;

    if (hdr.dim[0] < 1 || hdr.dim[0] > 7)
        throw MalformedInputError("Invalid NIfTI dim[0]: " + std::to_string(hdr.dim[0]));

    auto dims = hdr.spatialDims();
    for (int axis = 0; axis < 3; ++axis)
    {
        if (dims[axis] < 1)
            throw MalformedInputError("Invalid NIfTI dimension " + std::to_string(axis + 1) +
                                      ": " + std::to_string(dims[axis]));
    }

    return hdr;
}
