#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/// Size of the fixed NIfTI-1 header in bytes.
constexpr std::size_t kNiftiHeaderSize = 348;

/// Minimum byte offset of the voxel body in a single-file (.nii) volume:
/// the header plus the 4-byte extension flag.
constexpr std::size_t kNiftiMinBodyOffset = 352;

/// Byte offset of the 4-byte magic string.
constexpr std::size_t kNiftiMagicOffset = 344;

/// NIfTI-1 datatype codes we know how to decode.
enum class NiftiDataType : int16_t
{
    UInt8   = 2,
    Int16   = 4,
    Int32   = 8,
    Float32 = 16,
    Float64 = 64,
    Int8    = 256,
    UInt16  = 512,
};

/// The header fields this project consumes.  Everything else in the
/// 348 bytes is ignored.
struct NiftiHeader
{
    /// True for "n+1\0" (header and voxels in one file), false for
    /// "ni1\0" (separate .hdr/.img pair).
    bool singleFile = true;

    int32_t sizeofHdr = 0;
    std::array<int16_t, 8> dim{};
    int16_t datatype = 0;
    int16_t bitpix = 0;
    std::array<float, 8> pixdim{};
    float voxOffset = 0.0f;

    /// Always non-zero after parsing (a stored 0 means "no scaling").
    float sclSlope = 1.0f;
    float sclInter = 0.0f;

    int16_t qformCode = 0;
    int16_t sformCode = 0;

    /// Byte offset of voxel data.  When the voxels follow the header in the
    /// same buffer the offset is never below kNiftiMinBodyOffset, whatever
    /// the magic says; a separate image file starts at vox_offset itself.
    /// @throws MalformedInputError if vox_offset cannot be a byte offset.
    std::size_t bodyOffset(bool contiguous = true) const;

    /// dim[1..3], with axes beyond dim[0] treated as size 1.
    std::array<int, 3> spatialDims() const;

    /// |pixdim[1..3]|, with zero or non-finite spacing replaced by 1 mm.
    std::array<double, 3> spatialSpacing() const;

    /// Number of voxels in the 3D volume.
    std::size_t voxelCount() const;
};

/// Return true if the datatype code is one of the NiftiDataType values.
bool isSupportedDataType(int16_t code);

/// Bytes per stored sample for a datatype code.  Unknown codes report 1
/// because they are decoded as unsigned 8-bit.
std::size_t bytesPerVoxel(int16_t code);

/// Human-readable datatype name ("uint8", "int16", ...).
std::string dataTypeName(int16_t code);

/// Decode the fixed header from the start of a buffer.
/// @throws MalformedInputError if the buffer is too short, the magic is
///         not one of the two accepted values, or the dimensions are
///         unusable.
NiftiHeader parseNiftiHeader(const std::vector<uint8_t>& bytes);
