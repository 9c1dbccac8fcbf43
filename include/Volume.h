#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "NiftiHeader.h"

/// A non-fatal problem found while decoding the voxel body.
struct DecodeWarning
{
    enum class Kind
    {
        UnsupportedDataType,  ///< Unknown datatype code, decoded as uint8.
        NonFiniteSamples,     ///< NaN/Inf samples were replaced with 0.
    };

    Kind kind;
    std::string message;
};

/// Result of decoding a NIfTI buffer.  A load either succeeds cleanly or
/// succeeds with one or more warnings; hard failures are exceptions.
struct NiftiLoadResult;

class Volume {
public:
    glm::ivec3 dimensions{0, 0, 0};  // X, Y, Z voxel counts

    /// Voxel size in mm along each axis (always positive).
    glm::dvec3 voxelSize{1.0, 1.0, 1.0};

    /// Decoded samples after slope/intercept, X fastest.
    std::vector<float> data;
    float min_value = 0.0f;
    float max_value = 1.0f;

    NiftiHeader header;

    Volume();
    ~Volume();

    Volume(const Volume&) = default;
    Volume& operator=(const Volume&) = default;
    Volume(Volume&& other) noexcept;
    Volume& operator=(Volume&& other) noexcept;

    /// Decode a complete single-file NIfTI buffer (already decompressed).
    /// @throws MalformedInputError on bad magic, bad dims or short body.
    static NiftiLoadResult fromBytes(const std::vector<uint8_t>& bytes);

    /// Decode a header/image pair (.hdr + .img).  The body is read from
    /// `image` at the header's vox_offset.
    /// @throws MalformedInputError on bad magic, bad dims or short body.
    static NiftiLoadResult fromHeaderAndImage(const std::vector<uint8_t>& header,
                                              const std::vector<uint8_t>& image);

    /// Build a volume from already decoded samples (X fastest).
    /// @throws std::invalid_argument if the sample count does not match.
    static Volume fromSamples(const glm::ivec3& dims, const glm::dvec3& spacing,
                              std::vector<float> samples);

    /// Load a .nii, .nii.gz, .hdr or .hdr.gz file from disk.
    /// @throws VolumeError on malformed or undecompressable input,
    ///         std::runtime_error on I/O failure.
    static NiftiLoadResult load(const std::string& filename);

    /// Fill with an n^3 synthetic phantom: a bright shell around a darker
    /// core on a dim background.
    void generateTestData(int n = 64);

    /// Raw sample, or 0 outside the volume.
    float get(int x, int y, int z) const;

    /// (get(x,y,z) - min) / (max - min).
    float normalized(int x, int y, int z) const;

    /// Normalise an arbitrary raw value against this volume's range.
    float normalize(float raw) const;

    /// dimensions * voxelSize, in mm.
    glm::dvec3 physicalSize() const;

    std::size_t voxelCount() const { return data.size(); }
    bool empty() const { return data.empty(); }

private:
    /// Recompute min_value/max_value over the whole field.
    void updateRange();
};

struct NiftiLoadResult
{
    Volume volume;
    std::vector<DecodeWarning> warnings;

    bool hasWarnings() const { return !warnings.empty(); }
};

/// Read a whole file into memory.
/// @throws std::runtime_error if the file cannot be opened or read.
std::vector<uint8_t> readFileBytes(const std::string& filename);
