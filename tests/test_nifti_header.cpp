// test_nifti_header.cpp - Tests for the fixed NIfTI-1 header parser.
//
// Builds headers byte by byte and checks magic handling, field offsets,
// scaling defaults, body offset rules and dimension validation.

#include "NiftiHeader.h"

#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include "ByteOrder.h"
#include "VolumeErrors.h"

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool approxEq(double a, double b, double tol = 1e-6)
{
    return std::fabs(a - b) < tol;
}

/// A 352-byte single-file header for a dx*dy*dz uint8 volume.
static std::vector<uint8_t> makeHeader(int dx, int dy, int dz,
                                       const char* magic = "n+1")
{
    std::vector<uint8_t> b(352, 0);
    writeLittleEndian<int32_t>(&b[0], 348);
    writeLittleEndian<int16_t>(&b[40], 3);
    writeLittleEndian<int16_t>(&b[42], static_cast<int16_t>(dx));
    writeLittleEndian<int16_t>(&b[44], static_cast<int16_t>(dy));
    writeLittleEndian<int16_t>(&b[46], static_cast<int16_t>(dz));
    writeLittleEndian<int16_t>(&b[48], 1);
    writeLittleEndian<int16_t>(&b[70], 2);
    writeLittleEndian<int16_t>(&b[72], 8);
    writeLittleEndian<float>(&b[76], 1.0f);
    writeLittleEndian<float>(&b[80], 1.0f);
    writeLittleEndian<float>(&b[84], 1.0f);
    writeLittleEndian<float>(&b[88], 1.0f);
    writeLittleEndian<float>(&b[108], 352.0f);
    writeLittleEndian<float>(&b[112], 1.0f);
    std::memcpy(&b[344], magic, std::strlen(magic) + 1);
    return b;
}

template <typename Fn>
static bool throwsMalformed(Fn&& fn)
{
    try
    {
        fn();
    }
    catch (const MalformedInputError&)
    {
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Test 1: Basic fields are read from their offsets
// ---------------------------------------------------------------------------
static void testBasicFields()
{
    std::cout << "  testBasicFields...";

    auto b = makeHeader(10, 20, 30);
    writeLittleEndian<int16_t>(&b[70], 4);
    writeLittleEndian<int16_t>(&b[72], 16);
    writeLittleEndian<float>(&b[80], 0.5f);
    writeLittleEndian<float>(&b[84], 1.5f);
    writeLittleEndian<float>(&b[88], 2.0f);
    writeLittleEndian<float>(&b[112], 2.0f);
    writeLittleEndian<float>(&b[116], -5.0f);
    writeLittleEndian<int16_t>(&b[252], 1);
    writeLittleEndian<int16_t>(&b[254], 2);

    NiftiHeader h = parseNiftiHeader(b);

    CHECK(h.singleFile, "n+1 should be a single-file header");
    CHECK(h.sizeofHdr == 348, "sizeof_hdr");
    auto dims = h.spatialDims();
    CHECK(dims[0] == 10 && dims[1] == 20 && dims[2] == 30, "spatial dims");
    CHECK(h.voxelCount() == 6000, "voxel count");
    CHECK(h.datatype == 4, "datatype");
    CHECK(h.bitpix == 16, "bitpix");
    auto sp = h.spatialSpacing();
    CHECK(approxEq(sp[0], 0.5) && approxEq(sp[1], 1.5) && approxEq(sp[2], 2.0), "spacing");
    CHECK(approxEq(h.sclSlope, 2.0) && approxEq(h.sclInter, -5.0), "slope/intercept");
    CHECK(h.qformCode == 1 && h.sformCode == 2, "qform/sform codes");
    CHECK(h.bodyOffset() == 352, "body offset");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Pair magic is accepted, anything else rejected
// ---------------------------------------------------------------------------
static void testMagicVariants()
{
    std::cout << "  testMagicVariants...";

    NiftiHeader pair = parseNiftiHeader(makeHeader(2, 2, 2, "ni1"));
    CHECK(!pair.singleFile, "ni1 should be a header/image pair");

    CHECK(throwsMalformed([] { parseNiftiHeader(makeHeader(2, 2, 2, "n+2")); }),
          "NIfTI-2 style magic should be rejected");
    CHECK(throwsMalformed([] { parseNiftiHeader(makeHeader(2, 2, 2, "abc")); }),
          "garbage magic should be rejected");

    auto noTerminator = makeHeader(2, 2, 2);
    noTerminator[347] = 'x';
    CHECK(throwsMalformed([&] { parseNiftiHeader(noTerminator); }),
          "magic without trailing NUL should be rejected");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: Buffers shorter than the fixed header are rejected
// ---------------------------------------------------------------------------
static void testTruncatedHeader()
{
    std::cout << "  testTruncatedHeader...";

    CHECK(throwsMalformed([] { parseNiftiHeader({}); }), "empty buffer should be rejected");

    auto b = makeHeader(2, 2, 2);
    b.resize(347);
    CHECK(throwsMalformed([&] { parseNiftiHeader(b); }), "347 bytes should be rejected");

    b = makeHeader(2, 2, 2);
    b.resize(348);
    bool ok = true;
    try
    {
        parseNiftiHeader(b);
    }
    catch (const MalformedInputError&)
    {
        ok = false;
    }
    CHECK(ok, "exactly 348 bytes should parse");

    bool caughtBase = false;
    try
    {
        parseNiftiHeader(std::vector<uint8_t>(10, 0));
    }
    catch (const VolumeError&)
    {
        caughtBase = true;
    }
    CHECK(caughtBase, "MalformedInputError should be catchable as VolumeError");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Slope of zero (or non-finite) means no scaling
// ---------------------------------------------------------------------------
static void testZeroSlopeMeansIdentity()
{
    std::cout << "  testZeroSlopeMeansIdentity...";

    auto b = makeHeader(2, 2, 2);
    writeLittleEndian<float>(&b[112], 0.0f);
    writeLittleEndian<float>(&b[116], 3.0f);
    NiftiHeader h = parseNiftiHeader(b);
    CHECK(approxEq(h.sclSlope, 1.0), "zero slope should become 1");
    CHECK(approxEq(h.sclInter, 3.0), "intercept should be kept");

    writeLittleEndian<float>(&b[112], std::numeric_limits<float>::quiet_NaN());
    h = parseNiftiHeader(b);
    CHECK(approxEq(h.sclSlope, 1.0), "NaN slope should become 1");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: Body offset is max(352, vox_offset) for single files
// ---------------------------------------------------------------------------
static void testBodyOffset()
{
    std::cout << "  testBodyOffset...";

    auto b = makeHeader(2, 2, 2);
    writeLittleEndian<float>(&b[108], 0.0f);
    CHECK(parseNiftiHeader(b).bodyOffset() == 352, "zero vox_offset should give 352");

    writeLittleEndian<float>(&b[108], 348.0f);
    CHECK(parseNiftiHeader(b).bodyOffset() == 352, "vox_offset below 352 should give 352");

    writeLittleEndian<float>(&b[108], 400.0f);
    CHECK(parseNiftiHeader(b).bodyOffset() == 400, "larger vox_offset should be honoured");

    auto pair = makeHeader(2, 2, 2, "ni1");
    writeLittleEndian<float>(&pair[108], 0.0f);
    CHECK(parseNiftiHeader(pair).bodyOffset() == 352,
          "ni1 header followed by its voxels still skips 352 bytes");
    CHECK(parseNiftiHeader(pair).bodyOffset(false) == 0,
          "separate image file starts at vox_offset");
    writeLittleEndian<float>(&pair[108], 16.0f);
    CHECK(parseNiftiHeader(pair).bodyOffset(false) == 16, "image offset honours vox_offset");

    writeLittleEndian<float>(&b[108], 1e30f);
    NiftiHeader huge = parseNiftiHeader(b);
    CHECK(throwsMalformed([&] { (void)huge.bodyOffset(); }),
          "vox_offset beyond size_t should throw MalformedInputError");
    CHECK(throwsMalformed([&] { (void)huge.bodyOffset(false); }),
          "same for a separate image file");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 6: Negative and zero spacing
// ---------------------------------------------------------------------------
static void testSpacingSanitised()
{
    std::cout << "  testSpacingSanitised...";

    auto b = makeHeader(2, 2, 2);
    writeLittleEndian<float>(&b[80], -2.0f);
    writeLittleEndian<float>(&b[84], 0.0f);
    writeLittleEndian<float>(&b[88], 3.0f);
    auto sp = parseNiftiHeader(b).spatialSpacing();

    CHECK(approxEq(sp[0], 2.0), "negative spacing should use its magnitude");
    CHECK(approxEq(sp[1], 1.0), "zero spacing should fall back to 1");
    CHECK(approxEq(sp[2], 3.0), "positive spacing should be kept");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 7: dim[0] bounds and lower-rank images
// ---------------------------------------------------------------------------
static void testDimensionValidation()
{
    std::cout << "  testDimensionValidation...";

    auto b = makeHeader(4, 5, 6);
    writeLittleEndian<int16_t>(&b[40], 0);
    CHECK(throwsMalformed([&] { parseNiftiHeader(b); }), "dim[0] = 0 should be rejected");

    writeLittleEndian<int16_t>(&b[40], 8);
    CHECK(throwsMalformed([&] { parseNiftiHeader(b); }), "dim[0] = 8 should be rejected");

    // A 2D image: dim[3] is ignored and treated as 1.
    writeLittleEndian<int16_t>(&b[40], 2);
    writeLittleEndian<int16_t>(&b[46], 0);
    auto dims = parseNiftiHeader(b).spatialDims();
    CHECK(dims[0] == 4 && dims[1] == 5 && dims[2] == 1, "2D image should have depth 1");

    auto neg = makeHeader(4, -1, 6);
    CHECK(throwsMalformed([&] { parseNiftiHeader(neg); }), "negative dim should be rejected");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 8: Datatype helpers
// ---------------------------------------------------------------------------
static void testDataTypeHelpers()
{
    std::cout << "  testDataTypeHelpers...";

    CHECK(isSupportedDataType(2) && isSupportedDataType(4) && isSupportedDataType(8) &&
              isSupportedDataType(16) && isSupportedDataType(64) &&
              isSupportedDataType(256) && isSupportedDataType(512),
          "all seven datatypes should be supported");
    CHECK(!isSupportedDataType(32), "complex64 should not be supported");
    CHECK(!isSupportedDataType(0), "0 should not be supported");

    CHECK(bytesPerVoxel(2) == 1 && bytesPerVoxel(256) == 1, "8-bit widths");
    CHECK(bytesPerVoxel(4) == 2 && bytesPerVoxel(512) == 2, "16-bit widths");
    CHECK(bytesPerVoxel(8) == 4 && bytesPerVoxel(16) == 4, "32-bit widths");
    CHECK(bytesPerVoxel(64) == 8, "64-bit width");
    CHECK(bytesPerVoxel(1234) == 1, "unknown datatype decodes as one byte");

    CHECK(dataTypeName(16) == "float32", "float32 name");
    CHECK(dataTypeName(512) == "uint16", "uint16 name");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== NIfTI Header Tests ===\n";

    testBasicFields();
    testMagicVariants();
    testTruncatedHeader();
    testZeroSlopeMeansIdentity();
    testBodyOffset();
    testSpacingSanitised();
    testDimensionValidation();
    testDataTypeHelpers();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All NIfTI header tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " NIfTI header test(s) FAILED.\n";
        return 1;
    }
}
