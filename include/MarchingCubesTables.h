#pragma once

/// Terminator in kTriTable rows.
constexpr int kTriTableEnd = -1;

/// For each of the 256 corner classifications, a 12-bit mask of the cube
/// edges the isosurface crosses.
extern const int kEdgeTable[256];

/// For each classification, up to five triangles as triples of edge
/// indices, terminated by kTriTableEnd.
extern const int kTriTable[256][16];

/// Corner offsets (in units of the cell size) in canonical order.
constexpr int kCubeCorners[8][3] = {
    { 0, 0, 0 }, { 1, 0, 0 }, { 1, 1, 0 }, { 0, 1, 0 },
    { 0, 0, 1 }, { 1, 0, 1 }, { 1, 1, 1 }, { 0, 1, 1 },
};

/// The two corners joined by each edge.
constexpr int kCubeEdges[12][2] = {
    { 0, 1 }, { 1, 2 }, { 2, 3 }, { 3, 0 },
    { 4, 5 }, { 5, 6 }, { 6, 7 }, { 7, 4 },
    { 0, 4 }, { 1, 5 }, { 2, 6 }, { 3, 7 },
};
