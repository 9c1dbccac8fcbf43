#pragma once

#include <string>

struct SliceImage;
struct SurfaceMesh;

/// Write the mesh as Wavefront OBJ with one normal per face.
/// @throws std::runtime_error on I/O errors.
void writeObj(const SurfaceMesh& mesh, const std::string& path);

/// Write an RGBA8 slice as PNG.
/// @throws std::runtime_error if the image is empty or cannot be written.
void writeSlicePng(const SliceImage& image, const std::string& path);
