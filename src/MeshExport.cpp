#include "MeshExport.h"

#include <fstream>
#include <stdexcept>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#include "MarchingCubes.h"
#include "SliceExtractor.h"

void writeObj(const SurfaceMesh& mesh, const std::string& path)
{
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write mesh file: " + path);

    ofs << "# brainsurf isosurface\n"
        << "# " << mesh.triangleCount() << " triangles\n";

    for (std::size_t i = 0; i < mesh.vertexCount(); ++i)
    {
        glm::vec3 v = mesh.vertex(i);
        ofs << "v " << v.x << ' ' << v.y << ' ' << v.z << '\n';
    }

    std::vector<glm::vec3> normals = computeFaceNormals(mesh);
    for (const glm::vec3& n : normals)
        ofs << "vn " << n.x << ' ' << n.y << ' ' << n.z << '\n';

    // OBJ indices are 1-based; vertices are not shared between faces.
    for (std::size_t t = 0; t < mesh.triangleCount(); ++t)
    {
        std::size_t a = t * 3 + 1;
        std::size_t n = t + 1;
        ofs << "f " << a << "//" << n << ' ' << a + 1 << "//" << n << ' '
            << a + 2 << "//" << n << '\n';
    }

    if (!ofs)
        throw std::runtime_error("Error writing mesh file: " + path);
}

void writeSlicePng(const SliceImage& image, const std::string& path)
{
    if (image.width <= 0 || image.height <= 0 || image.rgba.empty())
        throw std::runtime_error("Cannot write empty slice image: " + path);

    int ok = stbi_write_png(path.c_str(), image.width, image.height, 4,
                            image.rgba.data(), image.width * 4);
    if (!ok)
        throw std::runtime_error("Failed to write " + path);
}
