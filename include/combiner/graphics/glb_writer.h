#ifndef ACC_GRAPHICS_GLB_WRITER_H
#define ACC_GRAPHICS_GLB_WRITER_H

#include "combiner/graphics/asset_geometry.h"

#include <assimp/scene.h>

#include <memory>
#include <string>

namespace ACC {
namespace Graphics {

// assimp exporter id for glTF 2.0 binary
constexpr const char* kGlbFormatId = "glb2";

// Writes an AssetGeometry as a self-contained .glb through the assimp glTF 2.0
// exporter: one node per mesh, the joint hierarchy as nodes, one bone per
// influencing joint, textures embedded.
class GlbWriter {
public:
    // Checks the geometry and converts it. Returns null with error set when it
    // cannot be written.
    static std::unique_ptr<aiScene> toScene(const AssetGeometry& geometry, std::string& error);

    static bool write(const AssetGeometry& geometry, const std::string& path, std::string& error);
};

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_GLB_WRITER_H
