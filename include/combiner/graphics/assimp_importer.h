#ifndef ACC_GRAPHICS_ASSIMP_IMPORTER_H
#define ACC_GRAPHICS_ASSIMP_IMPORTER_H

#include "combiner/graphics/asset_geometry.h"
#include "combiner/graphics/texture_encoder.h"
#include "common/util/file.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

struct aiMesh;
struct aiScene;

namespace ACC {
namespace Graphics {

// Loads rigged part files (FBX, glTF, Collada, X, B3D, ...) through assimp
// into AssetGeometry. Vertices are baked into scene space and every joint's
// inverse bind matrix maps scene space to joint space, so parts authored
// against the same armature line up after assembly.
class AssimpMeshImporter {
public:
    // encoder is borrowed and may be null; textures other than PNG or JPEG
    // are then left out
    explicit AssimpMeshImporter(TextureEncoder* encoder = nullptr);

    // Returns nullptr with error set when the file cannot be loaded
    std::shared_ptr<AssetGeometry> load(const std::string& path, std::string& error);

private:
    struct SceneContext {
        const aiScene* scene = nullptr;
        std::string path;
        fs::path directory;
        std::map<std::string, int> jointIndex;
        std::vector<bool> jointBound;  // inverse bind matrix taken from a bone
        std::map<unsigned int, int> materialIndex;
    };

    void convertSkeleton(SceneContext& ctx, AssetGeometry& geometry);
    bool convertMesh(SceneContext& ctx, const aiMesh* mesh, const glm::mat4& transform,
                     AssetGeometry& geometry, std::string& error);
    int convertMaterial(SceneContext& ctx, unsigned int index, AssetGeometry& geometry);
    bool loadTexture(SceneContext& ctx, const std::string& reference, AssetMaterial& material,
                     std::string& error);

    TextureEncoder* encoder_;
};

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_ASSIMP_IMPORTER_H
