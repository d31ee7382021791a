#ifndef ACC_GRAPHICS_ASSET_GEOMETRY_H
#define ACC_GRAPHICS_ASSET_GEOMETRY_H

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ACC {
namespace Graphics {

// Maximum joint influences kept per vertex (glTF JOINTS_0/WEIGHTS_0)
constexpr size_t kMaxInfluences = 4;

// Right-handed, Y up, meters as authored. UV origin at the bottom left.
struct AssetVertex {
    glm::vec3 position{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    glm::vec2 uv{0.0f};
    std::array<uint16_t, kMaxInfluences> joints{};
    glm::vec4 weights{0.0f};
};

struct AssetMaterial {
    std::string name;
    glm::vec4 baseColor{1.0f};
    std::string textureName;  // source path, used to share images between materials
    std::string imageData;    // encoded PNG or JPEG bytes, empty without texture
    std::string mimeType;
    bool doubleSided = false;
};

struct AssetMesh {
    std::string name;
    std::vector<AssetVertex> vertices;
    std::vector<uint32_t> indices;  // triangle list, counter-clockwise front faces
    int materialIndex = -1;
    bool skinned = false;
};

struct AssetJoint {
    std::string name;
    int parent = -1;
    glm::mat4 localMatrix{1.0f};
    glm::mat4 inverseBindMatrix{1.0f};
};

// Host-neutral geometry of one imported part or one assembled outfit
struct AssetGeometry {
    std::string name;
    std::vector<AssetMesh> meshes;
    std::vector<AssetMaterial> materials;
    std::vector<AssetJoint> joints;

    bool hasSkeleton() const { return !joints.empty(); }
    int findJoint(const std::string& jointName) const;
    size_t vertexCount() const;
    size_t triangleCount() const;
};

// Record a joint influence, replacing the weakest one when all slots are taken
void addInfluence(AssetVertex& vertex, uint16_t joint, float weight);

// Rescale influences to sum to one. A vertex without influences is bound
// fully to joint 0.
void normalizeInfluences(AssetVertex& vertex);

} // namespace Graphics
} // namespace ACC

#endif // ACC_GRAPHICS_ASSET_GEOMETRY_H
