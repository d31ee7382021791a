#include "combiner/graphics/asset_geometry.h"

namespace ACC {
namespace Graphics {

int AssetGeometry::findJoint(const std::string& jointName) const {
    for (size_t i = 0; i < joints.size(); i++) {
        if (joints[i].name == jointName) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

size_t AssetGeometry::vertexCount() const {
    size_t total = 0;
    for (const auto& mesh : meshes) {
        total += mesh.vertices.size();
    }
    return total;
}

size_t AssetGeometry::triangleCount() const {
    size_t total = 0;
    for (const auto& mesh : meshes) {
        total += mesh.indices.size() / 3;
    }
    return total;
}

void addInfluence(AssetVertex& vertex, uint16_t joint, float weight) {
    if (weight <= 0.0f) {
        return;
    }

    size_t weakest = 0;
    for (size_t i = 0; i < kMaxInfluences; i++) {
        if (vertex.weights[i] > 0.0f && vertex.joints[i] == joint) {
            vertex.weights[i] += weight;
            return;
        }
        if (vertex.weights[i] < vertex.weights[weakest]) {
            weakest = i;
        }
    }

    if (weight > vertex.weights[weakest]) {
        vertex.joints[weakest] = joint;
        vertex.weights[weakest] = weight;
    }
}

void normalizeInfluences(AssetVertex& vertex) {
    float sum = vertex.weights.x + vertex.weights.y + vertex.weights.z + vertex.weights.w;
    if (sum <= 0.0f) {
        vertex.joints = {};
        vertex.weights = glm::vec4(1.0f, 0.0f, 0.0f, 0.0f);
        return;
    }
    vertex.weights /= sum;
}

} // namespace Graphics
} // namespace ACC
