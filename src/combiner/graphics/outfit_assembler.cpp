#include "combiner/graphics/outfit_assembler.h"
#include "common/logging.h"

namespace ACC {
namespace Graphics {

AssemblyResult combineOutfitParts(const std::vector<std::shared_ptr<const AssetGeometry>>& parts,
                                  const std::string& name) {
    AssemblyResult result;

    if (parts.empty()) {
        result.error = "no parts to assemble";
        return result;
    }

    auto combined = std::make_shared<AssetGeometry>();
    combined->name = name;

    // Shared skeleton comes from the first rigged part
    for (const auto& part : parts) {
        if (part && part->hasSkeleton()) {
            combined->joints = part->joints;
            LOG_DEBUG(MOD_GLTF, "{}: using skeleton of '{}' ({} joints)",
                      name, part->name, combined->joints.size());
            break;
        }
    }

    for (const auto& part : parts) {
        if (!part) {
            result.error = "missing part geometry";
            return result;
        }

        // Part joint index -> shared joint index
        std::vector<uint16_t> jointRemap(part->joints.size(), 0);
        for (size_t j = 0; j < part->joints.size(); j++) {
            int shared = combined->findJoint(part->joints[j].name);
            if (shared < 0) {
                result.error = fmt::format("armature mismatch: joint '{}' of '{}' is not in the shared skeleton",
                                           part->joints[j].name, part->name);
                return result;
            }
            jointRemap[j] = static_cast<uint16_t>(shared);
        }

        const int materialOffset = static_cast<int>(combined->materials.size());
        combined->materials.insert(combined->materials.end(),
                                   part->materials.begin(), part->materials.end());

        for (const auto& mesh : part->meshes) {
            if (mesh.vertices.empty() || mesh.indices.empty()) {
                continue;
            }

            AssetMesh merged = mesh;
            merged.name = mesh.name.empty() ? part->name : part->name + "_" + mesh.name;
            if (mesh.materialIndex >= 0) {
                merged.materialIndex = mesh.materialIndex + materialOffset;
            }

            if (merged.skinned) {
                for (auto& v : merged.vertices) {
                    for (size_t k = 0; k < kMaxInfluences; k++) {
                        if (v.weights[k] > 0.0f && v.joints[k] < jointRemap.size()) {
                            v.joints[k] = jointRemap[v.joints[k]];
                        } else {
                            v.joints[k] = 0;
                        }
                    }
                }
            }
            combined->meshes.push_back(std::move(merged));
        }
    }

    if (combined->meshes.empty()) {
        result.error = "assembled outfit has no geometry";
        return result;
    }

    LOG_DEBUG(MOD_GLTF, "{}: {} meshes, {} vertices, {} triangles, {} materials",
              name, combined->meshes.size(), combined->vertexCount(),
              combined->triangleCount(), combined->materials.size());
    result.geometry = std::move(combined);
    return result;
}

} // namespace Graphics
} // namespace ACC
