#include "combiner/graphics/assimp_importer.h"
#include "combiner/graphics/assimp_convert.h"
#include "common/logging.h"
#include "common/util/strings.h"

#include <assimp/Importer.hpp>
#include <assimp/config.h>
#include <assimp/postprocess.h>
#include <assimp/scene.h>

#include <functional>
#include <limits>
#include <set>
#include <utility>

namespace ACC {
namespace Graphics {

namespace {

constexpr unsigned int kImportFlags =
    aiProcess_Triangulate |
    aiProcess_JoinIdenticalVertices |
    aiProcess_GenSmoothNormals |
    aiProcess_LimitBoneWeights |
    aiProcess_SortByPType;

} // namespace

AssimpMeshImporter::AssimpMeshImporter(TextureEncoder* encoder)
    : encoder_(encoder) {
}

std::shared_ptr<AssetGeometry> AssimpMeshImporter::load(const std::string& path, std::string& error) {
    if (!File::Exists(path)) {
        error = fmt::format("file not found: {}", path);
        return nullptr;
    }

    Assimp::Importer importer;
    importer.SetPropertyInteger(AI_CONFIG_PP_LBW_MAX_WEIGHTS, static_cast<int>(kMaxInfluences));
    importer.SetPropertyInteger(AI_CONFIG_PP_SBP_REMOVE, aiPrimitiveType_POINT | aiPrimitiveType_LINE);

    const aiScene* scene = importer.ReadFile(path, kImportFlags);
    if (!scene || (scene->mFlags & AI_SCENE_FLAGS_INCOMPLETE) || !scene->mRootNode) {
        error = fmt::format("cannot import {}: {}", path, importer.GetErrorString());
        return nullptr;
    }

    auto geometry = std::make_shared<AssetGeometry>();
    geometry->name = fs::path(path).stem().string();

    SceneContext ctx;
    ctx.scene = scene;
    ctx.path = path;
    ctx.directory = fs::path(path).parent_path();

    convertSkeleton(ctx, *geometry);
    if (geometry->joints.size() > std::numeric_limits<uint16_t>::max()) {
        error = fmt::format("{} has {} joints, more than a skin can address", path, geometry->joints.size());
        return nullptr;
    }

    bool converted = true;
    std::function<void(const aiNode*, const glm::mat4&)> visit =
        [&](const aiNode* node, const glm::mat4& parentTransform) {
        const glm::mat4 transform = parentTransform * toGlm(node->mTransformation);
        for (unsigned int i = 0; converted && i < node->mNumMeshes; i++) {
            converted = convertMesh(ctx, scene->mMeshes[node->mMeshes[i]], transform, *geometry, error);
        }
        for (unsigned int c = 0; converted && c < node->mNumChildren; c++) {
            visit(node->mChildren[c], transform);
        }
    };
    visit(scene->mRootNode, glm::mat4(1.0f));

    if (!converted) {
        return nullptr;
    }
    if (geometry->meshes.empty()) {
        error = fmt::format("no triangle meshes in {}", path);
        return nullptr;
    }

    LOG_DEBUG(MOD_GRAPHICS_LOAD, "{}: {} meshes, {} vertices, {} triangles, {} joints, {} materials",
              path, geometry->meshes.size(), geometry->vertexCount(), geometry->triangleCount(),
              geometry->joints.size(), geometry->materials.size());
    return geometry;
}

void AssimpMeshImporter::convertSkeleton(SceneContext& ctx, AssetGeometry& geometry) {
    const aiScene* scene = ctx.scene;

    // Bones referenced by skinned meshes define the skeleton
    std::set<std::string> boneNames;
    for (unsigned int m = 0; m < scene->mNumMeshes; m++) {
        const aiMesh* mesh = scene->mMeshes[m];
        for (unsigned int b = 0; b < mesh->mNumBones; b++) {
            boneNames.insert(mesh->mBones[b]->mName.C_Str());
        }
    }
    if (boneNames.empty()) {
        return;
    }

    std::map<const aiNode*, bool> leadsToBone;
    std::function<bool(const aiNode*)> markBones = [&](const aiNode* node) {
        bool found = boneNames.count(node->mName.C_Str()) > 0;
        for (unsigned int c = 0; c < node->mNumChildren; c++) {
            if (markBones(node->mChildren[c])) {
                found = true;
            }
        }
        leadsToBone[node] = found;
        return found;
    };
    markBones(scene->mRootNode);

    // Nodes between two bones become joints so parents stay connected.
    // Transforms of nodes above the first joint fold into that joint.
    std::vector<glm::mat4> globals;
    std::function<void(const aiNode*, int, const glm::mat4&)> visit =
        [&](const aiNode* node, int parent, const glm::mat4& accumulated) {
        const std::string name = node->mName.C_Str();
        const glm::mat4 local = toGlm(node->mTransformation);
        bool isJoint = boneNames.count(name) > 0 || (parent >= 0 && leadsToBone[node]);

        if (isJoint && ctx.jointIndex.count(name)) {
            LOG_WARN(MOD_GRAPHICS_LOAD, "{}: duplicate joint name '{}' ignored", ctx.path, name);
            isJoint = false;
        }
        if (!isJoint) {
            for (unsigned int c = 0; c < node->mNumChildren; c++) {
                visit(node->mChildren[c], parent, accumulated * local);
            }
            return;
        }

        AssetJoint joint;
        joint.name = name;
        joint.parent = parent;
        joint.localMatrix = parent < 0 ? accumulated * local : local;
        const glm::mat4 global = parent < 0 ? joint.localMatrix : globals[parent] * local;
        joint.inverseBindMatrix = glm::inverse(global);

        const int index = static_cast<int>(geometry.joints.size());
        ctx.jointIndex[name] = index;
        geometry.joints.push_back(std::move(joint));
        globals.push_back(global);

        for (unsigned int c = 0; c < node->mNumChildren; c++) {
            visit(node->mChildren[c], index, glm::mat4(1.0f));
        }
    };
    visit(scene->mRootNode, -1, glm::mat4(1.0f));

    ctx.jointBound.assign(geometry.joints.size(), false);
    LOG_TRACE(MOD_GRAPHICS_LOAD, "{}: {} bones, {} joints", ctx.path, boneNames.size(), geometry.joints.size());
}

bool AssimpMeshImporter::convertMesh(SceneContext& ctx, const aiMesh* mesh, const glm::mat4& transform,
                                     AssetGeometry& geometry, std::string& error) {
    if (mesh->mNumVertices == 0 || mesh->mNumFaces == 0) {
        return true;
    }
    if (mesh->mPrimitiveTypes != aiPrimitiveType_TRIANGLE) {
        LOG_DEBUG(MOD_GRAPHICS_LOAD, "{}: skipping non-triangle mesh '{}'", ctx.path, mesh->mName.C_Str());
        return true;
    }

    AssetMesh out;
    out.name = mesh->mName.length > 0 ? std::string(mesh->mName.C_Str())
                                      : fmt::format("{}_{}", geometry.name, geometry.meshes.size());

    const glm::mat3 normalMatrix = glm::transpose(glm::inverse(glm::mat3(transform)));
    out.vertices.resize(mesh->mNumVertices);
    for (unsigned int i = 0; i < mesh->mNumVertices; i++) {
        AssetVertex& v = out.vertices[i];
        v.position = glm::vec3(transform * glm::vec4(toGlm(mesh->mVertices[i]), 1.0f));
        if (mesh->HasNormals()) {
            glm::vec3 normal = normalMatrix * toGlm(mesh->mNormals[i]);
            float length = glm::length(normal);
            if (length > 0.0f) {
                v.normal = normal / length;
            }
        }
        if (mesh->HasTextureCoords(0)) {
            v.uv = glm::vec2(mesh->mTextureCoords[0][i].x, mesh->mTextureCoords[0][i].y);
        }
    }

    out.indices.reserve(static_cast<size_t>(mesh->mNumFaces) * 3);
    for (unsigned int f = 0; f < mesh->mNumFaces; f++) {
        const aiFace& face = mesh->mFaces[f];
        if (face.mNumIndices != 3) {
            continue;
        }
        out.indices.insert(out.indices.end(), {face.mIndices[0], face.mIndices[1], face.mIndices[2]});
    }
    if (out.indices.empty()) {
        return true;
    }

    // A mirroring node transform reverses the winding
    if (glm::determinant(glm::mat3(transform)) < 0.0f) {
        for (size_t i = 0; i + 2 < out.indices.size(); i += 3) {
            std::swap(out.indices[i + 1], out.indices[i + 2]);
        }
    }

    if (mesh->HasBones() && geometry.hasSkeleton()) {
        // Offset matrices map mesh space to bone space; vertices are now in scene space
        const glm::mat4 sceneToMesh = glm::inverse(transform);
        for (unsigned int b = 0; b < mesh->mNumBones; b++) {
            const aiBone* bone = mesh->mBones[b];
            auto it = ctx.jointIndex.find(bone->mName.C_Str());
            if (it == ctx.jointIndex.end()) {
                error = fmt::format("{}: bone '{}' of mesh '{}' has no node",
                                    ctx.path, bone->mName.C_Str(), out.name);
                return false;
            }
            const int joint = it->second;
            if (!ctx.jointBound[joint]) {
                geometry.joints[joint].inverseBindMatrix = toGlm(bone->mOffsetMatrix) * sceneToMesh;
                ctx.jointBound[joint] = true;
            }
            for (unsigned int w = 0; w < bone->mNumWeights; w++) {
                const aiVertexWeight& weight = bone->mWeights[w];
                if (weight.mVertexId < out.vertices.size()) {
                    addInfluence(out.vertices[weight.mVertexId], static_cast<uint16_t>(joint), weight.mWeight);
                }
            }
        }
        for (auto& v : out.vertices) {
            normalizeInfluences(v);
        }
        out.skinned = true;
    }

    out.materialIndex = convertMaterial(ctx, mesh->mMaterialIndex, geometry);
    geometry.meshes.push_back(std::move(out));
    return true;
}

int AssimpMeshImporter::convertMaterial(SceneContext& ctx, unsigned int index, AssetGeometry& geometry) {
    if (index >= ctx.scene->mNumMaterials) {
        return -1;
    }
    auto it = ctx.materialIndex.find(index);
    if (it != ctx.materialIndex.end()) {
        return it->second;
    }

    const aiMaterial* source = ctx.scene->mMaterials[index];
    AssetMaterial material;

    aiString name;
    if (source->Get(AI_MATKEY_NAME, name) == AI_SUCCESS && name.length > 0) {
        material.name = name.C_Str();
    } else {
        material.name = fmt::format("{}_mat{}", geometry.name, geometry.materials.size());
    }

    aiColor4D diffuse;
    if (source->Get(AI_MATKEY_COLOR_DIFFUSE, diffuse) == AI_SUCCESS) {
        material.baseColor = glm::vec4(diffuse.r, diffuse.g, diffuse.b, diffuse.a);
    }

    int twoSided = 0;
    if (source->Get(AI_MATKEY_TWOSIDED, twoSided) == AI_SUCCESS) {
        material.doubleSided = twoSided != 0;
    }

    aiString texture;
    if (source->GetTexture(aiTextureType_DIFFUSE, 0, &texture) == AI_SUCCESS ||
        source->GetTexture(aiTextureType_BASE_COLOR, 0, &texture) == AI_SUCCESS) {
        std::string error;
        if (!loadTexture(ctx, texture.C_Str(), material, error)) {
            LOG_WARN(MOD_GRAPHICS_LOAD, "{}: texture of '{}' left out: {}", ctx.path, material.name, error);
            material.textureName.clear();
            material.imageData.clear();
            material.mimeType.clear();
        }
    }

    const int converted = static_cast<int>(geometry.materials.size());
    geometry.materials.push_back(std::move(material));
    ctx.materialIndex[index] = converted;
    return converted;
}

bool AssimpMeshImporter::loadTexture(SceneContext& ctx, const std::string& reference,
                                     AssetMaterial& material, std::string& error) {
    if (const aiTexture* embedded = ctx.scene->GetEmbeddedTexture(reference.c_str())) {
        material.textureName = fmt::format("{}#{}", ctx.path, reference);

        if (embedded->mHeight == 0) {
            // Compressed file data, mWidth bytes long
            std::string data(reinterpret_cast<const char*>(embedded->pcData), embedded->mWidth);
            std::string mime = embeddableMimeType(data);
            if (!mime.empty()) {
                material.imageData = std::move(data);
                material.mimeType = mime;
                return true;
            }
            if (!encoder_) {
                error = fmt::format("cannot embed '{}' data without an image encoder", embedded->achFormatHint);
                return false;
            }
            if (!encoder_->encodeData(data, fmt::format("embedded.{}", embedded->achFormatHint),
                                      material.imageData, error)) {
                return false;
            }
        } else {
            if (!encoder_) {
                error = "cannot embed raw texels without an image encoder";
                return false;
            }
            if (!encoder_->encodePixels(reinterpret_cast<const uint8_t*>(embedded->pcData),
                                        embedded->mWidth, embedded->mHeight, material.imageData, error)) {
                return false;
            }
        }
        material.mimeType = "image/png";
        return true;
    }

    // Stored paths are often absolute paths from the authoring machine
    fs::path stored(Strings::Replace(reference, "\\", "/"));
    std::vector<fs::path> candidates;
    candidates.push_back(stored.is_absolute() ? stored : ctx.directory / stored);
    candidates.push_back(ctx.directory / stored.filename());

    std::string resolved;
    for (const auto& candidate : candidates) {
        if (File::Exists(candidate.string()) && !File::IsDirectory(candidate.string())) {
            resolved = candidate.string();
            break;
        }
    }
    if (resolved.empty()) {
        error = fmt::format("'{}' not found", reference);
        return false;
    }
    material.textureName = resolved;

    FileContentsResult contents = File::GetContents(resolved);
    if (!contents.error.empty()) {
        error = contents.error;
        return false;
    }

    std::string mime = embeddableMimeType(contents.contents);
    if (!mime.empty()) {
        material.imageData = std::move(contents.contents);
        material.mimeType = mime;
        return true;
    }
    if (!encoder_) {
        error = fmt::format("cannot embed {} without an image encoder", resolved);
        return false;
    }
    if (!encoder_->encodeFile(resolved, material.imageData, error)) {
        return false;
    }
    material.mimeType = "image/png";
    return true;
}

} // namespace Graphics
} // namespace ACC
