#include "combiner/graphics/glb_writer.h"
#include "combiner/graphics/assimp_convert.h"
#include "common/logging.h"
#include "common/util/file.h"

#include <assimp/Exporter.hpp>
#include <assimp/material.h>

#include <algorithm>
#include <cstring>
#include <map>
#include <vector>

namespace ACC {
namespace Graphics {

namespace {

std::string validateGeometry(const AssetGeometry& geometry) {
    for (size_t i = 0; i < geometry.joints.size(); i++) {
        // Parents precede their children
        if (geometry.joints[i].parent >= static_cast<int>(i)) {
            return fmt::format("joint '{}' has invalid parent {}",
                               geometry.joints[i].name, geometry.joints[i].parent);
        }
    }

    size_t writable = 0;
    for (const auto& mesh : geometry.meshes) {
        if (mesh.vertices.empty() || mesh.indices.empty()) {
            continue;
        }
        if (mesh.indices.size() % 3 != 0) {
            return fmt::format("mesh '{}' index count {} is not a triangle list",
                               mesh.name, mesh.indices.size());
        }
        for (uint32_t index : mesh.indices) {
            if (index >= mesh.vertices.size()) {
                return fmt::format("mesh '{}' references vertex {} of {}",
                                   mesh.name, index, mesh.vertices.size());
            }
        }
        if (mesh.materialIndex >= static_cast<int>(geometry.materials.size())) {
            return fmt::format("mesh '{}' references missing material {}", mesh.name, mesh.materialIndex);
        }
        writable++;
    }

    if (writable == 0) {
        return fmt::format("'{}' has no geometry to write", geometry.name);
    }
    return {};
}

void attachChildren(aiNode* parent, const std::vector<aiNode*>& children) {
    if (children.empty()) {
        return;
    }
    parent->mNumChildren = static_cast<unsigned int>(children.size());
    parent->mChildren = new aiNode*[children.size()];
    for (size_t i = 0; i < children.size(); i++) {
        children[i]->mParent = parent;
        parent->mChildren[i] = children[i];
    }
}

aiMaterial* makeMaterial(const AssetMaterial& material) {
    auto* out = new aiMaterial();

    aiString name(material.name);
    out->AddProperty(&name, AI_MATKEY_NAME);

    aiColor4D color(material.baseColor.r, material.baseColor.g, material.baseColor.b, material.baseColor.a);
    out->AddProperty(&color, 1, AI_MATKEY_COLOR_DIFFUSE);

    int twoSided = material.doubleSided ? 1 : 0;
    out->AddProperty(&twoSided, 1, AI_MATKEY_TWOSIDED);
    return out;
}

aiTexture* makeTexture(const AssetMaterial& material) {
    auto* texture = new aiTexture();
    const size_t size = material.imageData.size();

    // Compressed image: mHeight 0, mWidth holds the byte count
    texture->mWidth = static_cast<unsigned int>(size);
    texture->mHeight = 0;
    texture->pcData = new aiTexel[(size + sizeof(aiTexel) - 1) / sizeof(aiTexel)];
    std::memcpy(texture->pcData, material.imageData.data(), size);

    const char* hint = material.mimeType == "image/jpeg" ? "jpg" : "png";
    std::strncpy(texture->achFormatHint, hint, HINTMAXTEXTURELEN - 1);
    texture->mFilename = aiString(fs::path(material.textureName).filename().string());
    return texture;
}

void addBones(const AssetMesh& mesh, const AssetGeometry& geometry, aiMesh* out) {
    std::vector<std::vector<aiVertexWeight>> weights(geometry.joints.size());
    for (size_t i = 0; i < mesh.vertices.size(); i++) {
        AssetVertex vertex = mesh.vertices[i];
        normalizeInfluences(vertex);
        for (size_t k = 0; k < kMaxInfluences; k++) {
            if (vertex.weights[k] > 0.0f && vertex.joints[k] < geometry.joints.size()) {
                weights[vertex.joints[k]].emplace_back(static_cast<unsigned int>(i), vertex.weights[k]);
            }
        }
    }

    unsigned int used = 0;
    for (const auto& list : weights) {
        if (!list.empty()) {
            used++;
        }
    }
    if (used == 0) {
        return;
    }

    out->mBones = new aiBone*[used];
    for (size_t j = 0; j < weights.size(); j++) {
        if (weights[j].empty()) {
            continue;
        }
        auto* bone = new aiBone();
        out->mBones[out->mNumBones++] = bone;
        bone->mName = aiString(geometry.joints[j].name);
        bone->mOffsetMatrix = toAssimp(geometry.joints[j].inverseBindMatrix);
        bone->mNumWeights = static_cast<unsigned int>(weights[j].size());
        bone->mWeights = new aiVertexWeight[weights[j].size()];
        std::copy(weights[j].begin(), weights[j].end(), bone->mWeights);
    }
}

aiMesh* makeMesh(const AssetMesh& mesh, const AssetGeometry& geometry, unsigned int materialIndex) {
    auto* out = new aiMesh();
    out->mName = aiString(mesh.name);
    out->mPrimitiveTypes = aiPrimitiveType_TRIANGLE;
    out->mMaterialIndex = materialIndex;

    const size_t n = mesh.vertices.size();
    out->mNumVertices = static_cast<unsigned int>(n);
    out->mVertices = new aiVector3D[n];
    out->mNormals = new aiVector3D[n];
    out->mTextureCoords[0] = new aiVector3D[n];
    out->mNumUVComponents[0] = 2;
    for (size_t i = 0; i < n; i++) {
        const AssetVertex& v = mesh.vertices[i];
        out->mVertices[i] = toAssimp(v.position);
        out->mNormals[i] = toAssimp(v.normal);
        out->mTextureCoords[0][i] = aiVector3D(v.uv.x, v.uv.y, 0.0f);
    }

    const size_t faces = mesh.indices.size() / 3;
    out->mNumFaces = static_cast<unsigned int>(faces);
    out->mFaces = new aiFace[faces];
    for (size_t f = 0; f < faces; f++) {
        aiFace& face = out->mFaces[f];
        face.mNumIndices = 3;
        face.mIndices = new unsigned int[3];
        for (size_t k = 0; k < 3; k++) {
            face.mIndices[k] = mesh.indices[f * 3 + k];
        }
    }

    if (mesh.skinned && geometry.hasSkeleton()) {
        addBones(mesh, geometry, out);
    }
    return out;
}

} // namespace

std::unique_ptr<aiScene> GlbWriter::toScene(const AssetGeometry& geometry, std::string& error) {
    error = validateGeometry(geometry);
    if (!error.empty()) {
        return nullptr;
    }

    auto scene = std::make_unique<aiScene>();
    scene->mFlags = AI_SCENE_FLAGS_NON_VERBOSE_FORMAT;
    scene->mRootNode = new aiNode(geometry.name);

    bool needsDefaultMaterial = geometry.materials.empty();
    for (const auto& mesh : geometry.meshes) {
        if (mesh.materialIndex < 0) {
            needsDefaultMaterial = true;
        }
    }

    // Counts grow as entries are added so the scene owns everything allocated so far
    const size_t materialCount = geometry.materials.size() + (needsDefaultMaterial ? 1 : 0);
    scene->mMaterials = new aiMaterial*[materialCount];
    if (!geometry.materials.empty()) {
        scene->mTextures = new aiTexture*[geometry.materials.size()];
    }

    // Materials that use the same texture share one embedded image
    std::map<std::string, unsigned int> textureByName;
    for (const auto& material : geometry.materials) {
        aiMaterial* out = makeMaterial(material);
        scene->mMaterials[scene->mNumMaterials++] = out;

        if (material.imageData.empty()) {
            continue;
        }
        const std::string key = material.textureName.empty() ? material.name : material.textureName;
        auto it = textureByName.find(key);
        if (it == textureByName.end()) {
            scene->mTextures[scene->mNumTextures] = makeTexture(material);
            it = textureByName.emplace(key, scene->mNumTextures++).first;
        }
        // "*N" names scene->mTextures[N]
        aiString reference(fmt::format("*{}", it->second));
        out->AddProperty(&reference, AI_MATKEY_TEXTURE_DIFFUSE(0));
    }

    unsigned int defaultMaterial = 0;
    if (needsDefaultMaterial) {
        AssetMaterial plain;
        plain.name = "default";
        defaultMaterial = scene->mNumMaterials;
        scene->mMaterials[scene->mNumMaterials++] = makeMaterial(plain);
    }

    std::vector<aiNode*> rootChildren;

    // Joint hierarchy
    std::vector<aiNode*> jointNodes;
    std::vector<std::vector<aiNode*>> jointChildren(geometry.joints.size());
    for (const auto& joint : geometry.joints) {
        auto* node = new aiNode(joint.name);
        node->mTransformation = toAssimp(joint.localMatrix);
        jointNodes.push_back(node);
    }
    for (size_t i = 0; i < geometry.joints.size(); i++) {
        int parent = geometry.joints[i].parent;
        if (parent < 0) {
            rootChildren.push_back(jointNodes[i]);
        } else {
            jointChildren[parent].push_back(jointNodes[i]);
        }
    }
    for (size_t i = 0; i < jointNodes.size(); i++) {
        attachChildren(jointNodes[i], jointChildren[i]);
    }

    // One node per mesh
    scene->mMeshes = new aiMesh*[geometry.meshes.size()];
    for (const auto& mesh : geometry.meshes) {
        if (mesh.vertices.empty() || mesh.indices.empty()) {
            LOG_WARN(MOD_GLTF, "{}: skipping empty mesh '{}'", geometry.name, mesh.name);
            continue;
        }
        const unsigned int meshIndex = scene->mNumMeshes;
        const unsigned int materialIndex = mesh.materialIndex >= 0
            ? static_cast<unsigned int>(mesh.materialIndex) : defaultMaterial;
        scene->mMeshes[scene->mNumMeshes++] = makeMesh(mesh, geometry, materialIndex);

        auto* node = new aiNode(mesh.name);
        node->mNumMeshes = 1;
        node->mMeshes = new unsigned int[1];
        node->mMeshes[0] = meshIndex;
        rootChildren.push_back(node);
    }

    attachChildren(scene->mRootNode, rootChildren);
    return scene;
}

bool GlbWriter::write(const AssetGeometry& geometry, const std::string& path, std::string& error) {
    std::unique_ptr<aiScene> scene = toScene(geometry, error);
    if (!scene) {
        return false;
    }

    Assimp::Exporter exporter;
    if (exporter.Export(scene.get(), kGlbFormatId, path.c_str()) != aiReturn_SUCCESS) {
        error = fmt::format("cannot write {}: {}", path, exporter.GetErrorString());
        LOG_ERROR(MOD_GLTF, "{}", error);
        return false;
    }

    LOG_DEBUG(MOD_GLTF, "{}: wrote {} ({} meshes, {} joints, {} textures)", geometry.name, path,
              scene->mNumMeshes, geometry.joints.size(), scene->mNumTextures);
    return true;
}

} // namespace Graphics
} // namespace ACC
