#include <gtest/gtest.h>
#include "combiner/graphics/glb_writer.h"
#include "common/util/random.h"

#include <assimp/Importer.hpp>
#include <assimp/material.h>
#include <assimp/scene.h>
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <vector>

using namespace ACC::Graphics;

class GlbWriterTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : written_) {
            std::filesystem::remove(path);
        }
    }

    std::filesystem::path tempPath() {
        std::filesystem::path path = std::filesystem::temp_directory_path() /
            fmt::format("acc_glb_{:016x}.glb", random_.Index(0, UINT64_MAX));
        written_.push_back(path);
        return path;
    }

    // Writes the geometry and reads it back through assimp's glTF 2.0 importer
    const aiScene* roundTrip(const AssetGeometry& geometry) {
        std::filesystem::path path = tempPath();
        std::string error;
        EXPECT_TRUE(GlbWriter::write(geometry, path.string(), error)) << error;
        const aiScene* scene = importer_.ReadFile(path.string(), 0);
        EXPECT_NE(scene, nullptr) << importer_.GetErrorString();
        return scene;
    }

    static const aiBone* findBone(const aiMesh* mesh, const std::string& name) {
        for (unsigned int i = 0; i < mesh->mNumBones; i++) {
            if (name == mesh->mBones[i]->mName.C_Str()) {
                return mesh->mBones[i];
            }
        }
        return nullptr;
    }

    static AssetGeometry triangle(bool skinned) {
        AssetGeometry geometry;
        geometry.name = "set-f-0123456789abcdef";

        if (skinned) {
            AssetJoint root;
            root.name = "hips";
            AssetJoint child;
            child.name = "spine";
            child.parent = 0;
            child.localMatrix[3] = glm::vec4(0.0f, 1.0f, 0.0f, 1.0f);
            child.inverseBindMatrix[3] = glm::vec4(0.0f, -1.0f, 0.0f, 1.0f);
            geometry.joints = {root, child};
        }

        AssetMaterial material;
        material.name = "cloth";
        material.baseColor = glm::vec4(0.5f, 0.25f, 1.0f, 1.0f);
        geometry.materials.push_back(material);

        AssetMesh mesh;
        mesh.name = "body_mesh";
        mesh.materialIndex = 0;
        mesh.skinned = skinned;
        for (int i = 0; i < 3; i++) {
            AssetVertex v;
            v.position = glm::vec3(i == 1 ? 1.0f : 0.0f, i == 2 ? 2.0f : 0.0f, -0.5f);
            v.uv = glm::vec2(0.5f * i, 0.0f);
            if (skinned) {
                addInfluence(v, static_cast<uint16_t>(i % 2), 2.0f);
            }
            mesh.vertices.push_back(v);
        }
        mesh.indices = {0, 1, 2};
        geometry.meshes.push_back(mesh);
        return geometry;
    }

    Assimp::Importer importer_;
    ACC::Random random_;
    std::vector<std::filesystem::path> written_;
};

TEST_F(GlbWriterTest, WritesBinaryGltf) {
    std::filesystem::path path = tempPath();
    std::string error;
    ASSERT_TRUE(GlbWriter::write(triangle(false), path.string(), error)) << error;

    std::ifstream in(path, std::ios::binary);
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    ASSERT_GE(data.size(), 12u);
    EXPECT_EQ(data.substr(0, 4), "glTF");
}

TEST_F(GlbWriterTest, StaticMeshReadsBack) {
    const aiScene* scene = roundTrip(triangle(false));
    ASSERT_NE(scene, nullptr);

    ASSERT_EQ(scene->mNumMeshes, 1u);
    const aiMesh* mesh = scene->mMeshes[0];
    EXPECT_EQ(mesh->mNumFaces, 1u);
    EXPECT_EQ(mesh->mNumVertices, 3u);
    EXPECT_EQ(mesh->mNumBones, 0u);
    ASSERT_TRUE(mesh->HasTextureCoords(0));
    EXPECT_FLOAT_EQ(mesh->mTextureCoords[0][1].x, 0.5f);
    EXPECT_FLOAT_EQ(mesh->mVertices[2].y, 2.0f);
    EXPECT_FLOAT_EQ(mesh->mVertices[2].z, -0.5f);

    ASSERT_LT(mesh->mMaterialIndex, scene->mNumMaterials);
    aiColor4D color;
    ASSERT_EQ(scene->mMaterials[mesh->mMaterialIndex]->Get(AI_MATKEY_COLOR_DIFFUSE, color), AI_SUCCESS);
    EXPECT_FLOAT_EQ(color.g, 0.25f);
    EXPECT_FLOAT_EQ(color.b, 1.0f);
}

TEST_F(GlbWriterTest, SkinnedMeshReadsBack) {
    const aiScene* scene = roundTrip(triangle(true));
    ASSERT_NE(scene, nullptr);

    const aiNode* hips = scene->mRootNode->FindNode("hips");
    ASSERT_NE(hips, nullptr);
    ASSERT_EQ(hips->mNumChildren, 1u);
    EXPECT_STREQ(hips->mChildren[0]->mName.C_Str(), "spine");
    EXPECT_FLOAT_EQ(hips->mChildren[0]->mTransformation.b4, 1.0f);

    ASSERT_EQ(scene->mNumMeshes, 1u);
    const aiMesh* mesh = scene->mMeshes[0];
    const aiBone* hipsBone = findBone(mesh, "hips");
    const aiBone* spineBone = findBone(mesh, "spine");
    ASSERT_NE(hipsBone, nullptr);
    ASSERT_NE(spineBone, nullptr);
    EXPECT_FLOAT_EQ(spineBone->mOffsetMatrix.b4, -1.0f);

    // Vertices 0 and 2 bind to hips, vertex 1 to spine, each with full weight
    ASSERT_EQ(hipsBone->mNumWeights, 2u);
    ASSERT_EQ(spineBone->mNumWeights, 1u);
    EXPECT_EQ(spineBone->mWeights[0].mVertexId, 1u);
    EXPECT_FLOAT_EQ(spineBone->mWeights[0].mWeight, 1.0f);
    EXPECT_FLOAT_EQ(hipsBone->mWeights[0].mWeight, 1.0f);
}

TEST_F(GlbWriterTest, TexturesSharedBetweenMaterials) {
    AssetGeometry geometry = triangle(false);
    geometry.materials[0].textureName = "/tex/cloth.png";
    geometry.materials[0].imageData = std::string("\x89PNG\r\n\x1a\n", 8) + "pixels";
    geometry.materials[0].mimeType = "image/png";

    AssetMaterial copy = geometry.materials[0];
    copy.name = "cloth_copy";
    geometry.materials.push_back(copy);

    AssetMesh second = geometry.meshes[0];
    second.name = "top_mesh";
    second.materialIndex = 1;
    geometry.meshes.push_back(second);

    std::string error;
    std::unique_ptr<aiScene> converted = GlbWriter::toScene(geometry, error);
    ASSERT_NE(converted, nullptr) << error;
    EXPECT_EQ(converted->mNumTextures, 1u);
    EXPECT_EQ(converted->mNumMaterials, 2u);

    const aiScene* scene = roundTrip(geometry);
    ASSERT_NE(scene, nullptr);
    ASSERT_EQ(scene->mNumMeshes, 2u);
    ASSERT_EQ(scene->mNumTextures, 1u);

    const aiTexture* texture = scene->mTextures[0];
    EXPECT_EQ(texture->mHeight, 0u);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(texture->pcData), texture->mWidth),
              geometry.materials[0].imageData);

    for (unsigned int i = 0; i < scene->mNumMeshes; i++) {
        aiString reference;
        ASSERT_EQ(scene->mMaterials[scene->mMeshes[i]->mMaterialIndex]->GetTexture(
                      aiTextureType_DIFFUSE, 0, &reference), AI_SUCCESS);
        EXPECT_STREQ(reference.C_Str(), "*0");
    }
}

TEST_F(GlbWriterTest, MissingMaterialGetsDefault) {
    AssetGeometry geometry = triangle(false);
    geometry.materials.clear();
    geometry.meshes[0].materialIndex = -1;

    std::string error;
    std::unique_ptr<aiScene> scene = GlbWriter::toScene(geometry, error);
    ASSERT_NE(scene, nullptr) << error;
    ASSERT_EQ(scene->mNumMaterials, 1u);
    EXPECT_EQ(scene->mMeshes[0]->mMaterialIndex, 0u);
}

TEST_F(GlbWriterTest, RejectsBadGeometry) {
    std::string error;

    AssetGeometry empty;
    empty.name = "empty";
    EXPECT_EQ(GlbWriter::toScene(empty, error), nullptr);
    EXPECT_FALSE(error.empty());

    AssetGeometry badIndex = triangle(false);
    badIndex.meshes[0].indices = {0, 1, 7};
    error.clear();
    EXPECT_EQ(GlbWriter::toScene(badIndex, error), nullptr);
    EXPECT_NE(error.find("vertex 7"), std::string::npos);

    AssetGeometry badMaterial = triangle(false);
    badMaterial.meshes[0].materialIndex = 4;
    error.clear();
    EXPECT_EQ(GlbWriter::toScene(badMaterial, error), nullptr);
    EXPECT_FALSE(error.empty());

    AssetGeometry badParent = triangle(true);
    badParent.joints[0].parent = 1;
    error.clear();
    EXPECT_FALSE(GlbWriter::write(badParent, tempPath().string(), error));
    EXPECT_NE(error.find("invalid parent"), std::string::npos);
}
