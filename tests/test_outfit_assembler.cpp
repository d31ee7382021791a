#include <gtest/gtest.h>
#include "combiner/graphics/outfit_assembler.h"

using namespace ACC::Graphics;

class OutfitAssemblerTest : public ::testing::Test {
protected:
    // One triangle, every vertex bound to the named joint
    static std::shared_ptr<AssetGeometry> makePart(const std::string& name,
                                                   const std::vector<std::string>& jointNames,
                                                   size_t boundJoint) {
        auto geometry = std::make_shared<AssetGeometry>();
        geometry->name = name;

        for (size_t i = 0; i < jointNames.size(); i++) {
            AssetJoint joint;
            joint.name = jointNames[i];
            joint.parent = i == 0 ? -1 : 0;
            geometry->joints.push_back(joint);
        }

        AssetMaterial material;
        material.name = name + "_mat";
        geometry->materials.push_back(material);

        AssetMesh mesh;
        mesh.name = "mesh";
        mesh.materialIndex = 0;
        mesh.skinned = !jointNames.empty();
        for (int i = 0; i < 3; i++) {
            AssetVertex v;
            v.position = glm::vec3(static_cast<float>(i), 0.0f, 0.0f);
            if (mesh.skinned) {
                addInfluence(v, static_cast<uint16_t>(boundJoint), 1.0f);
            }
            mesh.vertices.push_back(v);
        }
        mesh.indices = {0, 1, 2};
        geometry->meshes.push_back(mesh);
        return geometry;
    }
};

TEST_F(OutfitAssemblerTest, MergesMeshesAndMaterials) {
    auto body = makePart("body", {"hips", "spine", "head"}, 2);
    auto top = makePart("top", {"hips", "spine"}, 1);

    AssemblyResult result = combineOutfitParts({body, top}, "set-f-0000000000000000");
    ASSERT_TRUE(result.geometry) << result.error;

    const AssetGeometry& outfit = *result.geometry;
    EXPECT_EQ(outfit.name, "set-f-0000000000000000");
    EXPECT_EQ(outfit.joints.size(), 3u);
    ASSERT_EQ(outfit.meshes.size(), 2u);
    ASSERT_EQ(outfit.materials.size(), 2u);
    EXPECT_EQ(outfit.meshes[0].name, "body_mesh");
    EXPECT_EQ(outfit.meshes[1].name, "top_mesh");
    EXPECT_EQ(outfit.meshes[0].materialIndex, 0);
    EXPECT_EQ(outfit.meshes[1].materialIndex, 1);
    EXPECT_EQ(outfit.vertexCount(), 6u);
    EXPECT_EQ(outfit.triangleCount(), 2u);
}

TEST_F(OutfitAssemblerTest, RemapsJointsByName) {
    auto body = makePart("body", {"hips", "spine", "head"}, 0);
    // Same joints, different order: part joint 0 is "head"
    auto hat = makePart("hat", {"head", "hips"}, 0);

    AssemblyResult result = combineOutfitParts({body, hat}, "outfit");
    ASSERT_TRUE(result.geometry) << result.error;

    const AssetMesh& hatMesh = result.geometry->meshes[1];
    for (const auto& v : hatMesh.vertices) {
        EXPECT_EQ(v.joints[0], 2);
        EXPECT_FLOAT_EQ(v.weights[0], 1.0f);
    }
}

TEST_F(OutfitAssemblerTest, ArmatureMismatchFails) {
    auto body = makePart("body", {"hips", "spine"}, 0);
    auto wings = makePart("wings", {"hips", "wing_l"}, 1);

    AssemblyResult result = combineOutfitParts({body, wings}, "outfit");
    EXPECT_FALSE(result.geometry);
    EXPECT_NE(result.error.find("armature mismatch"), std::string::npos);
    EXPECT_NE(result.error.find("wing_l"), std::string::npos);
}

TEST_F(OutfitAssemblerTest, StaticPartsKeepNoSkin) {
    auto body = makePart("body", {"hips"}, 0);
    auto prop = makePart("prop", {}, 0);

    AssemblyResult result = combineOutfitParts({body, prop}, "outfit");
    ASSERT_TRUE(result.geometry) << result.error;
    EXPECT_TRUE(result.geometry->meshes[0].skinned);
    EXPECT_FALSE(result.geometry->meshes[1].skinned);
}

TEST_F(OutfitAssemblerTest, SkeletonFromFirstRiggedPart) {
    auto prop = makePart("prop", {}, 0);
    auto body = makePart("body", {"root", "hips"}, 1);

    AssemblyResult result = combineOutfitParts({prop, body}, "outfit");
    ASSERT_TRUE(result.geometry) << result.error;
    ASSERT_EQ(result.geometry->joints.size(), 2u);
    EXPECT_EQ(result.geometry->joints[0].name, "root");
}

TEST_F(OutfitAssemblerTest, EmptyMeshesSkipped) {
    auto body = makePart("body", {"hips"}, 0);
    body->meshes.push_back(AssetMesh{});

    AssemblyResult result = combineOutfitParts({body}, "outfit");
    ASSERT_TRUE(result.geometry);
    EXPECT_EQ(result.geometry->meshes.size(), 1u);
}

TEST_F(OutfitAssemblerTest, Errors) {
    EXPECT_EQ(combineOutfitParts({}, "outfit").error, "no parts to assemble");
    EXPECT_EQ(combineOutfitParts({nullptr}, "outfit").error, "missing part geometry");

    auto empty = std::make_shared<AssetGeometry>();
    empty->name = "empty";
    EXPECT_EQ(combineOutfitParts({empty}, "outfit").error, "assembled outfit has no geometry");
}

TEST_F(OutfitAssemblerTest, InfluencesKeepFourStrongest) {
    AssetVertex v;
    addInfluence(v, 1, 0.1f);
    addInfluence(v, 2, 0.4f);
    addInfluence(v, 3, 0.2f);
    addInfluence(v, 4, 0.3f);
    addInfluence(v, 5, 0.5f);  // replaces joint 1
    addInfluence(v, 6, 0.05f); // weaker than all, dropped

    float sum = 0.0f;
    for (size_t k = 0; k < kMaxInfluences; k++) {
        EXPECT_NE(v.joints[k], 1);
        EXPECT_NE(v.joints[k], 6);
        sum += v.weights[k];
    }
    EXPECT_FLOAT_EQ(sum, 1.4f);

    normalizeInfluences(v);
    EXPECT_FLOAT_EQ(v.weights.x + v.weights.y + v.weights.z + v.weights.w, 1.0f);
}

TEST_F(OutfitAssemblerTest, UnweightedVertexBindsToRoot) {
    AssetVertex v;
    normalizeInfluences(v);
    EXPECT_EQ(v.joints[0], 0);
    EXPECT_FLOAT_EQ(v.weights[0], 1.0f);
    EXPECT_FLOAT_EQ(v.weights[1], 0.0f);
}
