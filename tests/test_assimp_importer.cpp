#include <gtest/gtest.h>
#include "combiner/graphics/assimp_importer.h"
#include "combiner/graphics/glb_writer.h"
#include "combiner/graphics/texture_encoder.h"
#include "common/util/random.h"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>

using namespace ACC::Graphics;

namespace {

const std::string kPngSignature("\x89PNG\r\n\x1a\n", 8);

// 2x2 24-bit BMP, every pixel red
std::string redBmp() {
    std::string data;
    auto u16 = [&](uint16_t v) {
        data.push_back(static_cast<char>(v & 0xff));
        data.push_back(static_cast<char>(v >> 8));
    };
    auto u32 = [&](uint32_t v) {
        for (int i = 0; i < 4; i++) {
            data.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
        }
    };

    data += "BM";
    u32(70);
    u32(0);
    u32(54);
    u32(40);
    u32(2);
    u32(2);
    u16(1);
    u16(24);
    u32(0);
    u32(16);
    u32(2835);
    u32(2835);
    u32(0);
    u32(0);
    for (int row = 0; row < 2; row++) {
        for (int pixel = 0; pixel < 2; pixel++) {
            data += std::string("\x00\x00\xff", 3);
        }
        data.append(2, '\0');  // rows pad to 4 bytes
    }
    return data;
}

} // namespace

class AssimpImporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
            fmt::format("acc_import_{:016x}", random_.Index(0, UINT64_MAX));
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& contents) {
        std::filesystem::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path.string();
    }

    // Quad with one material, split into two triangles on import
    std::string writeQuadObj(const std::string& texture) {
        write("quad.mtl", fmt::format("newmtl red\nKd 1 0 0\nmap_Kd {}\n", texture));
        return write("quad.obj",
                     "mtllib quad.mtl\n"
                     "o quad\n"
                     "v 0 0 0\nv 1 0 0\nv 1 1 0\nv 0 1 0\n"
                     "vt 0 0\nvt 1 0\nvt 1 1\nvt 0 1\n"
                     "vn 0 0 1\n"
                     "usemtl red\n"
                     "f 1/1/1 2/2/1 3/3/1 4/4/1\n");
    }

    static AssetGeometry skinnedTriangle() {
        AssetGeometry geometry;
        geometry.name = "rig";

        AssetJoint hips;
        hips.name = "hips";
        AssetJoint spine;
        spine.name = "spine";
        spine.parent = 0;
        spine.localMatrix[3] = glm::vec4(0.0f, 1.0f, 0.0f, 1.0f);
        spine.inverseBindMatrix[3] = glm::vec4(0.0f, -1.0f, 0.0f, 1.0f);
        geometry.joints = {hips, spine};

        AssetMaterial material;
        material.name = "skin";
        geometry.materials.push_back(material);

        AssetMesh mesh;
        mesh.name = "body";
        mesh.materialIndex = 0;
        mesh.skinned = true;
        for (int i = 0; i < 3; i++) {
            AssetVertex v;
            v.position = glm::vec3(i == 1 ? 1.0f : 0.0f, i == 2 ? 2.0f : 0.0f, 0.0f);
            v.normal = glm::vec3(0.0f, 0.0f, 1.0f);
            addInfluence(v, static_cast<uint16_t>(i == 1 ? 1 : 0), 1.0f);
            mesh.vertices.push_back(v);
        }
        mesh.indices = {0, 1, 2};
        geometry.meshes.push_back(mesh);
        return geometry;
    }

    ACC::Random random_;
    std::filesystem::path dir_;
    TextureEncoder encoder_;
};

TEST_F(AssimpImporterTest, ObjWithBmpTexture) {
    ASSERT_TRUE(encoder_.isReady());
    write("tex.bmp", redBmp());
    std::string path = writeQuadObj("tex.bmp");

    AssimpMeshImporter importer(&encoder_);
    std::string error;
    auto geometry = importer.load(path, error);
    ASSERT_NE(geometry, nullptr) << error;

    EXPECT_EQ(geometry->name, "quad");
    EXPECT_FALSE(geometry->hasSkeleton());
    ASSERT_EQ(geometry->meshes.size(), 1u);
    EXPECT_EQ(geometry->triangleCount(), 2u);
    EXPECT_EQ(geometry->vertexCount(), 4u);

    const AssetMesh& mesh = geometry->meshes[0];
    EXPECT_FALSE(mesh.skinned);
    ASSERT_GE(mesh.materialIndex, 0);
    const AssetMaterial& material = geometry->materials[mesh.materialIndex];
    EXPECT_EQ(material.name, "red");
    EXPECT_FLOAT_EQ(material.baseColor.r, 1.0f);
    EXPECT_FLOAT_EQ(material.baseColor.g, 0.0f);

    // BMP is re-encoded so it can be embedded
    EXPECT_EQ(material.mimeType, "image/png");
    EXPECT_EQ(material.imageData.substr(0, 8), kPngSignature);
    EXPECT_EQ(std::filesystem::path(material.textureName).filename().string(), "tex.bmp");
}

TEST_F(AssimpImporterTest, PngTextureEmbeddedAsIs) {
    const std::string png = kPngSignature + "not decoded";
    write("tex.png", png);
    std::string path = writeQuadObj("tex.png");

    AssimpMeshImporter importer;
    std::string error;
    auto geometry = importer.load(path, error);
    ASSERT_NE(geometry, nullptr) << error;

    const AssetMaterial& material = geometry->materials[geometry->meshes[0].materialIndex];
    EXPECT_EQ(material.mimeType, "image/png");
    EXPECT_EQ(material.imageData, png);
}

TEST_F(AssimpImporterTest, MissingTextureLeavesMaterialUntextured) {
    std::string path = writeQuadObj("absent.tga");

    AssimpMeshImporter importer(&encoder_);
    std::string error;
    auto geometry = importer.load(path, error);
    ASSERT_NE(geometry, nullptr) << error;

    const AssetMaterial& material = geometry->materials[geometry->meshes[0].materialIndex];
    EXPECT_TRUE(material.imageData.empty());
    EXPECT_TRUE(material.textureName.empty());
    EXPECT_FLOAT_EQ(material.baseColor.r, 1.0f);
}

TEST_F(AssimpImporterTest, MissingFileFails) {
    AssimpMeshImporter importer;
    std::string error;
    EXPECT_EQ(importer.load((dir_ / "nothing.fbx").string(), error), nullptr);
    EXPECT_NE(error.find("file not found"), std::string::npos);
}

TEST_F(AssimpImporterTest, UnreadableFileFails) {
    std::string path = write("broken.fbx", std::string("\x00\x01\x02\x03 not a model", 17));

    AssimpMeshImporter importer;
    std::string error;
    EXPECT_EQ(importer.load(path, error), nullptr);
    EXPECT_NE(error.find("cannot import"), std::string::npos);
}

TEST_F(AssimpImporterTest, SkinnedGlbKeepsSkeleton) {
    std::string path = (dir_ / "rig.glb").string();
    std::string error;
    ASSERT_TRUE(GlbWriter::write(skinnedTriangle(), path, error)) << error;

    AssimpMeshImporter importer;
    auto geometry = importer.load(path, error);
    ASSERT_NE(geometry, nullptr) << error;

    ASSERT_EQ(geometry->joints.size(), 2u);
    EXPECT_EQ(geometry->joints[0].name, "hips");
    EXPECT_EQ(geometry->joints[0].parent, -1);
    EXPECT_EQ(geometry->joints[1].name, "spine");
    EXPECT_EQ(geometry->joints[1].parent, 0);
    EXPECT_FLOAT_EQ(geometry->joints[1].localMatrix[3][1], 1.0f);
    EXPECT_FLOAT_EQ(geometry->joints[1].inverseBindMatrix[3][1], -1.0f);

    ASSERT_EQ(geometry->meshes.size(), 1u);
    const AssetMesh& mesh = geometry->meshes[0];
    EXPECT_TRUE(mesh.skinned);
    ASSERT_EQ(mesh.vertices.size(), 3u);
    EXPECT_EQ(mesh.vertices[1].joints[0], 1u);
    EXPECT_FLOAT_EQ(mesh.vertices[1].weights[0], 1.0f);
    EXPECT_EQ(mesh.vertices[0].joints[0], 0u);
    EXPECT_FLOAT_EQ(mesh.vertices[0].weights[0], 1.0f);
}

TEST_F(AssimpImporterTest, EncoderMakesPng) {
    ASSERT_TRUE(encoder_.isReady());
    std::string png;
    std::string error;

    const uint8_t texels[16] = {
        0, 0, 255, 255, 0, 255, 0, 255,
        255, 0, 0, 255, 255, 255, 255, 255,
    };
    ASSERT_TRUE(encoder_.encodePixels(texels, 2, 2, png, error)) << error;
    EXPECT_EQ(png.substr(0, 8), kPngSignature);
    EXPECT_EQ(embeddableMimeType(png), "image/png");

    png.clear();
    ASSERT_TRUE(encoder_.encodeData(redBmp(), "embedded.bmp", png, error)) << error;
    EXPECT_EQ(png.substr(0, 8), kPngSignature);

    EXPECT_FALSE(encoder_.encodeData("garbage", "embedded.bmp", png, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(AssimpImporterTest, EmbeddableMimeTypes) {
    EXPECT_EQ(embeddableMimeType(kPngSignature + "x"), "image/png");
    EXPECT_EQ(embeddableMimeType(std::string("\xFF\xD8\xFF\xE0", 4)), "image/jpeg");
    EXPECT_EQ(embeddableMimeType(redBmp()), "");
    EXPECT_EQ(embeddableMimeType(""), "");
}
