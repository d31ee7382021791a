#include <gtest/gtest.h>
#include "combiner/naming.h"
#include "common/util/crc64.h"
#include "common/util/random.h"

#include <fmt/format.h>

#include <algorithm>
#include <set>

using namespace ACC::Combiner;

class NamingTest : public ::testing::Test {
protected:
    static PartDescriptor part(const std::string& category, const std::string& identifier) {
        return *parseIdentifier(identifier, category).descriptor;
    }

    Combination sample() const {
        Combination combination;
        combination.skeleton = "f";
        combination.parts = {
            part("body", "skin-f-generic-01-v1-body"),
            part("bottom", "pants-f-casual-02-v1-bottom"),
            part("top", "shirt-f-casual-01-v1-top"),
        };
        return combination;
    }
};

TEST_F(NamingTest, CanonicalIdentity_SortedByCategory) {
    Combination combination = sample();
    std::swap(combination.parts[0], combination.parts[2]);
    EXPECT_EQ(canonicalIdentity(combination),
              "4:body|4:skin|1:f|7:generic|2:01|2:v1|4:body|\n"
              "6:bottom|5:pants|1:f|6:casual|2:02|2:v1|6:bottom|\n"
              "3:top|5:shirt|1:f|6:casual|2:01|2:v1|3:top|\n");
}

TEST_F(NamingTest, CanonicalIdentity_CategoryOrderIsByName) {
    Combination combination;
    combination.skeleton = "f";
    combination.parts = {part("body2", "a-f"), part("body", "b-f")};
    EXPECT_EQ(canonicalIdentity(combination),
              "4:body|1:b|1:f|7:generic|2:01|2:v1|9:undefined|\n"
              "5:body2|1:a|1:f|7:generic|2:01|2:v1|9:undefined|\n");
}

TEST_F(NamingTest, CanonicalIdentity_SeparatorsInFieldsStayDistinct) {
    // Joined with spaces and colons these two would read "...-r x:a-f-..." alike
    Combination a;
    a.skeleton = "f";
    a.parts = {part("body", "skin-f"), part("top", "a-f")};
    a.parts[0].region = "r x";

    Combination b = a;
    b.parts[0].region = "r";
    b.parts[1].category = "x top";

    EXPECT_NE(canonicalIdentity(a), canonicalIdentity(b));
    EXPECT_NE(combinationName(a), combinationName(b));
}

TEST_F(NamingTest, CanonicalIdentity_FieldLengthsPrefixed) {
    Combination combination;
    combination.skeleton = "f";
    combination.parts = {part("body", "skin-f")};
    combination.parts[0].theme = "a|b";
    EXPECT_EQ(canonicalIdentity(combination),
              "4:body|4:skin|1:f|3:a|b|2:01|2:v1|9:undefined|\n");
}

TEST_F(NamingTest, Name_Format) {
    std::string name = combinationName(sample());
    ASSERT_EQ(name.size(), std::string("set-f-").size() + kNameHashLength);
    EXPECT_EQ(name.rfind("set-f-", 0), 0u);
    EXPECT_EQ(name.substr(6), ACC::Crc64Hex(canonicalIdentity(sample())));
}

TEST_F(NamingTest, Name_OrderIndependent) {
    Combination a = sample();
    Combination b = sample();
    std::reverse(b.parts.begin(), b.parts.end());
    EXPECT_EQ(combinationName(a), combinationName(b));
}

TEST_F(NamingTest, Name_IgnoresSourcePath) {
    Combination a = sample();
    Combination b = sample();
    b.parts[0].sourcePath = "/somewhere/else.fbx";
    EXPECT_EQ(combinationName(a), combinationName(b));
}

TEST_F(NamingTest, Name_VariantChangeChangesHash) {
    Combination a = sample();
    Combination b = sample();
    b.parts[2].variant = "02";
    EXPECT_NE(combinationName(a), combinationName(b));
}

TEST_F(NamingTest, Name_RandomMutationsNeverCollide) {
    ACC::Random random(2024);
    std::set<std::string> names;
    std::set<std::string> canonical;

    names.insert(combinationName(sample()));
    canonical.insert(canonicalIdentity(sample()));

    for (int i = 0; i < 1000; i++) {
        Combination mutated = sample();
        PartDescriptor& target = mutated.parts[random.Index(0, mutated.parts.size() - 1)];
        target.variant = fmt::format("{:04}", i);
        target.theme = fmt::format("t{}", random.Int(0, 3));

        // Only distinct inputs must give distinct names
        if (!canonical.insert(canonicalIdentity(mutated)).second) {
            continue;
        }
        EXPECT_TRUE(names.insert(combinationName(mutated)).second)
            << "collision for " << canonicalIdentity(mutated);
    }
    EXPECT_EQ(names.size(), canonical.size());
    EXPECT_GT(names.size(), 1000u);
}

TEST_F(NamingTest, NameCombination_KeepsCombination) {
    NamedCombination named = nameCombination(sample());
    EXPECT_EQ(named.combination, sample());
    EXPECT_EQ(named.name, combinationName(sample()));
}

TEST_F(NamingTest, SkeletonFromName_RoundTrip) {
    for (const std::string skeleton : {"f", "m", "child", "x2"}) {
        Combination combination = sample();
        combination.skeleton = skeleton;
        EXPECT_EQ(skeletonFromName(combinationName(combination)), skeleton);
    }
}

TEST_F(NamingTest, SkeletonFromName_RejectsOtherNames) {
    EXPECT_EQ(skeletonFromName("set-f"), "");
    EXPECT_EQ(skeletonFromName("outfit-f-0123456789abcdef"), "");
    EXPECT_EQ(skeletonFromName("set-f-abc"), "");
}

TEST_F(NamingTest, ExportFileName) {
    EXPECT_EQ(exportFileName("set-f-0123456789abcdef", "glb"), "set-f-0123456789abcdef.glb");
    EXPECT_EQ(exportFileName("set-f-0123456789abcdef", ".glb"), "set-f-0123456789abcdef.glb");
    EXPECT_EQ(exportFileName("set-v1.2-0123456789abcdef", "glb"), "set-v1_2-0123456789abcdef.glb");
}
