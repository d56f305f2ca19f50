#include "stubscan/metadata/ArtifactFilter.h"
#include "unit/TestBuilders.h"

#include <gtest/gtest.h>

using namespace stubscan;
using namespace stubscan::fixtures;

TEST(ArtifactFilterTest, NullInputIsSkipped) {
    EXPECT_TRUE(ArtifactFilter::shouldSkipType(nullptr));
    EXPECT_TRUE(ArtifactFilter::shouldSkipMember(nullptr));
}

TEST(ArtifactFilterTest, CompilerNamePatterns) {
    EXPECT_TRUE(ArtifactFilter::hasClosureMarker("<>c"));
    EXPECT_TRUE(ArtifactFilter::hasStateMachineMarker("<Run>d__4"));
    EXPECT_TRUE(ArtifactFilter::hasStateMachineMarker("LoadStateMachine"));
    EXPECT_TRUE(ArtifactFilter::hasDisplayClassMarker("<>c__DisplayClass3_0"));
    EXPECT_TRUE(ArtifactFilter::hasDisplayClassMarker("<Start>c__AnonStorey0"));
    EXPECT_TRUE(ArtifactFilter::hasSourceGeneratorMarker("__JobReflectionRegistration"));
    EXPECT_TRUE(ArtifactFilter::hasSourceGeneratorMarker("Proxy$1"));
    EXPECT_TRUE(ArtifactFilter::hasIteratorHelperMarker("Spawn_c__Iterator0"));

    EXPECT_FALSE(ArtifactFilter::hasClosureMarker("PlayerController"));
    EXPECT_FALSE(ArtifactFilter::hasStateMachineMarker("PlayerController"));
    EXPECT_FALSE(ArtifactFilter::hasSourceGeneratorMarker("Player_Controller"));
}

TEST(ArtifactFilterTest, GeneratedAttributeSkipsType) {
    auto T = makeType("Bindings");
    EXPECT_FALSE(ArtifactFilter::shouldSkipType(T.get()));

    T->attributes.push_back({"System.Runtime.CompilerServices.CompilerGeneratedAttribute",
                             std::nullopt});
    EXPECT_TRUE(ArtifactFilter::shouldSkipType(T.get()));
}

TEST(ArtifactFilterTest, UnreadableAttributesDegradeToNotGenerated) {
    auto T = makeType("Bindings");
    T->attributes.push_back({"GeneratedCode", std::nullopt});
    T->attributesUnreadable = true;
    EXPECT_FALSE(ArtifactFilter::shouldSkipType(T.get()));

    // Nameless entries are undecodable blobs.
    EXPECT_FALSE(ArtifactFilter::hasGeneratedCodeAttribute({{"", std::nullopt}}));
}

TEST(ArtifactFilterTest, TestFixturesAreSkipped) {
    for (const char *marker : {"TestFixture", "TestClassAttribute", "Fact"}) {
        auto T = makeType("PlayerTests");
        T->attributes.push_back({marker, std::nullopt});
        EXPECT_TRUE(ArtifactFilter::shouldSkipType(T.get())) << marker;
    }
}

TEST(ArtifactFilterTest, MemberIsSkippedWhenDeclaringTypeIs) {
    auto closure = makeType("<>c");
    const MemberDescriptor &m = closure->addMember(makeMethod("Run", newobjThrow()));
    EXPECT_TRUE(ArtifactFilter::shouldSkipMember(&m));
}

TEST(ArtifactFilterTest, MemberNamingIdioms) {
    auto T = makeType("Player");
    T->addMember(makeField("<Health>k__BackingField", 0x04000001));
    T->addMember(makeMethod("<Start>b__0", {0x2A}));
    T->addMember(makeMethod("<Update>g__Local|1_0", {0x2A}));
    T->addMember(makeMethod("Jump", {0x2A}));

    EXPECT_TRUE(ArtifactFilter::shouldSkipMember(T->findMember("<Health>k__BackingField")));
    EXPECT_TRUE(ArtifactFilter::shouldSkipMember(T->findMember("<Start>b__0")));
    EXPECT_TRUE(ArtifactFilter::shouldSkipMember(T->findMember("<Update>g__Local|1_0")));
    EXPECT_FALSE(ArtifactFilter::shouldSkipMember(T->findMember("Jump")));
}
