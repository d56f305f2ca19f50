#include "stubscan/engine/ValidationOrchestrator.h"
#include "stubscan/metadata/ManifestLoader.h"
#include "unit/TestBuilders.h"

#include <gtest/gtest.h>

using namespace stubscan;
using stubscan::fixtures::Bytes;
using stubscan::fixtures::mentions;

namespace {

constexpr const char *kPlayerManifest = R"(
assemblies:
  - name: Game.Core
    load_failures:
      - { type: Game.Broken, reason: "missing dependency" }
    types:
      - name: Player
        namespace: Game
        sealed: true
        attributes:
          - { name: Serializable }
          - { name: StubScanIgnore, argument: "legacy save format" }
        members:
          - name: Move
            kind: method
            token: 0x06000001
            visibility: public
            parameters:
              - { name: dx, type: System.Single }
            body: "03 26 2A"
            summary: "Moves the player."
          - { name: health, kind: field, token: 0x04000001, init_only: true }
          - { name: Score, kind: property, auto_implemented: true,
              getter: 0x06000002, setter: 0x06000003 }
          - { name: Tick, kind: method, abstract: true, body: "" }
        nested:
          - { name: Stats, kind: struct }
)";

std::string loadError(ManifestLoader &loader, llvm::StringRef yaml) {
    if (auto err = loader.loadBuffer(yaml, "inline"))
        return llvm::toString(std::move(err));
    return {};
}

} // anonymous namespace

TEST(ManifestLoaderTest, BuildsDescriptors) {
    ManifestLoader loader;
    ASSERT_EQ(loadError(loader, kPlayerManifest), "");
    ASSERT_EQ(loader.assemblies().size(), 1u);

    const Assembly &A = *loader.assemblies()[0];
    EXPECT_EQ(A.name(), "Game.Core");
    EXPECT_EQ(A.location(), "inline");
    ASSERT_EQ(A.loadFailures().size(), 1u);
    EXPECT_EQ(A.loadFailures()[0].typeName, "Game.Broken");

    const TypeDescriptor *T = A.findType("Game.Player");
    ASSERT_NE(T, nullptr);
    EXPECT_TRUE(T->isSealed);
    EXPECT_EQ(T->kind(), TypeKind::Class);
    ASSERT_EQ(T->attributes.size(), 2u);
    EXPECT_FALSE(T->attributes[0].argument.has_value());
    EXPECT_EQ(T->attributes[1].argument.value_or(""), "legacy save format");

    const MemberDescriptor *move = T->findMember("Move");
    ASSERT_NE(move, nullptr);
    EXPECT_EQ(move->token, 0x06000001u);
    EXPECT_EQ(move->visibility, Visibility::Public);
    ASSERT_TRUE(move->hasBody());
    EXPECT_EQ(*move->body, (Bytes{0x03, 0x26, 0x2A}));
    ASSERT_EQ(move->parameters.size(), 1u);
    EXPECT_EQ(move->parameters[0].typeName, "System.Single");
    EXPECT_EQ(move->summary, "Moves the player.");
    EXPECT_TRUE(move->returnsVoid());

    const MemberDescriptor *health = T->findMember("health");
    ASSERT_NE(health, nullptr);
    EXPECT_EQ(health->kind, MemberKind::Field);
    EXPECT_EQ(health->visibility, Visibility::Private);
    EXPECT_TRUE(health->isInitOnly);

    const MemberDescriptor *score = T->findMember("Score");
    ASSERT_NE(score, nullptr);
    EXPECT_TRUE(score->isAutoImplemented);
    EXPECT_EQ(score->getterToken, 0x06000002u);
    EXPECT_EQ(score->setterToken, 0x06000003u);

    const MemberDescriptor *tick = T->findMember("Tick");
    ASSERT_NE(tick, nullptr);
    EXPECT_FALSE(tick->hasBody());

    const TypeDescriptor *stats = A.findType("Game.Player+Stats");
    ASSERT_NE(stats, nullptr);
    EXPECT_EQ(stats->kind(), TypeKind::Struct);
}

TEST(ManifestLoaderTest, ParsesHexBodies) {
    auto spaced = ManifestLoader::parseHexBody("73 01 00 00 0a 7A");
    ASSERT_TRUE(static_cast<bool>(spaced));
    EXPECT_EQ(*spaced, (Bytes{0x73, 0x01, 0x00, 0x00, 0x0A, 0x7A}));

    auto packed = ManifestLoader::parseHexBody("022A");
    ASSERT_TRUE(static_cast<bool>(packed));
    EXPECT_EQ(*packed, (Bytes{0x02, 0x2A}));

    auto bad = ManifestLoader::parseHexBody("2G");
    ASSERT_FALSE(static_cast<bool>(bad));
    EXPECT_TRUE(mentions(llvm::toString(bad.takeError()), "invalid hex digit 'G'"));

    auto odd = ManifestLoader::parseHexBody("2A 0");
    ASSERT_FALSE(static_cast<bool>(odd));
    EXPECT_TRUE(mentions(llvm::toString(odd.takeError()), "odd number"));
}

TEST(ManifestLoaderTest, MalformedManifestAddsNothing) {
    ManifestLoader loader;
    std::string err = loadError(loader, "types: []\n");
    EXPECT_TRUE(mentions(err, "manifest parse error in 'inline'")) << err;
    EXPECT_TRUE(loader.assemblies().empty());

    err = loadError(loader,
        "assemblies:\n"
        "  - name: Good\n"
        "  - name: Bad\n"
        "    types:\n"
        "      - name: T\n"
        "        members:\n"
        "          - { name: M, body: \"7Z\" }\n");
    EXPECT_TRUE(mentions(err, "member 'M'")) << err;
    EXPECT_TRUE(loader.assemblies().empty());
}

TEST(ManifestLoaderTest, MissingFileIsAnError) {
    ManifestLoader loader;
    llvm::Error err = loader.loadFile("/nonexistent/manifest.yaml");
    ASSERT_TRUE(static_cast<bool>(err));
    EXPECT_TRUE(mentions(llvm::toString(std::move(err)), "cannot open manifest"));
}

TEST(ManifestLoaderTest, ResolvesBaseTypesAcrossManifests) {
    ManifestLoader loader;
    ASSERT_EQ(loadError(loader,
        "assemblies:\n"
        "  - name: Game.Weapons\n"
        "    types:\n"
        "      - { name: Sword, namespace: Game, base: Game.Weapon }\n"
        "      - { name: Bow, namespace: Game, base: System.Object }\n"), "");
    ASSERT_EQ(loadError(loader,
        "assemblies:\n"
        "  - name: Game.Core\n"
        "    types:\n"
        "      - { name: Weapon, namespace: Game, abstract: true }\n"), "");
    loader.resolveBaseTypes();

    const Assembly &weapons = *loader.assemblies()[0];
    const TypeDescriptor *sword = weapons.findType("Game.Sword");
    ASSERT_NE(sword, nullptr);
    ASSERT_NE(sword->baseType, nullptr);
    EXPECT_EQ(sword->baseType->fullName(), "Game.Weapon");

    const TypeDescriptor *bow = weapons.findType("Game.Bow");
    ASSERT_NE(bow, nullptr);
    EXPECT_EQ(bow->baseType, nullptr);
    EXPECT_EQ(bow->baseTypeName, "System.Object");
    EXPECT_EQ(loader.handles().size(), 2u);
}

TEST(ManifestLoaderTest, SampleManifestsEndToEnd) {
    ManifestLoader loader;
    ASSERT_FALSE(static_cast<bool>(loader.loadFile(STUBSCAN_SAMPLES_DIR "/game_core.yaml")));
    loader.resolveBaseTypes();

    RuleRegistry registry = RuleRegistry::withBuiltinRules();
    auto orch = ValidationOrchestrator::create(Config::defaults(), registry);
    ASSERT_TRUE(static_cast<bool>(orch)) << llvm::toString(orch.takeError());

    ValidationReport report = orch->run(loader.handles());
    std::vector<std::string> ids;
    for (const auto &v : report.violations)
        ids.push_back(v.ruleID);
    std::vector<std::string> expected = {"SS001", "SS007", "SS013", "SS005",
                                         "SS003", "SS008", "SS011", "SS012"};
    EXPECT_EQ(ids, expected);
    EXPECT_DOUBLE_EQ(report.score, 60.0);
    EXPECT_EQ(report.notes.size(), 1u);

    ManifestLoader clean;
    ASSERT_FALSE(static_cast<bool>(clean.loadFile(STUBSCAN_SAMPLES_DIR "/clean.yaml")));
    clean.resolveBaseTypes();
    ValidationReport cleanReport = orch->run(clean.handles());
    EXPECT_TRUE(cleanReport.violations.empty());
    EXPECT_TRUE(cleanReport.fullyCompliant);
}
