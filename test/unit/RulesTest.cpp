#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"
#include "unit/TestBuilders.h"

#include <gtest/gtest.h>

using namespace stubscan;
using namespace stubscan::fixtures;

namespace {

class RulesTest : public ::testing::Test {
protected:
    TypeDescriptor &addClass(std::string name) { return A.addType(makeType(std::move(name))); }

    RuleVerdict check(std::string_view ruleID, const TypeDescriptor &T, std::string_view member) {
        harness.index(A);
        return harness.evaluate(ruleID, memberSymbol(A, T, member));
    }

    RuleVerdict checkType(std::string_view ruleID, const TypeDescriptor &T) {
        harness.index(A);
        return harness.evaluate(ruleID, typeSymbol(A, T));
    }

    Assembly A{"Game.Core"};
    RuleHarness harness;
};

// ldarg.0 ; blt ; newobj ; throw ; ldarg.1 ; ret
Bytes weight3Stub() {
    return concat({{0x02, 0x3F, 0x00, 0x00, 0x00, 0x00}, newobjThrow(), {0x03, 0x2A}});
}

Parameter param(std::string name, std::string type = "System.Single") {
    return Parameter{std::move(name), std::move(type)};
}

} // anonymous namespace

TEST_F(RulesTest, CatalogHasThirteenRules) {
    const auto &rules = harness.registry().rules();
    EXPECT_EQ(rules.size(), 13u);
    for (const char *id : {"SS001", "SS007", "SS013"})
        EXPECT_NE(harness.registry().findByID(id), nullptr) << id;
    EXPECT_EQ(harness.registry().findByID("FL001"), nullptr);
}

TEST_F(RulesTest, RegistryRejectsDuplicateIDs) {
    RuleRegistry reg;
    EXPECT_TRUE(reg.registerRule(createPlaceholderBodyRule()));
    EXPECT_FALSE(reg.registerRule(createPlaceholderBodyRule()));
    EXPECT_EQ(reg.rules().size(), 1u);
}

// --- SS001 ---

TEST_F(RulesTest, PlaceholderThrowIsReported) {
    TypeDescriptor &T = addClass("Spawner");
    T.addMember(makeMethod("Spawn", newobjThrow()));
    T.addMember(makeMethod("SpawnGuarded", weight3Stub()));

    RuleVerdict v = check("SS001", T, "Spawn");
    EXPECT_TRUE(v.violated);
    EXPECT_TRUE(mentions(v.message, "placeholder stub")) << v.message;
    EXPECT_TRUE(check("SS001", T, "SpawnGuarded").violated);
}

TEST_F(RulesTest, GuardedThrowIsArgumentValidation) {
    TypeDescriptor &T = addClass("Spawner");
    T.addMember(makeMethod("Spawn", concat({{0x03}, weight3Stub()})));
    EXPECT_FALSE(check("SS001", T, "Spawn").violated);
}

TEST_F(RulesTest, HardCodedDefaultReturnIsReported) {
    TypeDescriptor &T = addClass("Door");
    MemberDescriptor m = makeMethod("IsLocked", {0x16, 0x2A});
    m.returnType = "System.Boolean";
    T.addMember(std::move(m));

    RuleVerdict v = check("SS001", T, "IsLocked");
    EXPECT_TRUE(v.violated);
    EXPECT_TRUE(mentions(v.message, "hard-coded default")) << v.message;
}

TEST_F(RulesTest, AbstractAndBodilessMethodsPassPlaceholderRule) {
    TypeDescriptor &T = addClass("Door");
    MemberDescriptor m = makeMethod("Open", {});
    m.body.reset();
    m.isAbstract = true;
    T.addMember(std::move(m));
    EXPECT_FALSE(check("SS001", T, "Open").violated);
}

// --- SS002 ---

TEST_F(RulesTest, MinimalBodyWithoutWorkIsReported) {
    TypeDescriptor &T = addClass("Inventory");
    // ldarg.1 ; pop ; ret
    T.addMember(makeMethod("Sort", {0x03, 0x26, 0x2A}));
    MemberDescriptor constant = makeMethod("Capacity", {0x1F, 0x07, 0x2A});
    constant.returnType = "System.Int32";
    T.addMember(std::move(constant));

    RuleVerdict v = check("SS002", T, "Sort");
    EXPECT_TRUE(v.violated);
    EXPECT_TRUE(mentions(v.message, "3-byte body")) << v.message;

    RuleVerdict c = check("SS002", T, "Capacity");
    EXPECT_TRUE(c.violated);
    EXPECT_TRUE(mentions(c.message, "returns a constant")) << c.message;
}

TEST_F(RulesTest, MinimalBodyLeavesOtherShapesAlone) {
    TypeDescriptor &T = addClass("Inventory");
    T.addMember(makeMethod("Clear", {0x2A}));                              // SS007
    T.addMember(makeMethod("OnOpened", {0x03, 0x26, 0x2A}));               // handler
    T.addMember(makeMethod("Flush", {0x28, 0x01, 0x00, 0x00, 0x0A, 0x2A})); // real call
    MemberDescriptor virt = makeMethod("Refresh", {0x03, 0x26, 0x2A});
    virt.isVirtual = true;
    T.addMember(std::move(virt));

    for (const char *name : {"Clear", "OnOpened", "Flush", "Refresh"})
        EXPECT_FALSE(check("SS002", T, name).violated) << name;
}

// --- SS003 ---

TEST_F(RulesTest, ConcreteClassMissingInheritedAbstractMember) {
    TypeDescriptor &base = addClass("Weapon");
    base.isAbstract = true;
    for (const char *name : {"Fire", "Reload"}) {
        MemberDescriptor m = makeMethod(name, {});
        m.body.reset();
        m.isAbstract = true;
        base.addMember(std::move(m));
    }

    TypeDescriptor &sword = addClass("Sword");
    sword.baseType = &base;
    sword.addMember(makeMethod("Fire", {0x2A}));

    RuleVerdict v = checkType("SS003", sword);
    EXPECT_TRUE(v.violated);
    EXPECT_TRUE(mentions(v.message, "1 inherited abstract member(s) unimplemented: Weapon.Reload"))
        << v.message;

    sword.addMember(makeMethod("Reload", {0x2A}));
    EXPECT_FALSE(checkType("SS003", sword).violated);
}

TEST_F(RulesTest, AbstractIntermediateClassesAreNotIncomplete) {
    TypeDescriptor &base = addClass("Weapon");
    base.isAbstract = true;
    MemberDescriptor m = makeMethod("Fire", {});
    m.body.reset();
    m.isAbstract = true;
    base.addMember(std::move(m));

    TypeDescriptor &ranged = addClass("Ranged");
    ranged.baseType = &base;
    ranged.isAbstract = true;
    EXPECT_FALSE(checkType("SS003", ranged).violated);
}

// --- SS004 ---

TEST_F(RulesTest, AbstractMemberOnConcreteClass) {
    TypeDescriptor &T = addClass("Gun");
    MemberDescriptor m = makeMethod("Fire", {});
    m.body.reset();
    m.isAbstract = true;
    T.addMember(std::move(m));

    RuleVerdict v = check("SS004", T, "Fire");
    EXPECT_TRUE(v.violated);
    EXPECT_EQ(v.message, "abstract method 'Fire' is declared on non-abstract class 'Gun'");

    T.isAbstract = true;
    EXPECT_FALSE(check("SS004", T, "Fire").violated);
}

// --- SS005 ---

TEST_F(RulesTest, DebugAndTemporaryNames) {
    TypeDescriptor &T = addClass("Hud");
    for (const char *name : {"DebugDraw", "TestSpawn", "TempBuffer", "LogTemp", "Temperature",
                             "Testify", "Draw"})
        T.addMember(makeMethod(name, {0x2A}));

    for (const char *name : {"DebugDraw", "TestSpawn", "TempBuffer", "LogTemp"})
        EXPECT_TRUE(check("SS005", T, name).violated) << name;
    for (const char *name : {"Temperature", "Testify", "Draw"})
        EXPECT_FALSE(check("SS005", T, name).violated) << name;
}

TEST_F(RulesTest, DeprecatedDebugMemberPasses) {
    TypeDescriptor &T = addClass("Hud");
    MemberDescriptor m = makeMethod("DebugDraw", {0x2A});
    m.attributes.push_back({"System.ObsoleteAttribute", std::string("use Draw")});
    T.addMember(std::move(m));
    EXPECT_FALSE(check("SS005", T, "DebugDraw").violated);
}

// --- SS006 ---

TEST_F(RulesTest, PhantomAutoProperty) {
    TypeDescriptor &T = addClass("Player");
    MemberDescriptor prop;
    prop.kind = MemberKind::Property;
    prop.name = "Score";
    prop.visibility = Visibility::Public;
    prop.isAutoImplemented = true;
    prop.getterToken = 0x06000010;
    prop.setterToken = 0x06000011;
    T.addMember(prop);

    RuleVerdict v = check("SS006", T, "Score");
    EXPECT_TRUE(v.violated);
    EXPECT_EQ(v.message, "auto-property 'Score' is never read or written outside its own accessors");

    // ldarg.0 ; call get_Score ; pop ; ret
    T.addMember(makeMethod("Print", {0x02, 0x28, 0x10, 0x00, 0x00, 0x06, 0x26, 0x2A}, 0x06000020));
    EXPECT_FALSE(check("SS006", T, "Score").violated);
}

// --- SS007 ---

TEST_F(RulesTest, ColdMethod) {
    TypeDescriptor &T = addClass("Enemy");
    T.addMember(makeMethod("Think", {0x00, 0x2A}));
    MemberDescriptor hook = makeMethod("OnHit", {0x2A});
    hook.isVirtual = true;
    T.addMember(std::move(hook));

    RuleVerdict v = check("SS007", T, "Think");
    EXPECT_TRUE(v.violated);
    EXPECT_EQ(v.message, "method 'Think' does nothing but return");
    EXPECT_FALSE(check("SS007", T, "OnHit").violated);
}

// --- SS008 ---

TEST_F(RulesTest, HollowEnums) {
    TypeDescriptor &single = A.addType(makeType("Difficulty", TypeKind::Enum));
    single.addMember(makeEnumValue("None"));

    TypeDescriptor &placeholders = A.addType(makeType("Mode", TypeKind::Enum));
    placeholders.addMember(makeEnumValue("None"));
    placeholders.addMember(makeEnumValue("Unknown"));

    TypeDescriptor &good = A.addType(makeType("Weather", TypeKind::Enum));
    for (const char *name : {"Sunny", "Rainy", "Stormy"})
        good.addMember(makeEnumValue(name));

    RuleVerdict v = checkType("SS008", single);
    EXPECT_TRUE(v.violated);
    EXPECT_TRUE(mentions(v.message, "declares 1 value(s) ('None')")) << v.message;
    RuleVerdict p = checkType("SS008", placeholders);
    EXPECT_TRUE(mentions(p.message, "only placeholder values")) << p.message;
    EXPECT_FALSE(checkType("SS008", good).violated);
}

// --- SS009 ---

TEST_F(RulesTest, CompletenessClaimOnPlaceholder) {
    TypeDescriptor &T = addClass("Quest");
    MemberDescriptor byAttr = makeMethod("Finish", newobjThrow());
    byAttr.attributes.push_back({"Done", std::nullopt});
    T.addMember(std::move(byAttr));

    MemberDescriptor byDoc = makeMethod("Reward", newobjThrow());
    byDoc.summary = "Grants the reward. Feature complete.";
    T.addMember(std::move(byDoc));

    MemberDescriptor honest = makeMethod("Abandon", newobjThrow());
    honest.summary = "Incomplete for now.";
    T.addMember(std::move(honest));

    MemberDescriptor real = makeMethod("Accept", concat({{0x03}, weight3Stub()}));
    real.attributes.push_back({"Done", std::nullopt});
    T.addMember(std::move(real));

    RuleVerdict a = check("SS009", T, "Finish");
    EXPECT_TRUE(a.violated);
    EXPECT_TRUE(mentions(a.message, "attribute [Done]")) << a.message;

    RuleVerdict d = check("SS009", T, "Reward");
    EXPECT_TRUE(d.violated);
    EXPECT_TRUE(mentions(d.message, "documentation ('Complete')")) << d.message;

    EXPECT_FALSE(check("SS009", T, "Abandon").violated);
    EXPECT_FALSE(check("SS009", T, "Accept").violated);
}

// --- SS010 ---

TEST_F(RulesTest, UnusedParameterIsNamed) {
    TypeDescriptor &T = addClass("Mover");
    // ldarg.1 ; pop ; ret
    MemberDescriptor m = makeMethod("Move", {0x03, 0x26, 0x2A});
    m.parameters = {param("dx"), param("dy")};
    T.addMember(m);

    RuleVerdict v = check("SS010", T, "Move");
    EXPECT_TRUE(v.violated);
    EXPECT_EQ(v.message, "'Move' never uses parameter dy");

    // ldarg.1 ; ldarg.2 ; add ; pop ; ret
    TypeDescriptor &fixed = addClass("FixedMover");
    m.body = Bytes{0x03, 0x04, 0x58, 0x26, 0x2A};
    fixed.addMember(m);
    EXPECT_FALSE(check("SS010", fixed, "Move").violated);
}

TEST_F(RulesTest, UnusedParameterSlotsForStaticMethods) {
    TypeDescriptor &T = addClass("MathUtil");
    // ldarg.0 ; pop ; ret
    MemberDescriptor m = makeMethod("Clamp", {0x02, 0x26, 0x2A});
    m.isStatic = true;
    m.parameters = {param("value"), param("min"), param("_max")};
    T.addMember(std::move(m));

    RuleVerdict v = check("SS010", T, "Clamp");
    EXPECT_TRUE(v.violated);
    EXPECT_EQ(v.message, "'Clamp' never uses parameter min");
}

TEST_F(RulesTest, UnusedParameterSkipsStubsAndHandlers) {
    TypeDescriptor &T = addClass("Ui");
    MemberDescriptor stub = makeMethod("Layout", newobjThrow());
    stub.parameters = {param("width")};
    T.addMember(std::move(stub));

    MemberDescriptor handler = makeMethod("Clicked", {0x2A});
    handler.parameters = {param("sender", "System.Object"), param("e", "System.EventArgs")};
    T.addMember(std::move(handler));

    EXPECT_FALSE(check("SS010", T, "Layout").violated);
    EXPECT_FALSE(check("SS010", T, "Clicked").violated);
}

// --- SS011 / SS012 ---

TEST_F(RulesTest, EmptyInterfaceAndHollowStruct) {
    TypeDescriptor &marker = A.addType(makeType("IMarker", TypeKind::Interface));
    TypeDescriptor &contract = A.addType(makeType("IDamageable", TypeKind::Interface));
    MemberDescriptor take = makeMethod("TakeDamage", {});
    take.body.reset();
    take.isAbstract = true;
    contract.addMember(std::move(take));

    TypeDescriptor &empty = A.addType(makeType("Tag", TypeKind::Struct));
    empty.addMember(makeMethod("Print", {0x2A}));
    TypeDescriptor &point = A.addType(makeType("Point", TypeKind::Struct));
    point.addMember(makeField("X", 0x04000001, Visibility::Public));

    EXPECT_EQ(checkType("SS011", marker).message,
              "interface 'IMarker' declares no members and defines no contract");
    EXPECT_FALSE(checkType("SS011", contract).violated);
    EXPECT_EQ(checkType("SS012", empty).message, "struct 'Tag' has no fields or properties");
    EXPECT_FALSE(checkType("SS012", point).violated);
}

// --- SS013 ---

TEST_F(RulesTest, DeadPrivateMembers) {
    TypeDescriptor &T = addClass("Player");
    T.addMember(makeField("unusedCounter", 0x04000001));
    T.addMember(makeField("health", 0x04000002));
    MemberDescriptor limit = makeField("MaxHealth", 0x04000003);
    limit.isLiteral = true;
    T.addMember(std::move(limit));

    MemberDescriptor helper = makeMethod("Recalculate", {0x2A}, 0x06000001);
    helper.visibility = Visibility::Private;
    T.addMember(std::move(helper));
    MemberDescriptor update = makeMethod("Update", {0x2A}, 0x06000002);
    update.visibility = Visibility::Private;
    T.addMember(std::move(update));

    // ldarg.0 ; ldfld health ; pop ; ret
    T.addMember(makeMethod("Report", {0x02, 0x7B, 0x02, 0x00, 0x00, 0x04, 0x26, 0x2A},
                           0x06000003));

    EXPECT_EQ(check("SS013", T, "unusedCounter").message,
              "private field 'unusedCounter' is never read");
    EXPECT_FALSE(check("SS013", T, "health").violated);
    EXPECT_FALSE(check("SS013", T, "MaxHealth").violated);
    EXPECT_EQ(check("SS013", T, "Recalculate").message,
              "private method 'Recalculate' is never called");
    EXPECT_FALSE(check("SS013", T, "Update").violated);
    EXPECT_FALSE(check("SS013", T, "Report").violated); // public
}

TEST(RuleSupportTest, NameHelpers) {
    MemberDescriptor m;
    m.name = "OnClick";
    EXPECT_TRUE(isLikelyEventHandler(m));
    m.name = "Once";
    EXPECT_FALSE(isLikelyEventHandler(m));
    m.name = "SaveCallback";
    EXPECT_TRUE(isLikelyEventHandler(m));

    EXPECT_TRUE(hasNameWord("DebugLog", "Debug", false));
    EXPECT_FALSE(hasNameWord("LogDebug", "Debug", false));
    EXPECT_TRUE(hasNameWord("LogDebug", "Debug", true));
    EXPECT_TRUE(containsWordInsensitive("All DONE here", "done"));
    EXPECT_FALSE(containsWordInsensitive("abandoned", "done"));
    EXPECT_EQ(joinNames({"a", "b"}), "a, b");
}
