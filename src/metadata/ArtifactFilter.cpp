#include "stubscan/metadata/ArtifactFilter.h"

#include <array>

namespace stubscan {

namespace {

constexpr std::array<std::string_view, 2> kGeneratedAttributes = {
    "CompilerGenerated", "GeneratedCode",
};

constexpr std::array<std::string_view, 7> kTestFixtureAttributes = {
    "TestFixture", "TestClass", "Test", "TestCase", "UnityTest", "Fact", "Theory",
};

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

bool hasScaffoldingName(std::string_view name) {
    return ArtifactFilter::hasClosureMarker(name) ||
           ArtifactFilter::hasStateMachineMarker(name) ||
           ArtifactFilter::hasDisplayClassMarker(name) ||
           ArtifactFilter::hasSourceGeneratorMarker(name) ||
           ArtifactFilter::hasIteratorHelperMarker(name);
}

} // anonymous namespace

bool ArtifactFilter::shouldSkipType(const TypeDescriptor *T) {
    if (!T)
        return true;
    if (hasScaffoldingName(T->name()))
        return true;
    if (!T->attributesUnreadable && hasGeneratedCodeAttribute(T->attributes))
        return true;
    return isTestFixture(*T);
}

bool ArtifactFilter::shouldSkipMember(const MemberDescriptor *M) {
    if (!M)
        return true;
    if (shouldSkipType(M->declaringType))
        return true;
    if (isBackingField(M->name) || isLambdaMethod(M->name))
        return true;
    if (hasScaffoldingName(M->name))
        return true;
    return hasGeneratedCodeAttribute(M->attributes);
}

bool ArtifactFilter::hasClosureMarker(std::string_view name) {
    return contains(name, "<") || contains(name, ">");
}

bool ArtifactFilter::hasStateMachineMarker(std::string_view name) {
    return contains(name, "d__") || name.ends_with("StateMachine");
}

bool ArtifactFilter::hasDisplayClassMarker(std::string_view name) {
    return contains(name, "DisplayClass") || contains(name, "AnonStorey");
}

bool ArtifactFilter::hasSourceGeneratorMarker(std::string_view name) {
    return contains(name, "$") || name.starts_with("__");
}

bool ArtifactFilter::hasIteratorHelperMarker(std::string_view name) {
    return contains(name, "c__Iterator") || contains(name, "__Iterator");
}

bool ArtifactFilter::hasGeneratedCodeAttribute(const std::vector<Attribute> &attrs) {
    for (const auto &attr : attrs) {
        // Nameless entries come from blobs the loader could not decode.
        if (attr.name.empty())
            continue;
        for (auto wanted : kGeneratedAttributes) {
            if (attributeNameMatches(attr.name, wanted))
                return true;
        }
    }
    return false;
}

bool ArtifactFilter::isTestFixture(const TypeDescriptor &T) {
    for (auto wanted : kTestFixtureAttributes) {
        if (T.findAttribute(wanted))
            return true;
    }
    return false;
}

bool ArtifactFilter::isBackingField(std::string_view name) {
    return contains(name, "k__BackingField");
}

bool ArtifactFilter::isLambdaMethod(std::string_view name) {
    return contains(name, "b__") || contains(name, "g__");
}

} // namespace stubscan
