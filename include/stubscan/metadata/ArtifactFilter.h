#pragma once

#include "stubscan/metadata/Metadata.h"

#include <string_view>

namespace stubscan {

// Recognizes compiler scaffolding and test fixtures so rules never see them.
// A null descriptor is always skipped.
//
// A type is scaffolding if any of:
//   1. Its name carries a closure, state-machine, display-class,
//      source-generator or iterator-helper marker
//   2. It carries CompilerGenerated / GeneratedCode
//   3. It is a test fixture
// A member is skipped when its declaring type is, or when it is a backing
// field, a lambda body or a local function.
class ArtifactFilter {
public:
    static bool shouldSkipType(const TypeDescriptor *T);
    static bool shouldSkipMember(const MemberDescriptor *M);

    static bool hasClosureMarker(std::string_view name);
    static bool hasStateMachineMarker(std::string_view name);
    static bool hasDisplayClassMarker(std::string_view name);
    static bool hasSourceGeneratorMarker(std::string_view name);
    static bool hasIteratorHelperMarker(std::string_view name);
    static bool hasGeneratedCodeAttribute(const std::vector<Attribute> &attrs);

    static bool isTestFixture(const TypeDescriptor &T);
    static bool isBackingField(std::string_view name);
    static bool isLambdaMethod(std::string_view name);
};

} // namespace stubscan
