#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stubscan {

enum class ViolationCategory : uint8_t {
    IncompleteImplementation,
    PlaceholderCode,
    DebuggingCode,
    UnusedCode,
    PrematureCelebration,
    Other,
};

constexpr std::string_view categoryToString(ViolationCategory c) {
    switch (c) {
        case ViolationCategory::IncompleteImplementation: return "IncompleteImplementation";
        case ViolationCategory::PlaceholderCode:          return "PlaceholderCode";
        case ViolationCategory::DebuggingCode:            return "DebuggingCode";
        case ViolationCategory::UnusedCode:               return "UnusedCode";
        case ViolationCategory::PrematureCelebration:     return "PrematureCelebration";
        case ViolationCategory::Other:                    return "Other";
    }
    return "Other";
}

struct Violation {
    std::string       ruleID;
    std::string       typeName;   // full name of the owning type
    std::string       memberName; // type's own name for type-level findings
    std::string       message;
    ViolationCategory category = ViolationCategory::Other;
    std::string       assembly;

    bool operator==(const Violation &) const = default;
};

} // namespace stubscan
