#pragma once

#include "stubscan/core/Config.h"
#include "stubscan/metadata/Metadata.h"

#include <llvm/ADT/ArrayRef.h>

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace stubscan {

// One entry of the walker stream. A null member stands for the type itself.
struct Symbol {
    AssemblyHandle assembly = nullptr;
    const TypeDescriptor *type = nullptr;
    const MemberDescriptor *member = nullptr;

    bool isTypeLevel() const { return member == nullptr; }

    // Member name, or the type's own name for type-level symbols.
    const std::string &displayName() const {
        return member ? member->name : type->name();
    }
};

struct WalkResult {
    std::vector<Symbol> symbols;
    std::vector<std::string> notes;
    bool cancelled = false;
};

// Produces the filtered (type, member) stream for a set of assemblies.
// Types are visited pre-order in declaration order; a type's members follow
// the type's own entry, and its nested types follow its members.
class MetadataWalker {
public:
    explicit MetadataWalker(const Config &cfg);

    WalkResult walk(llvm::ArrayRef<AssemblyHandle> assemblies,
                    std::stop_token stop = {}) const;

    bool acceptsAssembly(std::string_view name) const;

    static bool isSystemAssembly(std::string_view name);
    static bool isHostFrameworkAssembly(std::string_view name);
    static bool isTestAssembly(std::string_view name);

private:
    bool isAllowListed(const TypeDescriptor &T) const;

    const Config &config_;
};

} // namespace stubscan
