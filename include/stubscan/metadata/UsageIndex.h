#pragma once

#include "stubscan/metadata/Metadata.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/DenseMap.h>
#include <llvm/ADT/SmallVector.h>

#include <cstddef>
#include <cstdint>

namespace stubscan {

enum class UsageKind : uint8_t {
    Read,  // ldfld / ldflda / ldsfld / ldsflda
    Write, // stfld / stsfld
    Call,  // call / callvirt / newobj / ldftn / ldvirtftn
};

struct UsageReference {
    uint32_t  callerToken = 0; // method whose body holds the instruction
    UsageKind kind = UsageKind::Call;
};

// Token cross-reference table built from every decodable method body in
// the loaded assemblies, scaffolding included, since lambdas and state
// machines reference the members of the types that own them.
// Tokens are assumed unique across the loaded assembly set.
class UsageIndex {
public:
    static UsageIndex build(llvm::ArrayRef<AssemblyHandle> assemblies);

    void indexType(const TypeDescriptor &T);
    void indexBody(const MemberDescriptor &M);

    llvm::ArrayRef<UsageReference> referencesTo(uint32_t token) const;

    bool isRead(uint32_t token) const;
    bool isCalled(uint32_t token) const;

    // True if any method other than those in `ignoredCallers` refers to
    // the token in any way.
    bool isReferencedOutside(uint32_t token,
                             llvm::ArrayRef<uint32_t> ignoredCallers) const;

    size_t indexedBodies() const { return indexedBodies_; }
    size_t malformedBodies() const { return malformedBodies_; }

private:
    bool hasKind(uint32_t token, UsageKind kind) const;

    llvm::DenseMap<uint32_t, llvm::SmallVector<UsageReference, 2>> refs_;
    size_t indexedBodies_ = 0;
    size_t malformedBodies_ = 0;
};

} // namespace stubscan
