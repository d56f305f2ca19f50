#include "stubscan/metadata/UsageIndex.h"
#include "stubscan/il/InstructionDecoder.h"

#include <llvm/ADT/STLExtras.h>

#include <optional>
#include <vector>

namespace stubscan {

namespace {

std::optional<UsageKind> classify(const il::Instruction &I) {
    using il::Opcode;
    if (I.operandKind != il::OperandKind::Token)
        return std::nullopt;

    if (I.is(Opcode::LdFld) || I.is(Opcode::LdFlda) ||
        I.is(Opcode::LdsFld) || I.is(Opcode::LdsFlda))
        return UsageKind::Read;
    if (I.is(Opcode::StFld) || I.is(Opcode::StsFld))
        return UsageKind::Write;
    if (I.is(Opcode::Call) || I.is(Opcode::CallVirt) || I.is(Opcode::NewObj) ||
        I.is(Opcode::LdFtn) || I.is(Opcode::LdVirtFtn))
        return UsageKind::Call;
    return std::nullopt;
}

// DenseMapInfo<uint32_t> reserves these two as its empty and tombstone
// keys. Table 0xFF does not exist, so neither names a real row.
bool isIndexableToken(uint32_t token) {
    return token != llvm::DenseMapInfo<uint32_t>::getEmptyKey() &&
           token != llvm::DenseMapInfo<uint32_t>::getTombstoneKey();
}

} // anonymous namespace

UsageIndex UsageIndex::build(llvm::ArrayRef<AssemblyHandle> assemblies) {
    UsageIndex index;
    for (AssemblyHandle A : assemblies) {
        if (!A)
            continue;
        for (const auto &T : A->types())
            index.indexType(*T);
    }
    return index;
}

void UsageIndex::indexType(const TypeDescriptor &T) {
    std::vector<const TypeDescriptor *> stack = {&T};
    while (!stack.empty()) {
        const TypeDescriptor *cur = stack.back();
        stack.pop_back();

        for (const auto &M : cur->members())
            indexBody(M);
        for (const auto &N : cur->nestedTypes())
            stack.push_back(N.get());
    }
}

void UsageIndex::indexBody(const MemberDescriptor &M) {
    if (!M.isMethodLike() || !M.hasBody())
        return;

    ++indexedBodies_;
    il::InstructionDecoder decoder(*M.body);
    while (auto I = decoder.next()) {
        auto kind = classify(*I);
        if (kind && isIndexableToken(I->token()))
            refs_[I->token()].push_back({M.token, *kind});
    }
    // References decoded before the bad byte are kept.
    if (decoder.malformed())
        ++malformedBodies_;
}

llvm::ArrayRef<UsageReference> UsageIndex::referencesTo(uint32_t token) const {
    if (!isIndexableToken(token))
        return {};
    auto it = refs_.find(token);
    if (it == refs_.end())
        return {};
    return it->second;
}

bool UsageIndex::hasKind(uint32_t token, UsageKind kind) const {
    return llvm::any_of(referencesTo(token),
                        [kind](const UsageReference &r) { return r.kind == kind; });
}

bool UsageIndex::isRead(uint32_t token) const {
    return hasKind(token, UsageKind::Read);
}

bool UsageIndex::isCalled(uint32_t token) const {
    return hasKind(token, UsageKind::Call);
}

bool UsageIndex::isReferencedOutside(uint32_t token,
                                     llvm::ArrayRef<uint32_t> ignoredCallers) const {
    return llvm::any_of(referencesTo(token), [&](const UsageReference &r) {
        return !llvm::is_contained(ignoredCallers, r.callerToken);
    });
}

} // namespace stubscan
