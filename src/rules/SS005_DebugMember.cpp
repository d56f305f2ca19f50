#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

namespace stubscan {

class SS005_DebugMember : public Rule {
public:
    std::string_view getID() const override { return "SS005"; }
    std::string_view getTitle() const override { return "Debug or Temporary Member"; }
    ViolationCategory getCategory() const override { return ViolationCategory::DebuggingCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || M->isSpecialName)
            return RuleVerdict::pass();

        std::string_view name = M->name;
        bool looksTemporary = hasNameWord(name, "Debug", false) ||
                              hasNameWord(name, "Test", false) ||
                              hasNameWord(name, "Temp", true);
        if (!looksTemporary)
            return RuleVerdict::pass();

        if (hasAnyAttribute(M->attributes, Ctx.config().deprecationMarkers))
            return RuleVerdict::pass();

        return RuleVerdict::fail(std::string(memberKindName(M->kind)) + " '" + M->name +
                                 "' looks like debug or temporary code but carries no "
                                 "deprecation marker");
    }
};

std::unique_ptr<Rule> createDebugMemberRule() {
    return std::make_unique<SS005_DebugMember>();
}

} // namespace stubscan
