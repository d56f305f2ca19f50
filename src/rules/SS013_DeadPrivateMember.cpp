#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

namespace stubscan {

class SS013_DeadPrivateMember : public Rule {
public:
    std::string_view getID() const override { return "SS013"; }
    std::string_view getTitle() const override { return "Dead Private Member"; }
    ViolationCategory getCategory() const override { return ViolationCategory::UnusedCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || M->visibility != Visibility::Private || M->token == 0)
            return RuleVerdict::pass();

        const UsageIndex &usage = Ctx.usage();

        if (M->kind == MemberKind::Field) {
            // const and readonly fields are configuration, not state.
            if (M->isLiteral || M->isInitOnly)
                return RuleVerdict::pass();
            if (usage.isRead(M->token))
                return RuleVerdict::pass();
            return RuleVerdict::fail("private field '" + M->name + "' is never read");
        }

        if (M->kind == MemberKind::Method) {
            if (M->isSpecialName || M->isVirtual || M->isAbstract)
                return RuleVerdict::pass();
            if (isLifecycleMethodName(M->name) || isLikelyEventHandler(*M) || isEntryPoint(*M))
                return RuleVerdict::pass();
            if (usage.isCalled(M->token))
                return RuleVerdict::pass();
            return RuleVerdict::fail("private method '" + M->name + "' is never called");
        }

        return RuleVerdict::pass();
    }
};

std::unique_ptr<Rule> createDeadPrivateMemberRule() {
    return std::make_unique<SS013_DeadPrivateMember>();
}

} // namespace stubscan
