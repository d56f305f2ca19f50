#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

namespace stubscan {

class SS007_ColdMethod : public Rule {
public:
    std::string_view getID() const override { return "SS007"; }
    std::string_view getTitle() const override { return "Cold Method"; }
    ViolationCategory getCategory() const override { return ViolationCategory::UnusedCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        const MemberDescriptor *M = S.member;
        if (!M || M->kind != MemberKind::Method || !M->hasBody())
            return RuleVerdict::pass();
        if (M->isSpecialName || M->isAbstract || M->isVirtual)
            return RuleVerdict::pass();

        if (!il::BodyPatternAnalyzer::isSingleReturn(*M->body))
            return RuleVerdict::pass();

        return RuleVerdict::fail("method '" + M->name + "' does nothing but return");
    }
};

std::unique_ptr<Rule> createColdMethodRule() {
    return std::make_unique<SS007_ColdMethod>();
}

} // namespace stubscan
