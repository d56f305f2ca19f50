#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

namespace stubscan {

class SS004_UnsealedAbstract : public Rule {
public:
    std::string_view getID() const override { return "SS004"; }
    std::string_view getTitle() const override { return "Abstract Member on Concrete Class"; }
    ViolationCategory getCategory() const override {
        return ViolationCategory::IncompleteImplementation;
    }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        const MemberDescriptor *M = S.member;
        if (!M || !M->isAbstract)
            return RuleVerdict::pass();
        if (!S.type->isClass() || S.type->isAbstract)
            return RuleVerdict::pass();

        return RuleVerdict::fail("abstract " + std::string(memberKindName(M->kind)) + " '" +
                                 M->name + "' is declared on non-abstract class '" +
                                 S.type->name() + "'");
    }
};

std::unique_ptr<Rule> createUnsealedAbstractRule() {
    return std::make_unique<SS004_UnsealedAbstract>();
}

} // namespace stubscan
