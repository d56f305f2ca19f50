#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

#include <llvm/ADT/SmallVector.h>

namespace stubscan {

// Auto-implemented property whose accessors nobody but each other touches.
class SS006_PhantomProperty : public Rule {
public:
    std::string_view getID() const override { return "SS006"; }
    std::string_view getTitle() const override { return "Phantom Property"; }
    ViolationCategory getCategory() const override { return ViolationCategory::UnusedCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || M->kind != MemberKind::Property || !M->isAutoImplemented)
            return RuleVerdict::pass();
        if (M->getterToken == 0 && M->setterToken == 0)
            return RuleVerdict::pass(); // nothing to look up

        llvm::SmallVector<uint32_t, 2> own;
        if (M->getterToken) own.push_back(M->getterToken);
        if (M->setterToken) own.push_back(M->setterToken);

        const UsageIndex &usage = Ctx.usage();
        for (uint32_t accessor : own) {
            if (usage.isReferencedOutside(accessor, own))
                return RuleVerdict::pass();
        }

        return RuleVerdict::fail("auto-property '" + M->name +
                                 "' is never read or written outside its own accessors");
    }
};

std::unique_ptr<Rule> createPhantomPropertyRule() {
    return std::make_unique<SS006_PhantomProperty>();
}

} // namespace stubscan
