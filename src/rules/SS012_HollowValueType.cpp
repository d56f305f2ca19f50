#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

#include <llvm/ADT/STLExtras.h>

namespace stubscan {

class SS012_HollowValueType : public Rule {
public:
    std::string_view getID() const override { return "SS012"; }
    std::string_view getTitle() const override { return "Hollow Value Type"; }
    ViolationCategory getCategory() const override { return ViolationCategory::PlaceholderCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        if (!S.isTypeLevel() || S.type->kind() != TypeKind::Struct)
            return RuleVerdict::pass();

        bool holdsData = llvm::any_of(S.type->members(), [](const MemberDescriptor &M) {
            return M.kind == MemberKind::Field || M.kind == MemberKind::Property;
        });
        if (holdsData)
            return RuleVerdict::pass();

        return RuleVerdict::fail("struct '" + S.type->name() +
                                 "' has no fields or properties");
    }
};

std::unique_ptr<Rule> createHollowValueTypeRule() {
    return std::make_unique<SS012_HollowValueType>();
}

} // namespace stubscan
