#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

namespace stubscan {

class SS011_EmptyInterface : public Rule {
public:
    std::string_view getID() const override { return "SS011"; }
    std::string_view getTitle() const override { return "Empty Interface"; }
    ViolationCategory getCategory() const override {
        return ViolationCategory::IncompleteImplementation;
    }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        if (!S.isTypeLevel() || !S.type->isInterface() || !S.type->members().empty())
            return RuleVerdict::pass();
        return RuleVerdict::fail("interface '" + S.type->name() +
                                 "' declares no members and defines no contract");
    }
};

std::unique_ptr<Rule> createEmptyInterfaceRule() {
    return std::make_unique<SS011_EmptyInterface>();
}

} // namespace stubscan
