#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

#include <sstream>

namespace stubscan {

// Very short bodies that do no observable work. Single-return and
// default-return bodies belong to SS007 and SS001.
class SS002_MinimalBody : public Rule {
public:
    std::string_view getID() const override { return "SS002"; }
    std::string_view getTitle() const override { return "Minimal Body"; }
    ViolationCategory getCategory() const override { return ViolationCategory::PlaceholderCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        using il::BodyPatternAnalyzer;

        const MemberDescriptor *M = S.member;
        if (!M || M->kind != MemberKind::Method || !M->hasBody())
            return RuleVerdict::pass();
        if (M->isSpecialName || M->isAbstract || M->isVirtual)
            return RuleVerdict::pass();
        if (isLikelyEventHandler(*M))
            return RuleVerdict::pass();

        const auto &body = *M->body;
        if (body.size() > Ctx.config().minimalBodyBytes)
            return RuleVerdict::pass();
        if (BodyPatternAnalyzer::isSingleReturn(body) ||
            BodyPatternAnalyzer::returnsOnlyDefault(body, M->returnsVoid()) ||
            BodyPatternAnalyzer::hasMeaningfulOpcodes(body))
            return RuleVerdict::pass();

        double score = BodyPatternAnalyzer::incompletenessScore(body, M->returnsVoid());

        std::ostringstream os;
        os << "'" << M->name << "' has a " << body.size()
           << "-byte body with no calls, branches, stores or field access";
        if (BodyPatternAnalyzer::returnsConstant(body))
            os << " and returns a constant";
        os << " (incompleteness " << static_cast<int>(score * 100) << "%)";
        return RuleVerdict::fail(os.str());
    }
};

std::unique_ptr<Rule> createMinimalBodyRule() {
    return std::make_unique<SS002_MinimalBody>();
}

} // namespace stubscan
