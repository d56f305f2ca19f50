#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"

#include <sstream>

namespace stubscan {

class SS001_PlaceholderBody : public Rule {
public:
    std::string_view getID() const override { return "SS001"; }
    std::string_view getTitle() const override { return "Placeholder Body"; }
    ViolationCategory getCategory() const override { return ViolationCategory::PlaceholderCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || !M->isMethodLike() || M->isAbstract || !M->hasBody())
            return RuleVerdict::pass();

        const auto &body = *M->body;
        il::ThrowAnalysis shape = Ctx.bodies().analyzeThrow(body);

        if (shape.shape == il::ThrowShape::PlaceholderStub) {
            std::ostringstream os;
            os << "'" << M->name << "' constructs and throws an exception with no real "
               << "logic in front of it (weight " << shape.weight << " <= "
               << Ctx.bodies().stubWeightThreshold() << "): placeholder stub";
            return RuleVerdict::fail(os.str());
        }

        if (il::BodyPatternAnalyzer::returnsOnlyDefault(body, M->returnsVoid())) {
            std::ostringstream os;
            os << "'" << M->name << "' only returns a hard-coded default ("
               << body.size() << "-byte body returning " << M->returnType << ")";
            return RuleVerdict::fail(os.str());
        }

        return RuleVerdict::pass();
    }
};

std::unique_ptr<Rule> createPlaceholderBodyRule() {
    return std::make_unique<SS001_PlaceholderBody>();
}

} // namespace stubscan
