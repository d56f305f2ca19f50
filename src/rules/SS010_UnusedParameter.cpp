#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/SmallVector.h>

#include <sstream>

namespace stubscan {

class SS010_UnusedParameter : public Rule {
public:
    std::string_view getID() const override { return "SS010"; }
    std::string_view getTitle() const override { return "Unused Parameter"; }
    ViolationCategory getCategory() const override { return ViolationCategory::UnusedCode; }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || !M->isMethodLike() || !M->hasBody() || M->parameters.empty())
            return RuleVerdict::pass();
        if (M->isAbstract || M->isVirtual || isLikelyEventHandler(*M))
            return RuleVerdict::pass();

        const auto &body = *M->body;
        // Stubs ignore their arguments by definition; SS001 reports those.
        if (Ctx.bodies().isPlaceholderStub(body))
            return RuleVerdict::pass();

        llvm::SmallVector<unsigned, 8> slots;
        if (!il::BodyPatternAnalyzer::collectArgumentReferences(body, slots))
            return RuleVerdict::pass();

        // Slot 0 is `this` on instance methods.
        const unsigned first = M->isStatic ? 0 : 1;
        std::vector<std::string> unused;
        for (unsigned i = 0; i < M->parameters.size(); ++i) {
            const auto &name = M->parameters[i].name;
            if (!name.empty() && name.front() == '_')
                continue;
            if (!llvm::is_contained(slots, first + i))
                unused.push_back(name.empty() ? "#" + std::to_string(i) : name);
        }

        if (unused.empty())
            return RuleVerdict::pass();

        std::ostringstream os;
        os << "'" << M->name << "' never uses parameter"
           << (unused.size() > 1 ? "s " : " ") << joinNames(unused);
        return RuleVerdict::fail(os.str());
    }
};

std::unique_ptr<Rule> createUnusedParameterRule() {
    return std::make_unique<SS010_UnusedParameter>();
}

} // namespace stubscan
