#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

#include <optional>

namespace stubscan {

namespace {

// Where the member claims to be finished, if anywhere.
std::optional<std::string> completenessClaim(const MemberDescriptor &M, const Config &cfg) {
    for (const auto &attr : M.attributes) {
        for (const auto &marker : cfg.completenessMarkers) {
            if (!marker.empty() && attr.name.find(marker) != std::string::npos)
                return "attribute [" + attr.name + "]";
        }
    }
    for (const auto &marker : cfg.completenessMarkers) {
        if (!marker.empty() && containsWordInsensitive(M.summary, marker))
            return "documentation ('" + marker + "')";
    }
    return std::nullopt;
}

} // anonymous namespace

class SS009_PrematureCelebration : public Rule {
public:
    std::string_view getID() const override { return "SS009"; }
    std::string_view getTitle() const override { return "Premature Celebration"; }
    ViolationCategory getCategory() const override {
        return ViolationCategory::PrematureCelebration;
    }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext &Ctx) const override {
        const MemberDescriptor *M = S.member;
        if (!M || !M->isMethodLike() || !M->hasBody())
            return RuleVerdict::pass();

        auto claim = completenessClaim(*M, Ctx.config());
        if (!claim)
            return RuleVerdict::pass();

        if (!Ctx.bodies().isPlaceholderStub(*M->body))
            return RuleVerdict::pass();

        return RuleVerdict::fail("'" + M->name + "' is marked complete by " + *claim +
                                 " but its body is still a placeholder throw");
    }
};

std::unique_ptr<Rule> createPrematureCelebrationRule() {
    return std::make_unique<SS009_PrematureCelebration>();
}

} // namespace stubscan
