#include "stubscan/core/Rule.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/rules/RuleSupport.h"

#include <llvm/ADT/SmallPtrSet.h>
#include <llvm/ADT/StringSet.h>

#include <sstream>

namespace stubscan {

class SS003_IncompleteClass : public Rule {
public:
    std::string_view getID() const override { return "SS003"; }
    std::string_view getTitle() const override { return "Incomplete Class"; }
    ViolationCategory getCategory() const override {
        return ViolationCategory::IncompleteImplementation;
    }

    RuleVerdict evaluate(const Symbol &S, const AnalysisContext & /*Ctx*/) const override {
        if (!S.isTypeLevel())
            return RuleVerdict::pass();
        const TypeDescriptor *T = S.type;
        if (!T->isClass() || T->isAbstract || !T->baseType)
            return RuleVerdict::pass();

        // Concrete members seen so far, walking from the class upwards.
        llvm::StringSet<> implemented;
        for (const auto &M : T->members()) {
            if (!M.isAbstract)
                implemented.insert(M.name);
        }

        std::vector<std::string> missing;
        llvm::StringSet<> reported;
        llvm::SmallPtrSet<const TypeDescriptor *, 8> visited;
        visited.insert(T);

        for (const TypeDescriptor *B = T->baseType; B && visited.insert(B).second;
             B = B->baseType) {
            for (const auto &M : B->members()) {
                if (!M.isAbstract)
                    continue;
                if (implemented.contains(M.name) || !reported.insert(M.name).second)
                    continue;
                missing.push_back(B->name() + "." + M.name);
            }
            for (const auto &M : B->members()) {
                if (!M.isAbstract)
                    implemented.insert(M.name);
            }
        }

        if (missing.empty())
            return RuleVerdict::pass();

        std::ostringstream os;
        os << "class '" << T->name() << "' is not abstract but leaves "
           << missing.size() << " inherited abstract member(s) unimplemented: "
           << joinNames(missing);
        return RuleVerdict::fail(os.str());
    }
};

std::unique_ptr<Rule> createIncompleteClassRule() {
    return std::make_unique<SS003_IncompleteClass>();
}

} // namespace stubscan
