#include "stubscan/rules/BuiltinRules.h"
#include "stubscan/core/RuleRegistry.h"

#include <llvm/Support/raw_ostream.h>

#include <string>

namespace stubscan {

void registerBuiltinRules(RuleRegistry &registry) {
    std::unique_ptr<Rule> catalog[] = {
        createPlaceholderBodyRule(),
        createMinimalBodyRule(),
        createIncompleteClassRule(),
        createUnsealedAbstractRule(),
        createDebugMemberRule(),
        createPhantomPropertyRule(),
        createColdMethodRule(),
        createHollowEnumRule(),
        createPrematureCelebrationRule(),
        createUnusedParameterRule(),
        createEmptyInterfaceRule(),
        createHollowValueTypeRule(),
        createDeadPrivateMemberRule(),
    };

    for (auto &rule : catalog) {
        std::string id(rule->getID());
        if (!registry.registerRule(std::move(rule)))
            llvm::errs() << "stubscan: warning: rule " << id
                         << " is already registered, skipping\n";
    }
}

} // namespace stubscan
