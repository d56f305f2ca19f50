#pragma once

#include "stubscan/core/Rule.h"

#include <memory>

namespace stubscan {

class RuleRegistry;

std::unique_ptr<Rule> createPlaceholderBodyRule();      // SS001
std::unique_ptr<Rule> createMinimalBodyRule();          // SS002
std::unique_ptr<Rule> createIncompleteClassRule();      // SS003
std::unique_ptr<Rule> createUnsealedAbstractRule();     // SS004
std::unique_ptr<Rule> createDebugMemberRule();          // SS005
std::unique_ptr<Rule> createPhantomPropertyRule();      // SS006
std::unique_ptr<Rule> createColdMethodRule();           // SS007
std::unique_ptr<Rule> createHollowEnumRule();           // SS008
std::unique_ptr<Rule> createPrematureCelebrationRule(); // SS009
std::unique_ptr<Rule> createUnusedParameterRule();      // SS010
std::unique_ptr<Rule> createEmptyInterfaceRule();       // SS011
std::unique_ptr<Rule> createHollowValueTypeRule();      // SS012
std::unique_ptr<Rule> createDeadPrivateMemberRule();    // SS013

// Registers the catalog above in ID order.
void registerBuiltinRules(RuleRegistry &registry);

} // namespace stubscan
