#include "stubscan/core/RuleRegistry.h"
#include "stubscan/rules/BuiltinRules.h"

#include <algorithm>

namespace stubscan {

RuleRegistry RuleRegistry::withBuiltinRules() {
    RuleRegistry registry;
    registerBuiltinRules(registry);
    return registry;
}

bool RuleRegistry::registerRule(std::unique_ptr<Rule> rule) {
    if (!rule || findByID(rule->getID()))
        return false;
    rules_.push_back(std::move(rule));
    return true;
}

const Rule *RuleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [id](const auto &r) { return r->getID() == id; });
    return (it != rules_.end()) ? it->get() : nullptr;
}

} // namespace stubscan
