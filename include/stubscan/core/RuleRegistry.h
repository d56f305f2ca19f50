#pragma once

#include "stubscan/core/Rule.h"

#include <memory>
#include <string_view>
#include <vector>

namespace stubscan {

// Owns the rule catalog. Built once at startup from an explicit list and
// read-only afterwards, so one registry may be shared across threads.
class RuleRegistry {
public:
    RuleRegistry() = default;
    RuleRegistry(RuleRegistry &&) = default;
    RuleRegistry &operator=(RuleRegistry &&) = default;

    static RuleRegistry withBuiltinRules();

    // Duplicate IDs are rejected; returns false in that case.
    bool registerRule(std::unique_ptr<Rule> rule);

    const std::vector<std::unique_ptr<Rule>> &rules() const { return rules_; }

    const Rule *findByID(std::string_view id) const;

private:
    std::vector<std::unique_ptr<Rule>> rules_;
};

} // namespace stubscan
