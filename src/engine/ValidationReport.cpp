#include "stubscan/engine/ValidationReport.h"

#include <algorithm>

namespace stubscan {

const PhaseResult *ValidationReport::findPhase(std::string_view name) const {
    auto it = phases.find(std::string(name));
    return it != phases.end() ? &it->second : nullptr;
}

size_t ValidationReport::totalRuleEvaluations() const {
    size_t total = 0;
    for (const auto &entry : phases)
        total += entry.second.ruleEvaluations;
    return total;
}

size_t ValidationReport::totalRuleFaults() const {
    size_t total = 0;
    for (const auto &entry : phases)
        total += entry.second.ruleFaults;
    return total;
}

double ValidationReport::computeScore(size_t violationCount, double violationPenalty) {
    double raw = 100.0 - violationPenalty * static_cast<double>(violationCount);
    return std::clamp(raw, 0.0, 100.0);
}

void ValidationReport::finalize(double violationPenalty) {
    violations.clear();
    for (const auto &entry : phases) {
        const auto &v = entry.second.violations;
        violations.insert(violations.end(), v.begin(), v.end());
    }
    score = computeScore(violations.size(), violationPenalty);
    // A cancelled run has not looked at everything.
    fullyCompliant = violations.empty() && !cancelled;
}

} // namespace stubscan
