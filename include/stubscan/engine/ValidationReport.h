#pragma once

#include "stubscan/core/Violation.h"

#include <llvm/ADT/MapVector.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace stubscan {

enum class PhaseState : uint8_t {
    Completed,
    Disabled,
    Stopped,   // ended early by stop-on-first-violation
    Cancelled, // stop token fired mid-phase
};

constexpr std::string_view phaseStateName(PhaseState s) {
    switch (s) {
        case PhaseState::Completed: return "completed";
        case PhaseState::Disabled:  return "disabled";
        case PhaseState::Stopped:   return "stopped";
        case PhaseState::Cancelled: return "cancelled";
    }
    return "completed";
}

struct PhaseResult {
    std::string name;
    PhaseState state = PhaseState::Completed;
    std::vector<Violation> violations;
    std::vector<std::string> notes;

    size_t symbolsAnalyzed = 0;
    size_t ruleEvaluations = 0;
    size_t ruleFaults = 0;
};

struct ValidationReport {
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::chrono::milliseconds duration{0};

    // Insertion order is execution order.
    llvm::MapVector<std::string, PhaseResult, std::map<std::string, unsigned>> phases;
    std::vector<std::string> notes;

    std::vector<Violation> violations; // flattened, phase order
    double score = 100.0;
    bool fullyCompliant = true;
    bool cancelled = false;

    const PhaseResult *findPhase(std::string_view name) const;
    size_t totalRuleEvaluations() const;
    size_t totalRuleFaults() const;

    // Flattens phase violations and derives score and compliance.
    void finalize(double violationPenalty);

    static double computeScore(size_t violationCount, double violationPenalty);
};

} // namespace stubscan
