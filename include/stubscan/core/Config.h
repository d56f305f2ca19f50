#pragma once

#include <llvm/Support/Error.h>

#include <cstddef>
#include <string>
#include <vector>

namespace stubscan {

struct BenchmarkOptions {
    unsigned actorsPerBatch       = 9;
    unsigned batches              = 3;
    unsigned iterationsPerActor   = 1;

    // Empirical thresholds. Recalibrate against real corpora before
    // treating either flag as more than a hint.
    double contentionThresholdPercent = 150.0;
    double minOpsPerSecond            = 10000.0;
};

struct Config {
    // Assembly selection
    std::vector<std::string> assemblyFilters;   // include substrings; empty = all
    std::vector<std::string> assemblyExcludes;  // deny substrings
    bool includeHostFrameworkAssemblies = false;
    std::vector<std::string> customTypeAllowList; // fully-qualified names

    // Phase / rule selection
    std::vector<std::string> disabledPhases;
    std::vector<std::string> disabledRules;

    // Execution
    bool stopOnFirstViolation = false;
    unsigned yieldInterval    = 0;    // symbols per suspension point; 0 = run to end
    bool verbose              = false;
    // Append a benchmark-only phase after the rule phases. Notes only.
    bool syncPointPhase       = false;

    // Scoring
    double violationPenalty   = 5.0;

    // Body heuristics
    unsigned stubWeightThreshold = 3;  // SS001/SS009, tuned empirically
    size_t minimalBodyBytes      = 5;  // SS002

    // Marker attribute names (matched with or without "Attribute" suffix)
    std::vector<std::string> exemptionAttributes  = {"StubScanIgnore", "AnalysisExempt"};
    std::vector<std::string> completenessMarkers  = {"Complete", "Finished", "Done"};
    std::vector<std::string> deprecationMarkers   = {"Obsolete", "Deprecated"};

    BenchmarkOptions benchmark;

    bool isPhaseEnabled(const std::string &phase) const;
    bool isRuleEnabled(const std::string &ruleID) const;

    // Structural checks that do not depend on the rule catalog.
    llvm::Error validate() const;

    static Config loadFromFile(const std::string &path);
    static Config defaults();
};

} // namespace stubscan
