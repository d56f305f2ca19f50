#pragma once

#include "stubscan/core/Config.h"
#include "stubscan/core/RuleRegistry.h"
#include "stubscan/engine/ValidationReport.h"
#include "stubscan/il/BodyPatternAnalyzer.h"
#include "stubscan/metadata/MetadataWalker.h"
#include "stubscan/metadata/UsageIndex.h"

#include <llvm/Support/Error.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace stubscan {

struct PhaseSpec {
    std::string name;
    std::vector<std::string> ruleIDs;
};

// Integrity (member-level body and usage rules), then Conceptual
// (type-level shape rules).
std::vector<PhaseSpec> defaultPhases();

// Name of the phase added by Config::syncPointPhase.
inline constexpr std::string_view kSyncPointPhase = "SyncPointPerformance";

struct SessionProgress {
    std::string_view phase;
    size_t processed = 0;
    size_t total = 0;
};

using ProgressCallback = std::function<void(const SessionProgress &)>;

class ValidationOrchestrator;

// One in-progress run. Walking -> RunningPhase -> Finished, or Cancelled
// when the stop token fires. Each advance() does a bounded slice of work
// (Config::yieldInterval symbols, 0 = unbounded) and returns, so a host
// event loop can interleave its own work. Must not outlive the
// orchestrator that began it.
class ValidationSession {
public:
    enum class State : uint8_t { Walking, RunningPhase, Finished, Cancelled };

    // Returns true while more work remains.
    bool advance();

    State state() const { return state_; }
    bool done() const { return state_ == State::Finished || state_ == State::Cancelled; }

    const ValidationReport &report() const { return report_; }
    ValidationReport takeReport() { return std::move(report_); }

private:
    friend class ValidationOrchestrator;

    ValidationSession(const ValidationOrchestrator &owner,
                      std::vector<AssemblyHandle> assemblies,
                      std::stop_token stop);

    void walk();
    void computeExemptions();
    void startNextPhase();
    void runSlice();
    void evaluateSymbol(const Symbol &S, const AnalysisContext &Ctx);
    void recordFault(const Rule &rule, const Symbol &S, std::string_view what);
    void runSyncPointPhase();
    void closePhase(PhaseState state);
    void finish(State terminal);
    void reportProgress() const;

    const ValidationOrchestrator *owner_;
    std::vector<AssemblyHandle> assemblies_;
    std::stop_token stop_;

    State state_ = State::Walking;
    std::chrono::steady_clock::time_point clockStart_;

    std::vector<Symbol> symbols_;
    std::vector<bool> exempt_;
    UsageIndex usage_;
    il::BodyPatternAnalyzer bodies_;

    size_t phaseIndex_ = 0;
    size_t cursor_ = 0;
    PhaseResult current_;

    ValidationReport report_;
};

// Runs the rule catalog over assemblies in named phases and produces a
// ValidationReport. Immutable after create(); begin() and run() keep all
// per-run state in the session, so one orchestrator may serve several
// threads at once.
class ValidationOrchestrator {
public:
    static llvm::Expected<ValidationOrchestrator>
    create(Config cfg, const RuleRegistry &registry,
           std::vector<PhaseSpec> phases = defaultPhases());

    ValidationSession begin(std::vector<AssemblyHandle> assemblies,
                            std::stop_token stop = {}) const;

    // Drives a session to completion.
    ValidationReport run(std::vector<AssemblyHandle> assemblies,
                         std::stop_token stop = {}) const;

    // Must be set before the orchestrator is shared between threads.
    void setProgressCallback(ProgressCallback cb) { progress_ = std::move(cb); }

    const Config &config() const { return config_; }
    const std::vector<PhaseSpec> &phases() const { return phaseSpecs_; }

private:
    friend class ValidationSession;

    struct ResolvedPhase {
        std::string name;
        bool enabled = true;
        std::vector<const Rule *> rules; // enabled rules only
    };

    ValidationOrchestrator(Config cfg, std::vector<PhaseSpec> specs,
                           std::vector<ResolvedPhase> resolved)
        : config_(std::move(cfg)), phaseSpecs_(std::move(specs)),
          resolved_(std::move(resolved)) {}

    Config config_;
    std::vector<PhaseSpec> phaseSpecs_;
    std::vector<ResolvedPhase> resolved_;
    ProgressCallback progress_;
};

} // namespace stubscan
