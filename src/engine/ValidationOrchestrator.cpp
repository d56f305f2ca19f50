#include "stubscan/engine/ValidationOrchestrator.h"
#include "stubscan/engine/AnalysisContext.h"
#include "stubscan/bench/ConcurrencyBenchmark.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/StringSet.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/raw_ostream.h>

#include <exception>
#include <limits>

namespace stubscan {

namespace {

llvm::Error invalid(const llvm::Twine &msg) {
    return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                   "invalid configuration: " + msg);
}

enum class Exemption : uint8_t { None, Valid, Blank };

Exemption exemptionIn(const Config &cfg,
                      const std::vector<Attribute> &attrs,
                      bool unreadable,
                      std::string *markerName) {
    if (unreadable)
        return Exemption::None;

    Exemption result = Exemption::None;
    for (const auto &wanted : cfg.exemptionAttributes) {
        for (const auto &attr : attrs) {
            if (!attributeNameMatches(attr.name, wanted))
                continue;
            if (attr.argument && !llvm::StringRef(*attr.argument).trim().empty())
                return Exemption::Valid;
            result = Exemption::Blank;
            if (markerName)
                *markerName = attr.name;
        }
    }
    return result;
}

bool typeChainExempt(const Config &cfg, const TypeDescriptor *T) {
    for (; T; T = T->enclosingType()) {
        if (exemptionIn(cfg, T->attributes, T->attributesUnreadable, nullptr) == Exemption::Valid)
            return true;
    }
    return false;
}

std::string qualifiedName(const Symbol &S) {
    if (S.isTypeLevel())
        return S.type->fullName();
    return S.type->fullName() + "." + S.member->name;
}

} // anonymous namespace

std::vector<PhaseSpec> defaultPhases() {
    return {
        {"Integrity",  {"SS001", "SS002", "SS004", "SS005", "SS006",
                        "SS007", "SS009", "SS010", "SS013"}},
        {"Conceptual", {"SS003", "SS008", "SS011", "SS012"}},
    };
}

// --- ValidationOrchestrator ---

llvm::Expected<ValidationOrchestrator>
ValidationOrchestrator::create(Config cfg, const RuleRegistry &registry,
                               std::vector<PhaseSpec> phases) {
    if (auto err = cfg.validate())
        return std::move(err);

    for (const auto &id : cfg.disabledRules) {
        if (!registry.findByID(id))
            return invalid("disabled_rules names unknown rule '" + id + "'");
    }

    llvm::StringSet<> phaseNames;
    for (const auto &phase : phases) {
        if (llvm::StringRef(phase.name).trim().empty())
            return invalid("phase with a blank name");
        if (!phaseNames.insert(phase.name).second)
            return invalid("duplicate phase '" + phase.name + "'");
        if (cfg.syncPointPhase && phase.name == kSyncPointPhase)
            return invalid("phase name '" + phase.name + "' is reserved by sync_point_phase");
    }

    for (const auto &name : cfg.disabledPhases) {
        if (!phaseNames.contains(name))
            return invalid("disabled_phases names unknown phase '" + name + "'");
    }

    std::vector<ResolvedPhase> resolved;
    for (const auto &phase : phases) {
        ResolvedPhase rp;
        rp.name = phase.name;
        rp.enabled = cfg.isPhaseEnabled(phase.name);
        for (const auto &id : phase.ruleIDs) {
            const Rule *rule = registry.findByID(id);
            if (!rule)
                return invalid("phase '" + phase.name + "' references unknown rule '" + id + "'");
            if (cfg.isRuleEnabled(id))
                rp.rules.push_back(rule);
        }
        resolved.push_back(std::move(rp));
    }

    return ValidationOrchestrator(std::move(cfg), std::move(phases), std::move(resolved));
}

ValidationSession ValidationOrchestrator::begin(std::vector<AssemblyHandle> assemblies,
                                                std::stop_token stop) const {
    return ValidationSession(*this, std::move(assemblies), std::move(stop));
}

ValidationReport ValidationOrchestrator::run(std::vector<AssemblyHandle> assemblies,
                                             std::stop_token stop) const {
    ValidationSession session = begin(std::move(assemblies), std::move(stop));
    while (session.advance()) {
    }
    return session.takeReport();
}

// --- ValidationSession ---

ValidationSession::ValidationSession(const ValidationOrchestrator &owner,
                                     std::vector<AssemblyHandle> assemblies,
                                     std::stop_token stop)
    : owner_(&owner),
      assemblies_(std::move(assemblies)),
      stop_(std::move(stop)),
      clockStart_(std::chrono::steady_clock::now()),
      bodies_(owner.config_.stubWeightThreshold) {
    report_.startedAt = std::chrono::system_clock::now();
}

bool ValidationSession::advance() {
    switch (state_) {
        case State::Walking:
            walk();
            break;
        case State::RunningPhase:
            runSlice();
            break;
        case State::Finished:
        case State::Cancelled:
            break;
    }
    return !done();
}

void ValidationSession::walk() {
    const Config &cfg = owner_->config_;
    MetadataWalker walker(cfg);
    WalkResult walked = walker.walk(assemblies_, stop_);

    for (auto &note : walked.notes)
        report_.notes.push_back(std::move(note));

    if (walked.cancelled) {
        report_.notes.push_back("cancelled while walking metadata");
        finish(State::Cancelled);
        return;
    }

    symbols_ = std::move(walked.symbols);
    // References from scaffolding count, so index every loaded type.
    usage_ = UsageIndex::build(assemblies_);
    if (usage_.malformedBodies() > 0) {
        report_.notes.push_back(std::to_string(usage_.malformedBodies()) +
                                " method body(ies) could not be fully decoded");
    }
    computeExemptions();

    state_ = State::RunningPhase;
    startNextPhase();
}

void ValidationSession::computeExemptions() {
    const Config &cfg = owner_->config_;
    exempt_.assign(symbols_.size(), false);

    for (size_t i = 0; i < symbols_.size(); ++i) {
        const Symbol &S = symbols_[i];
        std::string marker;

        Exemption own = S.isTypeLevel()
            ? exemptionIn(cfg, S.type->attributes, S.type->attributesUnreadable, &marker)
            : exemptionIn(cfg, S.member->attributes, false, &marker);

        if (own == Exemption::Blank) {
            report_.notes.push_back("ignored exemption marker '" + marker + "' on '" +
                                    qualifiedName(S) + "': no justification given");
        }

        exempt_[i] = own == Exemption::Valid || typeChainExempt(cfg, S.type);
    }
}

void ValidationSession::startNextPhase() {
    const Config &cfg = owner_->config_;
    const auto &phases = owner_->resolved_;

    while (phaseIndex_ < phases.size() && !phases[phaseIndex_].enabled) {
        PhaseResult disabled;
        disabled.name = phases[phaseIndex_].name;
        disabled.state = PhaseState::Disabled;
        disabled.notes.push_back("phase disabled by configuration");
        report_.phases.insert({disabled.name, std::move(disabled)});
        ++phaseIndex_;
    }

    if (phaseIndex_ >= phases.size()) {
        if (cfg.syncPointPhase && !stop_.stop_requested())
            runSyncPointPhase();
        finish(State::Finished);
        return;
    }

    current_ = PhaseResult{};
    current_.name = phases[phaseIndex_].name;
    cursor_ = 0;

    if (cfg.verbose)
        llvm::errs() << "stubscan: phase " << current_.name << " ("
                     << phases[phaseIndex_].rules.size() << " rules, "
                     << symbols_.size() << " symbols)\n";
}

void ValidationSession::runSlice() {
    const Config &cfg = owner_->config_;
    const size_t budget = cfg.yieldInterval ? cfg.yieldInterval
                                            : std::numeric_limits<size_t>::max();
    AnalysisContext ctx(cfg, usage_, bodies_);

    for (size_t n = 0; n < budget && cursor_ < symbols_.size(); ++n) {
        if (stop_.stop_requested()) {
            current_.notes.push_back("cancelled before all symbols were analyzed");
            closePhase(PhaseState::Cancelled);
            report_.notes.push_back("run cancelled");
            finish(State::Cancelled);
            return;
        }

        size_t index = cursor_++;
        if (exempt_[index])
            continue;

        evaluateSymbol(symbols_[index], ctx);

        if (cfg.stopOnFirstViolation && !current_.violations.empty()) {
            current_.notes.push_back("stopped after first violation");
            closePhase(PhaseState::Stopped);
            finish(State::Finished);
            return;
        }
    }

    reportProgress();

    if (cursor_ < symbols_.size())
        return;

    closePhase(PhaseState::Completed);
    ++phaseIndex_;
    startNextPhase();
}

void ValidationSession::evaluateSymbol(const Symbol &S, const AnalysisContext &Ctx) {
    const auto &phase = owner_->resolved_[phaseIndex_];
    ++current_.symbolsAnalyzed;

    for (const Rule *rule : phase.rules) {
        ++current_.ruleEvaluations;
        RuleVerdict verdict;
        try {
            verdict = rule->evaluate(S, Ctx);
        } catch (const std::exception &e) {
            recordFault(*rule, S, e.what());
            continue;
        } catch (...) {
            recordFault(*rule, S, "unknown exception");
            continue;
        }

        if (!verdict.violated)
            continue;

        Violation v;
        v.ruleID     = std::string(rule->getID());
        v.typeName   = S.type->fullName();
        v.memberName = S.displayName();
        v.message    = std::move(verdict.message);
        v.category   = rule->getCategory();
        v.assembly   = S.assembly ? S.assembly->name() : std::string();
        current_.violations.push_back(std::move(v));
    }
}

void ValidationSession::runSyncPointPhase() {
    const Config &cfg = owner_->config_;
    if (cfg.verbose)
        llvm::errs() << "stubscan: phase " << std::string(kSyncPointPhase) << " ("
                     << cfg.benchmark.actorsPerBatch * cfg.benchmark.batches << " actors)\n";

    // Actors run the rule phases only.
    Config actorConfig = cfg;
    actorConfig.syncPointPhase = false;
    actorConfig.verbose = false;
    ValidationOrchestrator actors(std::move(actorConfig), owner_->phaseSpecs_, owner_->resolved_);

    std::vector<std::vector<AssemblyHandle>> partitions;
    for (AssemblyHandle A : assemblies_)
        partitions.push_back({A});

    ConcurrencyBenchmark bench(cfg.benchmark);
    BenchmarkResult result = bench.runOrchestrator(actors, partitions);

    const bool passed = !result.contention && !result.lowThroughput && result.failedActors() == 0;

    PhaseResult phase;
    phase.name = std::string(kSyncPointPhase);
    phase.notes.push_back(std::string("sync point benchmark ") + (passed ? "passed" : "failed") +
                          " with " + std::to_string(result.actorCount) + " actors");
    for (const auto &w : result.warnings)
        phase.notes.push_back("warning: " + w);
    for (const auto &ok : result.successes)
        phase.notes.push_back(ok);

    std::string name = phase.name;
    report_.phases.insert({std::move(name), std::move(phase)});
}

void ValidationSession::recordFault(const Rule &rule, const Symbol &S, std::string_view what) {
    ++current_.ruleFaults;
    current_.notes.push_back("rule " + std::string(rule.getID()) + " faulted on '" +
                             qualifiedName(S) + "': " + std::string(what));
}

void ValidationSession::closePhase(PhaseState state) {
    current_.state = state;

    if (state == PhaseState::Completed) {
        if (current_.symbolsAnalyzed == 0)
            current_.notes.push_back("inconclusive: no symbols to analyze");
        else if (current_.ruleFaults > 0)
            current_.notes.push_back("inconclusive: " + std::to_string(current_.ruleFaults) +
                                     " rule evaluation(s) faulted");
        else if (current_.violations.empty())
            current_.notes.push_back("clean: no violations");
    }

    std::string name = current_.name;
    report_.phases.insert({std::move(name), std::move(current_)});
    current_ = PhaseResult{};
}

void ValidationSession::finish(State terminal) {
    state_ = terminal;
    report_.cancelled = terminal == State::Cancelled;
    report_.finishedAt = std::chrono::system_clock::now();
    report_.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - clockStart_);
    report_.finalize(owner_->config_.violationPenalty);
}

void ValidationSession::reportProgress() const {
    if (!owner_->progress_)
        return;
    owner_->progress_(SessionProgress{current_.name, cursor_, symbols_.size()});
}

} // namespace stubscan
