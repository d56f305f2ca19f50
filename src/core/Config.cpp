#include "stubscan/core/Config.h"

#include <llvm/ADT/StringExtras.h>
#include <llvm/ADT/Twine.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<stubscan::BenchmarkOptions> {
    static void mapping(IO &io, stubscan::BenchmarkOptions &opts) {
        io.mapOptional("actors_per_batch",             opts.actorsPerBatch);
        io.mapOptional("batches",                      opts.batches);
        io.mapOptional("iterations_per_actor",         opts.iterationsPerActor);
        io.mapOptional("contention_threshold_percent", opts.contentionThresholdPercent);
        io.mapOptional("min_ops_per_second",           opts.minOpsPerSecond);
    }
};

template <>
struct MappingTraits<stubscan::Config> {
    static void mapping(IO &io, stubscan::Config &cfg) {
        io.mapOptional("assembly_filters",                  cfg.assemblyFilters);
        io.mapOptional("assembly_excludes",                 cfg.assemblyExcludes);
        io.mapOptional("include_host_framework_assemblies", cfg.includeHostFrameworkAssemblies);
        io.mapOptional("custom_type_allow_list",            cfg.customTypeAllowList);
        io.mapOptional("disabled_phases",                   cfg.disabledPhases);
        io.mapOptional("disabled_rules",                    cfg.disabledRules);
        io.mapOptional("stop_on_first_violation",           cfg.stopOnFirstViolation);
        io.mapOptional("yield_interval",                    cfg.yieldInterval);
        io.mapOptional("verbose",                           cfg.verbose);
        io.mapOptional("sync_point_phase",                  cfg.syncPointPhase);
        io.mapOptional("violation_penalty",                 cfg.violationPenalty);
        io.mapOptional("stub_weight_threshold",             cfg.stubWeightThreshold);
        io.mapOptional("minimal_body_bytes",                cfg.minimalBodyBytes);
        io.mapOptional("exemption_attributes",              cfg.exemptionAttributes);
        io.mapOptional("completeness_markers",              cfg.completenessMarkers);
        io.mapOptional("deprecation_markers",               cfg.deprecationMarkers);
        io.mapOptional("benchmark",                         cfg.benchmark);
    }
};

} // namespace yaml
} // namespace llvm

namespace stubscan {

namespace {

bool isBlank(const std::string &s) {
    return llvm::StringRef(s).trim().empty();
}

bool containsName(const std::vector<std::string> &names, const std::string &name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

llvm::Error invalid(const llvm::Twine &msg) {
    return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                   "invalid configuration: " + msg);
}

} // anonymous namespace

bool Config::isPhaseEnabled(const std::string &phase) const {
    return !containsName(disabledPhases, phase);
}

bool Config::isRuleEnabled(const std::string &ruleID) const {
    return !containsName(disabledRules, ruleID);
}

llvm::Error Config::validate() const {
    for (const auto &f : assemblyFilters)
        if (isBlank(f))
            return invalid("blank entry in assembly_filters");
    for (const auto &f : assemblyExcludes)
        if (isBlank(f))
            return invalid("blank entry in assembly_excludes");

    for (const auto &inc : assemblyFilters) {
        for (const auto &exc : assemblyExcludes) {
            if (llvm::StringRef(inc).trim().equals_insensitive(llvm::StringRef(exc).trim()))
                return invalid("'" + inc + "' is both included and excluded");
        }
    }

    for (const auto &t : customTypeAllowList)
        if (isBlank(t))
            return invalid("blank entry in custom_type_allow_list");

    if (violationPenalty < 0.0)
        return invalid("violation_penalty must not be negative");

    if (exemptionAttributes.empty())
        return invalid("exemption_attributes must name at least one attribute");
    for (const auto &a : exemptionAttributes)
        if (isBlank(a))
            return invalid("blank entry in exemption_attributes");

    if (benchmark.actorsPerBatch == 0 || benchmark.batches == 0)
        return invalid("benchmark needs at least one actor and one batch");
    if (benchmark.contentionThresholdPercent < 0.0 || benchmark.minOpsPerSecond < 0.0)
        return invalid("benchmark thresholds must not be negative");

    return llvm::Error::success();
}

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "stubscan: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "stubscan: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

} // namespace stubscan
