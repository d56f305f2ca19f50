#pragma once

#include "stubscan/core/Config.h"
#include "stubscan/il/BodyPatternAnalyzer.h"
#include "stubscan/metadata/UsageIndex.h"

namespace stubscan {

// Read-only state shared by every rule evaluation of one run.
class AnalysisContext {
public:
    AnalysisContext(const Config &cfg,
                    const UsageIndex &usage,
                    const il::BodyPatternAnalyzer &bodies)
        : config_(cfg), usage_(usage), bodies_(bodies) {}

    const Config &config() const { return config_; }
    const UsageIndex &usage() const { return usage_; }
    const il::BodyPatternAnalyzer &bodies() const { return bodies_; }

private:
    const Config &config_;
    const UsageIndex &usage_;
    const il::BodyPatternAnalyzer &bodies_;
};

} // namespace stubscan
