#pragma once

#include "stubscan/core/Config.h"
#include "stubscan/metadata/Metadata.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace stubscan {

class ValidationOrchestrator;

struct ActorTiming {
    unsigned actor = 0;
    unsigned batch = 0;
    std::chrono::nanoseconds elapsed{0};
    uint64_t operations = 0;
    bool failed = false;
    std::string error;
};

struct BenchmarkResult {
    unsigned actorCount = 0;
    uint64_t totalOperations = 0;       // successful actors only
    std::chrono::nanoseconds elapsed{0}; // release -> last actor finished
    std::vector<ActorTiming> actors;

    double throughput = 0.0;            // operations per second
    double variationPercent = 0.0;      // (max - min) / avg * 100
    bool contention = false;
    bool lowThroughput = false;

    std::vector<std::string> warnings;
    std::vector<std::string> successes;

    size_t failedActors() const;
};

// Releases actorsPerBatch * batches actors together from one barrier and
// measures how evenly they finish. Actors share nothing mutable; a workload
// returns the number of operations it performed.
class ConcurrencyBenchmark {
public:
    using Workload = std::function<uint64_t(unsigned actor)>;

    explicit ConcurrencyBenchmark(BenchmarkOptions opts) : opts_(opts) {}

    BenchmarkResult run(const Workload &workload) const;

    // Each actor runs the orchestrator over partition (actor % count).
    // Operations are rule evaluations.
    BenchmarkResult runOrchestrator(const ValidationOrchestrator &orchestrator,
                                    const std::vector<std::vector<AssemblyHandle>> &partitions) const;

    const BenchmarkOptions &options() const { return opts_; }

private:
    void summarize(BenchmarkResult &result) const;

    BenchmarkOptions opts_;
};

} // namespace stubscan
