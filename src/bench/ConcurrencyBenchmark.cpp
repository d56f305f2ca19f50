#include "stubscan/bench/ConcurrencyBenchmark.h"
#include "stubscan/engine/ValidationOrchestrator.h"

#include <llvm/ADT/STLExtras.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <barrier>
#include <exception>
#include <string>
#include <system_error>
#include <thread>

namespace stubscan {

namespace {

using Clock = std::chrono::steady_clock;

double toMillis(std::chrono::nanoseconds ns) {
    return std::chrono::duration<double, std::milli>(ns).count();
}

std::string formatted(const char *fmt, double value) {
    std::string out;
    llvm::raw_string_ostream os(out);
    os << llvm::format(fmt, value);
    return os.str();
}

} // anonymous namespace

size_t BenchmarkResult::failedActors() const {
    return static_cast<size_t>(llvm::count_if(actors, [](const ActorTiming &a) { return a.failed; }));
}

BenchmarkResult ConcurrencyBenchmark::run(const Workload &workload) const {
    const unsigned total = opts_.actorsPerBatch * opts_.batches;

    BenchmarkResult result;
    result.actorCount = total;
    result.actors.resize(total);

    std::vector<Clock::time_point> finishedAt(total);
    Clock::time_point releasedAt;

    for (unsigned i = 0; i < total; ++i) {
        result.actors[i].actor = i;
        result.actors[i].batch = i / opts_.actorsPerBatch;
    }

    // The completion step runs once, before any actor is released.
    auto stampRelease = [&releasedAt]() noexcept { releasedAt = Clock::now(); };
    std::barrier gate(static_cast<std::ptrdiff_t>(total), stampRelease);

    auto actorBody = [&](unsigned i) {
        ActorTiming &timing = result.actors[i];

        gate.arrive_and_wait();

        auto start = Clock::now();
        try {
            for (unsigned it = 0; it < opts_.iterationsPerActor; ++it)
                timing.operations += workload(i);
        } catch (const std::exception &e) {
            timing.failed = true;
            timing.error = e.what();
        } catch (...) {
            timing.failed = true;
            timing.error = "unknown exception";
        }
        finishedAt[i] = Clock::now();
        timing.elapsed = finishedAt[i] - start;
    };

    {
        std::vector<std::jthread> actors;
        actors.reserve(total);
        unsigned started = 0;
        try {
            for (; started < total; ++started)
                actors.emplace_back(actorBody, started);
        } catch (const std::system_error &e) {
            // Release the barrier slots of actors that never started, or the
            // started ones would wait for them forever.
            for (unsigned i = started; i < total; ++i) {
                gate.arrive_and_drop();
                result.actors[i].failed = true;
                result.actors[i].error = std::string("thread could not be started: ") + e.what();
            }
        }
    } // jthreads join here

    Clock::time_point lastFinish = releasedAt;
    for (unsigned i = 0; i < total; ++i) {
        if (result.actors[i].failed)
            continue;
        lastFinish = std::max(lastFinish, finishedAt[i]);
        result.totalOperations += result.actors[i].operations;
    }
    result.elapsed = lastFinish - releasedAt;

    summarize(result);
    return result;
}

BenchmarkResult ConcurrencyBenchmark::runOrchestrator(
    const ValidationOrchestrator &orchestrator,
    const std::vector<std::vector<AssemblyHandle>> &partitions) const {
    return run([&](unsigned actor) -> uint64_t {
        std::vector<AssemblyHandle> slice;
        if (!partitions.empty())
            slice = partitions[actor % partitions.size()];
        ValidationReport report = orchestrator.run(std::move(slice));
        return report.totalRuleEvaluations();
    });
}

void ConcurrencyBenchmark::summarize(BenchmarkResult &result) const {
    for (const auto &a : result.actors) {
        if (a.failed)
            result.warnings.push_back("actor " + std::to_string(a.actor) + " (batch " +
                                      std::to_string(a.batch) + ") failed: " + a.error);
    }

    std::vector<double> times;
    for (const auto &a : result.actors) {
        if (!a.failed)
            times.push_back(toMillis(a.elapsed));
    }

    if (times.empty()) {
        result.warnings.push_back("no actor completed; nothing to measure");
        return;
    }

    auto [minIt, maxIt] = std::minmax_element(times.begin(), times.end());
    double sum = 0.0;
    for (double t : times)
        sum += t;
    double avg = sum / static_cast<double>(times.size());
    result.variationPercent = avg > 0.0 ? (*maxIt - *minIt) / avg * 100.0 : 0.0;

    double seconds = std::chrono::duration<double>(result.elapsed).count();
    result.throughput = seconds > 0.0 ? static_cast<double>(result.totalOperations) / seconds : 0.0;

    result.contention = result.variationPercent > opts_.contentionThresholdPercent;
    result.lowThroughput = result.throughput < opts_.minOpsPerSecond;

    if (result.contention)
        result.warnings.push_back("timing variation " + formatted("%.1f", result.variationPercent) +
                                  "% exceeds " + formatted("%.1f", opts_.contentionThresholdPercent) +
                                  "%: actors are not treated evenly");
    else
        result.successes.push_back("timing variation " + formatted("%.1f", result.variationPercent) +
                                   "% within threshold");

    if (result.lowThroughput)
        result.warnings.push_back("throughput " + formatted("%.0f", result.throughput) +
                                  " ops/s below " + formatted("%.0f", opts_.minOpsPerSecond) + " ops/s");
    else
        result.successes.push_back("throughput " + formatted("%.0f", result.throughput) + " ops/s");

    if (result.failedActors() == 0)
        result.successes.push_back("all " + std::to_string(result.actorCount) + " actors completed");
}

} // namespace stubscan
