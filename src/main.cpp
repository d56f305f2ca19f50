#include "stubscan/bench/ConcurrencyBenchmark.h"
#include "stubscan/core/Config.h"
#include "stubscan/core/RuleRegistry.h"
#include "stubscan/core/Version.h"
#include "stubscan/engine/ValidationOrchestrator.h"
#include "stubscan/metadata/ManifestLoader.h"
#include "stubscan/output/ReportFormatter.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

static llvm::cl::OptionCategory StubscanCat("stubscan options");

static llvm::cl::list<std::string> InputManifests(
    llvm::cl::Positional,
    llvm::cl::desc("<metadata manifest.yaml>..."),
    llvm::cl::OneOrMore,
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to stubscan.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (text|json)"),
    llvm::cl::init("text"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<bool> StopOnFirst(
    "stop-on-first",
    llvm::cl::desc("Stop at the first violation"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<bool> RunBenchmark(
    "benchmark",
    llvm::cl::desc("Also run the concurrent actor benchmark over the inputs"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<unsigned> Actors(
    "actors",
    llvm::cl::desc("Benchmark actors per batch (overrides config)"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<unsigned> Batches(
    "batches",
    llvm::cl::desc("Benchmark batches (overrides config)"),
    llvm::cl::cat(StubscanCat));

static llvm::cl::opt<bool> Verbose(
    "verbose",
    llvm::cl::desc("Log phase progress to stderr"),
    llvm::cl::cat(StubscanCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(StubscanCat);
    llvm::cl::ParseCommandLineOptions(argc, argv,
        "stubscan: finds placeholder, dead and unfinished code in compiled assemblies\n");

    // Load config.
    stubscan::Config cfg = ConfigPath.empty()
        ? stubscan::Config::defaults()
        : stubscan::Config::loadFromFile(ConfigPath);

    // CLI overrides.
    if (StopOnFirst)
        cfg.stopOnFirstViolation = true;
    if (Verbose)
        cfg.verbose = true;
    if (Actors.getNumOccurrences())
        cfg.benchmark.actorsPerBatch = Actors;
    if (Batches.getNumOccurrences())
        cfg.benchmark.batches = Batches;

    std::string fmt = OutputFormat.getValue();
    if (fmt != "text" && fmt != "json") {
        llvm::errs() << "stubscan: error: unknown format '" << fmt << "'\n";
        return 2;
    }

    // Load metadata.
    stubscan::ManifestLoader loader;
    for (const auto &path : InputManifests) {
        if (auto err = loader.loadFile(path)) {
            llvm::errs() << "stubscan: error: " << llvm::toString(std::move(err)) << "\n";
            return 2;
        }
    }
    loader.resolveBaseTypes();

    stubscan::RuleRegistry registry = stubscan::RuleRegistry::withBuiltinRules();
    stubscan::BenchmarkOptions benchOpts = cfg.benchmark;

    auto orchestratorOrErr = stubscan::ValidationOrchestrator::create(std::move(cfg), registry);
    if (!orchestratorOrErr) {
        llvm::errs() << "stubscan: error: "
                     << llvm::toString(orchestratorOrErr.takeError()) << "\n";
        return 2;
    }
    stubscan::ValidationOrchestrator &orchestrator = *orchestratorOrErr;

    // Run analysis.
    std::vector<stubscan::AssemblyHandle> assemblies = loader.handles();
    stubscan::ValidationReport report = orchestrator.run(assemblies);

    // Build execution metadata for output provenance.
    stubscan::RunMetadata meta;
    meta.toolVersion = stubscan::kToolVersion;
    meta.configPath = ConfigPath.getValue();
    meta.inputs.assign(InputManifests.begin(), InputManifests.end());
    meta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    std::unique_ptr<stubscan::ReportFormatter> formatter;
    if (fmt == "json")
        formatter = std::make_unique<stubscan::JSONReportFormatter>();
    else
        formatter = std::make_unique<stubscan::TextReportFormatter>();

    std::string output = formatter->format(report, meta);

    if (RunBenchmark) {
        // One partition per assembly keeps actors on different inputs.
        std::vector<std::vector<stubscan::AssemblyHandle>> partitions;
        for (auto A : assemblies)
            partitions.push_back({A});

        stubscan::ConcurrencyBenchmark bench(benchOpts);
        stubscan::BenchmarkResult result = bench.runOrchestrator(orchestrator, partitions);
        if (fmt == "json")
            output = "{\n\"report\": " + output + ",\n\"benchmark\": " +
                     formatter->formatBenchmark(result) + "}\n";
        else
            output += formatter->formatBenchmark(result);
    }

    // Emit.
    if (OutputFile.empty()) {
        llvm::outs() << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(OutputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            llvm::errs() << "stubscan: error: cannot open output file '"
                         << OutputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
    }

    return report.fullyCompliant ? 0 : 1;
}
