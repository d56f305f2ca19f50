#pragma once

#include "stubscan/bench/ConcurrencyBenchmark.h"
#include "stubscan/engine/ValidationReport.h"

#include <cstdint>
#include <string>
#include <vector>

namespace stubscan {

struct RunMetadata {
    std::string toolVersion;
    std::string configPath;
    std::vector<std::string> inputs;
    uint64_t timestampEpochSec = 0;
};

class ReportFormatter {
public:
    virtual ~ReportFormatter() = default;
    virtual std::string format(const ValidationReport &report) = 0;
    virtual std::string format(const ValidationReport &report,
                               const RunMetadata & /*meta*/) {
        return format(report);
    }
    virtual std::string formatBenchmark(const BenchmarkResult &result) = 0;
};

class TextReportFormatter : public ReportFormatter {
public:
    std::string format(const ValidationReport &report) override;
    std::string formatBenchmark(const BenchmarkResult &result) override;
};

class JSONReportFormatter : public ReportFormatter {
public:
    std::string format(const ValidationReport &report) override;
    std::string format(const ValidationReport &report,
                       const RunMetadata &meta) override;
    std::string formatBenchmark(const BenchmarkResult &result) override;
};

} // namespace stubscan
