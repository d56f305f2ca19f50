#include "stubscan/output/ReportFormatter.h"

#include <iomanip>
#include <sstream>

namespace stubscan {

namespace {

// Type-level findings carry the type's own name as the member name.
bool isTypeLevel(const Violation &v) {
    auto cut = v.typeName.find_last_of(".+");
    std::string_view shortName(v.typeName);
    if (cut != std::string::npos)
        shortName.remove_prefix(cut + 1);
    return shortName == v.memberName;
}

} // anonymous namespace

std::string TextReportFormatter::format(const ValidationReport &report) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);

    for (const auto &entry : report.phases) {
        const PhaseResult &phase = entry.second;
        os << "== " << phase.name << " [" << phaseStateName(phase.state) << "] "
           << phase.symbolsAnalyzed << " symbols, "
           << phase.ruleEvaluations << " evaluations";
        if (phase.ruleFaults)
            os << ", " << phase.ruleFaults << " faults";
        os << "\n";

        for (const auto &v : phase.violations) {
            os << "  " << v.ruleID << " " << v.typeName;
            if (!isTypeLevel(v))
                os << "." << v.memberName;
            os << ": " << v.message << " [" << categoryToString(v.category) << "]\n";
        }

        for (const auto &note : phase.notes)
            os << "  note: " << note << "\n";
    }

    for (const auto &note : report.notes)
        os << "note: " << note << "\n";

    if (report.cancelled)
        os << "stubscan: run cancelled, report is partial.\n";

    if (report.violations.empty())
        os << "stubscan: no violations, score " << report.score << "/100";
    else
        os << "stubscan: " << report.violations.size() << " violation(s), score "
           << report.score << "/100";
    os << " (" << report.duration.count() << " ms)\n";

    return os.str();
}

std::string TextReportFormatter::formatBenchmark(const BenchmarkResult &result) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1);

    os << "== Benchmark: " << result.actorCount << " actors, "
       << result.totalOperations << " operations in "
       << std::chrono::duration<double, std::milli>(result.elapsed).count() << " ms\n";
    os << "  throughput: " << result.throughput << " ops/s\n";
    os << "  variation:  " << result.variationPercent << "%\n";

    for (const auto &a : result.actors) {
        os << "  actor " << a.actor << " (batch " << a.batch << "): ";
        if (a.failed)
            os << "FAILED " << a.error << "\n";
        else
            os << std::chrono::duration<double, std::milli>(a.elapsed).count() << " ms, "
               << a.operations << " ops\n";
    }

    for (const auto &w : result.warnings)
        os << "  warning: " << w << "\n";
    for (const auto &s : result.successes)
        os << "  ok: " << s << "\n";

    return os.str();
}

} // namespace stubscan
