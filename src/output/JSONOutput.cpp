#include "stubscan/output/ReportFormatter.h"

#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

#include <sstream>

namespace stubscan {

namespace {

std::string escape(const std::string &s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    llvm::raw_string_ostream os(out);
                    os << "\\u" << llvm::format_hex_no_prefix(static_cast<unsigned char>(c), 4);
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

void writeStringArray(std::ostringstream &os, const std::vector<std::string> &items) {
    os << "[";
    for (size_t i = 0; i < items.size(); ++i) {
        os << "\"" << escape(items[i]) << "\"";
        if (i + 1 < items.size()) os << ", ";
    }
    os << "]";
}

void writeViolation(std::ostringstream &os, const Violation &v, const char *indent) {
    os << indent << "{\n";
    os << indent << "  \"ruleID\": \"" << escape(v.ruleID) << "\",\n";
    os << indent << "  \"category\": \"" << categoryToString(v.category) << "\",\n";
    os << indent << "  \"assembly\": \"" << escape(v.assembly) << "\",\n";
    os << indent << "  \"type\": \"" << escape(v.typeName) << "\",\n";
    os << indent << "  \"member\": \"" << escape(v.memberName) << "\",\n";
    os << indent << "  \"message\": \"" << escape(v.message) << "\"\n";
    os << indent << "}";
}

void writeReportBody(std::ostringstream &os, const ValidationReport &report) {
    auto epoch = [](std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
    };

    os << "  \"startedAtEpochSec\": " << epoch(report.startedAt) << ",\n";
    os << "  \"finishedAtEpochSec\": " << epoch(report.finishedAt) << ",\n";
    os << "  \"durationMs\": " << report.duration.count() << ",\n";
    os << "  \"score\": " << report.score << ",\n";
    os << "  \"fullyCompliant\": " << (report.fullyCompliant ? "true" : "false") << ",\n";
    os << "  \"cancelled\": " << (report.cancelled ? "true" : "false") << ",\n";

    os << "  \"phases\": [\n";
    size_t idx = 0;
    for (const auto &entry : report.phases) {
        const PhaseResult &p = entry.second;
        os << "    {\n";
        os << "      \"name\": \"" << escape(p.name) << "\",\n";
        os << "      \"state\": \"" << phaseStateName(p.state) << "\",\n";
        os << "      \"symbolsAnalyzed\": " << p.symbolsAnalyzed << ",\n";
        os << "      \"ruleEvaluations\": " << p.ruleEvaluations << ",\n";
        os << "      \"ruleFaults\": " << p.ruleFaults << ",\n";
        os << "      \"notes\": ";
        writeStringArray(os, p.notes);
        os << ",\n";
        os << "      \"violations\": [";
        if (!p.violations.empty()) os << "\n";
        for (size_t i = 0; i < p.violations.size(); ++i) {
            writeViolation(os, p.violations[i], "        ");
            if (i + 1 < p.violations.size()) os << ",";
            os << "\n";
        }
        if (!p.violations.empty()) os << "      ";
        os << "]\n";
        os << "    }";
        if (++idx < report.phases.size()) os << ",";
        os << "\n";
    }
    os << "  ],\n";

    os << "  \"notes\": ";
    writeStringArray(os, report.notes);
    os << ",\n";
    os << "  \"violationCount\": " << report.violations.size() << "\n";
}

} // anonymous namespace

std::string JSONReportFormatter::format(const ValidationReport &report) {
    std::ostringstream os;
    os << "{\n";
    writeReportBody(os, report);
    os << "}\n";
    return os.str();
}

std::string JSONReportFormatter::format(const ValidationReport &report,
                                        const RunMetadata &meta) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"tool\": {\n";
    os << "    \"name\": \"stubscan\",\n";
    os << "    \"version\": \"" << escape(meta.toolVersion) << "\",\n";
    os << "    \"config\": \"" << escape(meta.configPath) << "\",\n";
    os << "    \"timestampEpochSec\": " << meta.timestampEpochSec << ",\n";
    os << "    \"inputs\": ";
    writeStringArray(os, meta.inputs);
    os << "\n  },\n";
    writeReportBody(os, report);
    os << "}\n";
    return os.str();
}

std::string JSONReportFormatter::formatBenchmark(const BenchmarkResult &result) {
    std::ostringstream os;
    os << "{\n";
    os << "  \"actorCount\": " << result.actorCount << ",\n";
    os << "  \"totalOperations\": " << result.totalOperations << ",\n";
    os << "  \"elapsedMs\": "
       << std::chrono::duration<double, std::milli>(result.elapsed).count() << ",\n";
    os << "  \"throughput\": " << result.throughput << ",\n";
    os << "  \"variationPercent\": " << result.variationPercent << ",\n";
    os << "  \"contention\": " << (result.contention ? "true" : "false") << ",\n";
    os << "  \"lowThroughput\": " << (result.lowThroughput ? "true" : "false") << ",\n";

    os << "  \"actors\": [\n";
    for (size_t i = 0; i < result.actors.size(); ++i) {
        const auto &a = result.actors[i];
        os << "    {\"actor\": " << a.actor << ", \"batch\": " << a.batch
           << ", \"elapsedMs\": " << std::chrono::duration<double, std::milli>(a.elapsed).count()
           << ", \"operations\": " << a.operations
           << ", \"failed\": " << (a.failed ? "true" : "false");
        if (a.failed)
            os << ", \"error\": \"" << escape(a.error) << "\"";
        os << "}";
        if (i + 1 < result.actors.size()) os << ",";
        os << "\n";
    }
    os << "  ],\n";

    os << "  \"warnings\": ";
    writeStringArray(os, result.warnings);
    os << ",\n  \"successes\": ";
    writeStringArray(os, result.successes);
    os << "\n}\n";
    return os.str();
}

} // namespace stubscan
