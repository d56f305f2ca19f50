#include "stubscan/core/Config.h"

#include <gtest/gtest.h>

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

using namespace stubscan;

namespace {

// Writes `contents` to a fresh temporary file and removes it on scope exit.
class TempConfigFile {
public:
    explicit TempConfigFile(llvm::StringRef contents) {
        int fd = -1;
        std::error_code EC = llvm::sys::fs::createTemporaryFile("stubscan-config", "yaml", fd, path_);
        if (EC) {
            ADD_FAILURE() << "cannot create temp file: " << EC.message();
            return;
        }
        llvm::raw_fd_ostream os(fd, /*shouldClose=*/true);
        os << contents;
    }

    ~TempConfigFile() {
        if (!path_.empty())
            llvm::sys::fs::remove(path_);
    }

    std::string path() const { return std::string(path_.str()); }

private:
    llvm::SmallString<128> path_;
};

std::string validationError(const Config &cfg) {
    if (auto err = cfg.validate())
        return llvm::toString(std::move(err));
    return {};
}

} // anonymous namespace

TEST(ConfigTest, DefaultsAreValid) {
    Config cfg = Config::defaults();
    EXPECT_TRUE(validationError(cfg).empty());
    EXPECT_EQ(cfg.stubWeightThreshold, 3u);
    EXPECT_EQ(cfg.minimalBodyBytes, 5u);
    EXPECT_DOUBLE_EQ(cfg.violationPenalty, 5.0);
    EXPECT_EQ(cfg.benchmark.actorsPerBatch, 9u);
    EXPECT_EQ(cfg.benchmark.batches, 3u);
    EXPECT_TRUE(cfg.isRuleEnabled("SS001"));
    EXPECT_TRUE(cfg.isPhaseEnabled("Integrity"));
}

TEST(ConfigTest, LoadsYamlFile) {
    TempConfigFile file(
        "assembly_filters: [Game]\n"
        "disabled_phases: [Conceptual]\n"
        "disabled_rules: [SS005, SS013]\n"
        "stop_on_first_violation: true\n"
        "yield_interval: 16\n"
        "sync_point_phase: true\n"
        "violation_penalty: 2.5\n"
        "exemption_attributes: [Skip]\n"
        "benchmark:\n"
        "  actors_per_batch: 2\n"
        "  min_ops_per_second: 50\n");

    Config cfg = Config::loadFromFile(file.path());
    EXPECT_EQ(cfg.assemblyFilters, std::vector<std::string>{"Game"});
    EXPECT_FALSE(cfg.isPhaseEnabled("Conceptual"));
    EXPECT_FALSE(cfg.isRuleEnabled("SS013"));
    EXPECT_TRUE(cfg.isRuleEnabled("SS001"));
    EXPECT_TRUE(cfg.stopOnFirstViolation);
    EXPECT_EQ(cfg.yieldInterval, 16u);
    EXPECT_TRUE(cfg.syncPointPhase);
    EXPECT_DOUBLE_EQ(cfg.violationPenalty, 2.5);
    EXPECT_EQ(cfg.exemptionAttributes, std::vector<std::string>{"Skip"});
    EXPECT_EQ(cfg.benchmark.actorsPerBatch, 2u);
    EXPECT_EQ(cfg.benchmark.batches, 3u);
    EXPECT_DOUBLE_EQ(cfg.benchmark.minOpsPerSecond, 50.0);
    // Unset keys keep their defaults.
    EXPECT_EQ(cfg.completenessMarkers.size(), 3u);
}

TEST(ConfigTest, LoadsSampleConfig) {
    Config cfg = Config::loadFromFile(STUBSCAN_SAMPLES_DIR "/stubscan.config.yaml");
    EXPECT_EQ(cfg.stubWeightThreshold, 2u);
    EXPECT_EQ(cfg.minimalBodyBytes, 6u);
    EXPECT_FALSE(cfg.isRuleEnabled("SS005"));
    EXPECT_EQ(cfg.benchmark.batches, 2u);
    EXPECT_DOUBLE_EQ(cfg.benchmark.contentionThresholdPercent, 200.0);
    EXPECT_TRUE(validationError(cfg).empty());
}

TEST(ConfigTest, MissingOrMalformedFileFallsBackToDefaults) {
    Config missing = Config::loadFromFile("/nonexistent/stubscan.config.yaml");
    EXPECT_TRUE(missing.assemblyFilters.empty());
    EXPECT_EQ(missing.stubWeightThreshold, 3u);

    TempConfigFile bad("yield_interval: [not, a, number]\n");
    Config malformed = Config::loadFromFile(bad.path());
    EXPECT_EQ(malformed.yieldInterval, 0u);
}

TEST(ConfigTest, ValidateRejectsInconsistentSettings) {
    Config blank;
    blank.assemblyFilters = {"  "};
    EXPECT_NE(validationError(blank).find("blank entry in assembly_filters"), std::string::npos);

    Config both;
    both.assemblyFilters = {"Game"};
    both.assemblyExcludes = {" GAME "};
    EXPECT_NE(validationError(both).find("both included and excluded"), std::string::npos);

    Config negative;
    negative.violationPenalty = -1.0;
    EXPECT_NE(validationError(negative).find("violation_penalty"), std::string::npos);

    Config noExemptions;
    noExemptions.exemptionAttributes.clear();
    EXPECT_NE(validationError(noExemptions).find("exemption_attributes"), std::string::npos);

    Config noActors;
    noActors.benchmark.actorsPerBatch = 0;
    EXPECT_NE(validationError(noActors).find("at least one actor"), std::string::npos);

    Config blankType;
    blankType.customTypeAllowList = {""};
    EXPECT_NE(validationError(blankType).find("custom_type_allow_list"), std::string::npos);
}
