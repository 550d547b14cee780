#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/TextWriter.h"
#include "../src/core/Config.h"
#include "../src/core/Report.h"

using ::testing::HasSubstr;
using ::testing::Not;

namespace hulud_scan {

class TextWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        info.scanned_dir = "/work/app";
        config.zero_time = true;
    }
    Config config;
    Report report;
    RunInfo info;
    TextWriter writer;
};

TEST_F(TextWriterTest, CleanProject) {
    report.set_total_scanned(7);
    std::string out = writer.write(report, config, info);
    EXPECT_THAT(out, HasSubstr("Target: /work/app"));
    EXPECT_THAT(out, HasSubstr("[INF] Scanned 7 dependencies in 0.0s"));
    EXPECT_THAT(out, HasSubstr("Security status: SECURE"));
    EXPECT_THAT(out, HasSubstr("Git scan result: clean"));
    EXPECT_THAT(out, HasSubstr("No security threats detected"));
    EXPECT_THAT(out, Not(HasSubstr("[WRN]")));
}

TEST_F(TextWriterTest, ThreatsAreListed) {
    report.add_finding("dependencies", BadDependency{"left-pad", "1.3.0"});
    report.add_finding("dependencies", BadDependency{"@ctrl/tinycolor", "4.1.1"});
    report.add_finding("files", SuspiciousScript{"node_modules/x/package.json", "node bundle.js"});
    report.add_finding("git", GitIssue{GitIssueKind::SuspiciousRemote, {"origin shai-hulud"}, "Git remotes point to suspicious repositories"});
    std::string out = writer.write(report, config, info);
    EXPECT_THAT(out, HasSubstr("[WRN] Found 2 compromised packages"));
    EXPECT_THAT(out, HasSubstr("[ERR] - left-pad@1.3.0"));
    EXPECT_THAT(out, HasSubstr("npm uninstall left-pad @ctrl/tinycolor"));
    EXPECT_THAT(out, HasSubstr("Suspicious postinstall: node_modules/x/package.json"));
    EXPECT_THAT(out, HasSubstr("Git threat: suspicious-remote"));
    EXPECT_THAT(out, HasSubstr("THREATS DETECTED"));
    EXPECT_THAT(out, HasSubstr("[ERR] 4 security issues require attention"));
}

TEST_F(TextWriterTest, GitStatusVariants) {
    config.skip_git = true;
    EXPECT_THAT(writer.write(report, config, info), HasSubstr("Git scan result: skipped"));
    config.skip_git = false;
    report.set_git_error("git log failed");
    std::string out = writer.write(report, config, info);
    EXPECT_THAT(out, HasSubstr("Git scan result: error"));
    EXPECT_THAT(out, HasSubstr("Git inspection incomplete: git log failed"));
}

}
