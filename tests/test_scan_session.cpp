#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/ScanSession.h"
#include "../src/core/Config.h"
#include "../src/core/Logging.h"
#include "../src/core/ThreatList.h"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

namespace hulud_scan {

class MockGitQueries : public GitQueries {
public:
    MOCK_METHOD(QueryResult, branches, (), (override));
    MOCK_METHOD(QueryResult, recent_subjects, (int count), (override));
    MOCK_METHOD(QueryResult, files_since, (const std::string& period), (override));
    MOCK_METHOD(QueryResult, remotes, (), (override));
    MOCK_METHOD(QueryResult, signature_status, (int count), (override));
};

namespace {
QueryResult ok(std::vector<std::string> lines) {
    QueryResult qr;
    qr.ok = true;
    qr.lines = std::move(lines);
    return qr;
}

std::unique_ptr<GitQueries> infected_history(const std::string&) {
    auto git = std::make_unique<NiceMock<MockGitQueries>>();
    ON_CALL(*git, branches()).WillByDefault(Return(ok({"main", "shai-hulud"})));
    ON_CALL(*git, recent_subjects(_)).WillByDefault(Return(ok({"c0ffee1 Add bundle.js", "c0ffee2 bump deps"})));
    ON_CALL(*git, files_since(_)).WillByDefault(Return(ok({"bundle.js", "README.md"})));
    ON_CALL(*git, remotes()).WillByDefault(Return(ok({"origin\thttps://github.com/acme/app.git (fetch)"})));
    ON_CALL(*git, signature_status(_)).WillByDefault(Return(ok({"c0ffee1 N", "c0ffee2 G"})));
    return git;
}

std::vector<nlohmann::json> documents(const std::string& out) {
    std::vector<nlohmann::json> docs;
    std::istringstream in(out);
    std::string line;
    while(std::getline(in, line)) {
        if(!line.empty()) docs.push_back(nlohmann::json::parse(line));
    }
    return docs;
}
}

class ScanSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("hulud_session_test_" + std::to_string(getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
        cfg.target_dir = root.string();
        cfg.compact = true;
        cfg.zero_time = true;
        threats = ThreatList::from_json(R"({"left-pad": ["1.3.0"], "@ctrl/tinycolor": ["4.1.1"], "_meta": {"source": "test"}})");
    }
    void TearDown() override {
        fs::remove_all(root);
    }
    void write(const fs::path& rel, const std::string& content) {
        fs::create_directories((root / rel).parent_path());
        std::ofstream out(root / rel, std::ios::binary);
        out << content;
    }
    std::string run(int* rc = nullptr, GitQueriesFactory git = nullptr) {
        std::ostringstream out;
        ScanSession session(cfg, threats, log, std::move(git));
        int code = session.run(out);
        if(rc) *rc = code;
        return out.str();
    }
    void build_infected_project() {
        write("package.json", R"({"name": "app", "dependencies": {"left-pad": "^1.3.0", "express": "^4.18.0"},
                                  "devDependencies": {"jest": "29.0.0"}})");
        write("package-lock.json", R"({"packages": {
            "": {"name": "app"},
            "node_modules/express": {"version": "4.18.2"},
            "node_modules/@ctrl/tinycolor": {"version": "4.1.1"}
        }})");
        write("yarn.lock", "left-pad@^1.3.0:\n  version \"1.3.0\"\n\nexpress@^4.18.0:\n  version \"4.18.2\"\n");
        write("pnpm-lock.yaml",
              "lockfileVersion: 5.4\n"
              "packages:\n"
              "  /@ctrl/tinycolor/4.1.1_react@18.2.0:\n"
              "    resolution: {integrity: sha512-aaa}\n"
              "  /left-pad/1.3.0:\n"
              "    resolution: {integrity: sha512-bbb}\n");
        for(const char* pkg : {"zeta", "alpha", "@ctrl/tinycolor", "mid/node_modules/nested", "beta"}) {
            write(fs::path("node_modules") / pkg / "package.json",
                  std::string(R"({"name": ")") + pkg + R"(", "version": "1.0.0"})");
        }
        write("node_modules/@ctrl/tinycolor/package.json",
              R"({"name": "@ctrl/tinycolor", "scripts": {"postinstall": "node bundle.js"}})");
        write("node_modules/@ctrl/tinycolor/bundle.js", "console.log('payload');\n");
        write("node_modules/beta/package.json", R"({"name": "beta", "homepage": "https://webhook.site/abc"})");
        write("node_modules/zeta/bundle.js", "module.exports = 1;\n");
        write("node_modules/alpha/package.json",
              std::string(R"({"name": "alpha", "config": {"token": "ghp_)") + std::string(36, 'B') + R"("}})");
        fs::create_directories(root / ".git");
    }

    fs::path root;
    Config cfg;
    ThreatList threats;
    std::ostringstream log_out;
    Logger log{log_out};
};

TEST_F(ScanSessionTest, SingleProjectFindingsAndExitCode) {
    build_infected_project();
    int rc = -1;
    auto docs = documents(run(&rc, infected_history));
    ASSERT_EQ(docs.size(), 1u);
    EXPECT_EQ(rc, 1);
    const auto& doc = docs[0];
    EXPECT_EQ(fs::path(doc["scannedDir"].get<std::string>()), fs::absolute(root).lexically_normal());
    EXPECT_EQ(doc["badDeps"].size(), 2u);
    EXPECT_EQ(doc["suspiciousScripts"].size(), 1u);
    EXPECT_FALSE(doc["suspiciousFiles"].empty());
    EXPECT_FALSE(doc["gitIssues"].empty());
    EXPECT_EQ(doc["totalScanned"], 3);
}

TEST_F(ScanSessionTest, FailOnCountThreshold) {
    write("package-lock.json", R"({"packages": {"node_modules/left-pad": {"version": "1.3.0"}}})");
    cfg.skip_git = true;
    int rc = -1;
    run(&rc);
    EXPECT_EQ(rc, 1);
    cfg.fail_on_count = 2;
    run(&rc);
    EXPECT_EQ(rc, 0);
    cfg.fail_on_count = 0;
    run(&rc);
    EXPECT_EQ(rc, 0);
}

TEST_F(ScanSessionTest, RepeatedRunsAreByteIdentical) {
    build_infected_project();
    const std::string first = run(nullptr, infected_history);
    EXPECT_EQ(run(nullptr, infected_history), first);
    cfg.parallel = true;
    EXPECT_EQ(run(nullptr, infected_history), first);
    EXPECT_EQ(run(nullptr, infected_history), first);
    cfg.compact = false;
    cfg.parallel = false;
    const std::string pretty = run(nullptr, infected_history);
    cfg.parallel = true;
    EXPECT_EQ(run(nullptr, infected_history), pretty);
}

TEST_F(ScanSessionTest, RecursiveScansEachProjectInOrder) {
    cfg.recursive = true;
    cfg.skip_git = true;
    write("web/package-lock.json", R"({"packages": {"node_modules/express": {"version": "4.18.2"}}})");
    write("api/package-lock.json", R"({"packages": {"node_modules/lodash": {"version": "4.17.21"}}})");
    write("api/node_modules/inner/package-lock.json", R"({"packages": {"node_modules/left-pad": {"version": "1.3.0"}}})");
    int rc = -1;
    auto docs = documents(run(&rc));
    EXPECT_EQ(rc, 0);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(fs::path(docs[0]["scannedDir"].get<std::string>()).filename(), "api");
    EXPECT_EQ(fs::path(docs[1]["scannedDir"].get<std::string>()).filename(), "web");
    EXPECT_EQ(docs[0]["totalIssues"], 0);
    EXPECT_EQ(docs[1]["totalIssues"], 0);
    EXPECT_THAT(log_out.str(), HasSubstr("[1/2]"));
    EXPECT_THAT(log_out.str(), HasSubstr("All 2 projects scanned"));
}

TEST_F(ScanSessionTest, RecursiveStopsAtFirstFailingProject) {
    cfg.recursive = true;
    cfg.skip_git = true;
    write("a-clean/package-lock.json", R"({"packages": {"node_modules/express": {"version": "4.18.2"}}})");
    write("b-infected/package-lock.json", R"({"packages": {"node_modules/left-pad": {"version": "1.3.0"}}})");
    write("c-never/package-lock.json", R"({"packages": {"node_modules/@ctrl/tinycolor": {"version": "4.1.1"}}})");
    int rc = -1;
    auto docs = documents(run(&rc));
    EXPECT_EQ(rc, 1);
    ASSERT_EQ(docs.size(), 2u);
    EXPECT_EQ(fs::path(docs[1]["scannedDir"].get<std::string>()).filename(), "b-infected");
    EXPECT_EQ(docs[1]["badDeps"][0]["name"], "left-pad");
    EXPECT_THAT(log_out.str(), HasSubstr("Stopping"));
}

TEST_F(ScanSessionTest, RecursiveWithoutProjects) {
    cfg.recursive = true;
    fs::create_directories(root / "empty");
    int rc = -1;
    EXPECT_TRUE(run(&rc).empty());
    EXPECT_EQ(rc, 0);
    EXPECT_THAT(log_out.str(), HasSubstr("No directories with package-lock.json"));
}

}
