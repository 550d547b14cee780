#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/scanners/LockfileResolver.h"
#include "../src/core/Logging.h"
#include "../src/core/Report.h"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;
using ::testing::ElementsAre;

namespace hulud_scan {

namespace {
std::vector<std::string> pairs(const std::vector<Dependency>& deps) {
    std::vector<std::string> out;
    for(const auto& d : deps) out.push_back(d.name + "@" + d.version);
    return out;
}
}

class LockfileResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = fs::temp_directory_path() / ("hulud_lock_test_" + std::to_string(getpid()));
        fs::remove_all(root);
        fs::create_directories(root);
    }
    void TearDown() override {
        fs::remove_all(root);
    }
    void write(const std::string& name, const std::string& content) {
        std::ofstream out(root / name);
        out << content;
    }
    fs::path root;
    std::ostringstream log_out;
    Logger log{log_out};
};

TEST(NpmLockTest, PackagesMapUsesLastNodeModulesSegment) {
    auto deps = LockfileResolver::parse_npm_lock(R"({
        "lockfileVersion": 3,
        "packages": {
            "": {"name": "app", "version": "1.0.0"},
            "node_modules/left-pad": {"version": "1.3.0"},
            "node_modules/@ctrl/tinycolor": {"version": "4.1.1"},
            "node_modules/a/node_modules/b": {"version": "2.0.0"},
            "node_modules/no-version": {}
        }
    })");
    EXPECT_THAT(pairs(deps), ElementsAre("left-pad@1.3.0", "@ctrl/tinycolor@4.1.1", "b@2.0.0", "no-version@0.0.0"));
    EXPECT_EQ(deps[0].source, DependencySource::Lockfile);
}

TEST(NpmLockTest, LegacyDependencyTreeIsWalkedPreOrder) {
    auto deps = LockfileResolver::parse_npm_lock(R"({
        "lockfileVersion": 1,
        "dependencies": {
            "a": {"version": "1.0.0", "dependencies": {
                "b": {"version": "2.0.0", "dependencies": {"c": {"version": "3.0.0"}}}
            }},
            "d": {"version": "4.0.0"}
        }
    })");
    EXPECT_THAT(pairs(deps), ElementsAre("a@1.0.0", "b@2.0.0", "c@3.0.0", "d@4.0.0"));
}

TEST(NpmLockTest, PackagesMapTakesPrecedenceOverLegacyTree) {
    auto deps = LockfileResolver::parse_npm_lock(R"({
        "packages": {"node_modules/x": {"version": "1.0.0"}},
        "dependencies": {"y": {"version": "2.0.0"}}
    })");
    EXPECT_THAT(pairs(deps), ElementsAre("x@1.0.0"));
}

TEST(NpmLockTest, DeeplyNestedTreeDoesNotRecurse) {
    std::string doc = R"({"dependencies": )";
    const int depth = 2000;
    for(int i = 0; i < depth; ++i) doc += "{\"p" + std::to_string(i) + "\": {\"version\": \"1.0.0\", \"dependencies\": ";
    doc += "{}";
    for(int i = 0; i < depth; ++i) doc += "}}";
    doc += "}";
    auto deps = LockfileResolver::parse_npm_lock(doc);
    EXPECT_EQ(deps.size(), static_cast<size_t>(depth));
}

TEST(NpmLockTest, MalformedThrows) {
    EXPECT_THROW(LockfileResolver::parse_npm_lock("{"), nlohmann::json::exception);
    EXPECT_THROW(LockfileResolver::parse_npm_lock("[]"), std::runtime_error);
}

TEST(YarnLockTest, ClassicFormat) {
    auto deps = LockfileResolver::parse_yarn_lock(
        "# THIS IS AN AUTOGENERATED FILE. DO NOT EDIT THIS FILE DIRECTLY.\n"
        "# yarn lockfile v1\n"
        "\n"
        "left-pad@^1.3.0, left-pad@~1.3.0:\n"
        "  version \"1.3.0\"\n"
        "  resolved \"https://registry.yarnpkg.com/left-pad/-/left-pad-1.3.0.tgz\"\n"
        "  dependencies:\n"
        "    version-like \"9.9.9\"\n"
        "\n"
        "\"@ctrl/tinycolor@^4.1.0\":\n"
        "  version \"4.1.1\"\n");
    EXPECT_THAT(pairs(deps), ElementsAre("left-pad@1.3.0", "@ctrl/tinycolor@4.1.1"));
}

TEST(YarnLockTest, BerryFormat) {
    auto deps = LockfileResolver::parse_yarn_lock(
        "__metadata:\n"
        "  version: 6\n"
        "\n"
        "\"lodash@npm:^4.17.21\":\n"
        "  version: 4.17.21\n"
        "  resolution: \"lodash@npm:4.17.21\"\n");
    EXPECT_THAT(pairs(deps), ElementsAre("lodash@4.17.21"));
}

TEST(YarnLockTest, CrlfAndBlocksWithoutVersion) {
    auto deps = LockfileResolver::parse_yarn_lock(
        "broken@^1.0.0:\r\n"
        "  resolved \"x\"\r\n"
        "\r\n"
        "ok@^2.0.0:\r\n"
        "  version \"2.0.1\"\r\n");
    EXPECT_THAT(pairs(deps), ElementsAre("ok@2.0.1"));
}

TEST(PnpmLockTest, KeyFormats) {
    std::string name, version;
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/left-pad/1.3.0", name, version));
    EXPECT_EQ(name, "left-pad"); EXPECT_EQ(version, "1.3.0");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/@ctrl/tinycolor/4.1.1_react@18.2.0", name, version));
    EXPECT_EQ(name, "@ctrl/tinycolor"); EXPECT_EQ(version, "4.1.1");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/react-dom/17.0.2_react@17.0.2", name, version));
    EXPECT_EQ(name, "react-dom"); EXPECT_EQ(version, "17.0.2");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/ts-node/10.9.1_3hlnbwzcbkwcwplwkpbsl3kn2y", name, version));
    EXPECT_EQ(name, "ts-node"); EXPECT_EQ(version, "10.9.1");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/@scope/snake_case@1.0.0", name, version));
    EXPECT_EQ(name, "@scope/snake_case"); EXPECT_EQ(version, "1.0.0");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("/@babel/core@7.22.0(supports-color@8.1.1)", name, version));
    EXPECT_EQ(name, "@babel/core"); EXPECT_EQ(version, "7.22.0");
    ASSERT_TRUE(LockfileResolver::split_pnpm_key("lodash@4.17.21", name, version));
    EXPECT_EQ(name, "lodash"); EXPECT_EQ(version, "4.17.21");
    EXPECT_FALSE(LockfileResolver::split_pnpm_key("justaname", name, version));
}

TEST(PnpmLockTest, PackagesSection) {
    auto deps = LockfileResolver::parse_pnpm_lock(
        "lockfileVersion: '6.0'\n"
        "dependencies:\n"
        "  left-pad:\n"
        "    specifier: ^1.3.0\n"
        "    version: 1.3.0\n"
        "packages:\n"
        "  /left-pad@1.3.0:\n"
        "    resolution: {integrity: sha512-abc}\n"
        "  /@ctrl/tinycolor@4.1.1:\n"
        "    resolution: {integrity: sha512-def}\n");
    EXPECT_THAT(pairs(deps), ElementsAre("left-pad@1.3.0", "@ctrl/tinycolor@4.1.1"));
}

TEST(PnpmLockTest, V5PeerSuffixedKeys) {
    auto deps = LockfileResolver::parse_pnpm_lock(
        "lockfileVersion: 5.4\n"
        "packages:\n"
        "  /react/17.0.2:\n"
        "    resolution: {integrity: sha512-aaa}\n"
        "  /react-dom/17.0.2_react@17.0.2:\n"
        "    resolution: {integrity: sha512-bbb}\n");
    EXPECT_THAT(pairs(deps), ElementsAre("react@17.0.2", "react-dom@17.0.2"));
}

TEST(PnpmLockTest, NoPackagesSection) {
    EXPECT_TRUE(LockfileResolver::parse_pnpm_lock("lockfileVersion: '9.0'\n").empty());
}

TEST(PnpmLockTest, MalformedThrows) {
    EXPECT_THROW(LockfileResolver::parse_pnpm_lock("packages: [unclosed\n"), YAML::Exception);
}

TEST_F(LockfileResolverTest, NoLockfilesYieldsNothing) {
    LockfileResolver resolver(log);
    EXPECT_TRUE(resolver.resolve(root.string()).empty());
}

TEST_F(LockfileResolverTest, ConcatenatesAllFormatsInOrder) {
    write("package-lock.json", R"({"packages": {"node_modules/a": {"version": "1.0.0"}}})");
    write("yarn.lock", "b@^2.0.0:\n  version \"2.0.0\"\n");
    write("pnpm-lock.yaml", "packages:\n  /c@3.0.0:\n    resolution: {integrity: x}\n");
    LockfileResolver resolver(log);
    EXPECT_THAT(pairs(resolver.resolve(root.string())), ElementsAre("a@1.0.0", "b@2.0.0", "c@3.0.0"));
}

TEST_F(LockfileResolverTest, MalformedLockfileRecordsWarningAndContinues) {
    write("package-lock.json", "{ this is not json");
    write("yarn.lock", "b@^2.0.0:\n  version \"2.0.0\"\n");
    Report report;
    LockfileResolver resolver(log, &report);
    EXPECT_THAT(pairs(resolver.resolve(root.string())), ElementsAre("b@2.0.0"));
    ASSERT_EQ(report.warnings().size(), 1u);
    EXPECT_EQ(report.warnings()[0].code, WarnCode::LockfileParseError);
    EXPECT_EQ(report.warnings()[0].scanner, "dependencies");
    EXPECT_THAT(log_out.str(), ::testing::HasSubstr("[WRN] failed to parse"));
}

}
