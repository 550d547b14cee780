#pragma once
#include "../core/Scanner.h"
#include "../core/Finding.h"
#include "GitQueries.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hulud_scan {

struct Config;
class Logger;

// Local repository heuristics: branch names, recent commit subjects, recently touched
// files, remote URLs and commit signature status.
class GitScanner : public Scanner {
public:
    using QueriesFactory = GitQueriesFactory;

    GitScanner(); // git command line
    explicit GitScanner(QueriesFactory factory) : factory_(std::move(factory)) {}

    std::string name() const override { return "git"; }
    std::string description() const override { return "Inspects local git metadata for worm propagation signatures"; }
    void scan(ScanContext& context) override;

    struct Outcome {
        std::vector<GitIssue> issues;
        std::optional<std::string> error; // failed sub-queries, "; " separated
    };
    // Runs every check; never throws.
    static Outcome inspect(GitQueries& git, const Config& cfg, Logger& log);

    static std::vector<std::string> match_branches(const std::vector<std::string>& branches);
    static std::vector<std::string> match_commits(const std::vector<std::string>& subjects);
    static std::vector<std::string> match_files(const std::vector<std::string>& files);
    static std::vector<std::string> match_remotes(const std::vector<std::string>& remotes);
    static bool has_unsigned(const std::vector<std::string>& status_lines);
    // Unsigned commits only count next to another git finding.
    static void apply_signature_policy(std::vector<GitIssue>& issues, bool unsigned_seen);
private:
    QueriesFactory factory_;
};

}
