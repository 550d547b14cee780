#pragma once
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hulud_scan {

struct QueryResult {
    bool ok = false;
    std::vector<std::string> lines;
    std::string error; // set when !ok
};

// Read-only repository queries used by the git scanner.
class GitQueries {
public:
    virtual ~GitQueries() = default;
    virtual QueryResult branches() = 0;                                // local and remote branch names
    virtual QueryResult recent_subjects(int count) = 0;                // "<short-hash> <subject>" lines
    virtual QueryResult files_since(const std::string& period) = 0;    // file names touched since period
    virtual QueryResult remotes() = 0;                                 // "<name>\t<url> (fetch|push)"
    virtual QueryResult signature_status(int count) = 0;               // "<hash> <%G? marker>"
};

using GitQueriesFactory = std::function<std::unique_ptr<GitQueries>(const std::string& repo_dir)>;

// Backed by the git command line (fork/exec, no shell).
class GitCli : public GitQueries {
public:
    explicit GitCli(std::string repo_dir, std::string git_binary = "git")
        : repo_dir_(std::move(repo_dir)), git_(std::move(git_binary)) {}

    QueryResult branches() override;
    QueryResult recent_subjects(int count) override;
    QueryResult files_since(const std::string& period) override;
    QueryResult remotes() override;
    QueryResult signature_status(int count) override;
private:
    QueryResult run(const std::vector<std::string>& args) const;
    std::string repo_dir_;
    std::string git_;
};

}
