#include "GitScanner.h"
#include "Indicators.h"
#include "../core/ScanContext.h"
#include "../core/Utils.h"
#include <filesystem>
#include <regex>
#include <unordered_set>

namespace fs = std::filesystem;
namespace hulud_scan {

namespace {

std::vector<std::string> dedupe(const std::vector<std::string>& in){
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for(const auto& s : in){
        if(seen.insert(s).second) out.push_back(s);
    }
    return out;
}

const std::vector<std::regex>& commit_res(){
    static const std::vector<std::regex> res = []{
        std::vector<std::regex> v;
        for(std::size_t i = 0; i < WormIndicators::commit_pattern_count; ++i)
            v.emplace_back(WormIndicators::commit_patterns[i], std::regex::ECMAScript | std::regex::icase);
        return v;
    }();
    return res;
}

} // namespace

GitScanner::GitScanner()
    : factory_([](const std::string& repo_dir){ return std::make_unique<GitCli>(repo_dir); }) {}

std::vector<std::string> GitScanner::match_branches(const std::vector<std::string>& branches){
    std::vector<std::string> hits;
    for(const auto& branch : branches){
        const std::string b = utils::to_lower(branch);
        bool direct = utils::contains(b, WormIndicators::worm_name) || utils::contains(b, "exfiltrate")
            || utils::contains(b, "malware") || utils::contains(b, "backdoor");
        // "migration" alone is a normal branch name; it needs a campaign term beside it
        bool migration = utils::contains(b, "migration") && (utils::contains(b, "shai") || utils::contains(b, "hulud")
            || utils::contains(b, "worm") || utils::contains(b, "malicious"));
        if(direct || migration) hits.push_back(branch);
    }
    return hits;
}

std::vector<std::string> GitScanner::match_commits(const std::vector<std::string>& subjects){
    std::vector<std::string> hits;
    for(const auto& line : subjects){
        for(const auto& re : commit_res()){
            if(std::regex_search(line, re)){
                hits.push_back(utils::trim(line));
                break;
            }
        }
    }
    return dedupe(hits);
}

std::vector<std::string> GitScanner::match_files(const std::vector<std::string>& files){
    std::vector<std::string> hits;
    for(const auto& raw : files){
        std::string file = utils::trim(raw);
        if(file.empty()) continue;
        const std::string f = utils::to_lower(file);
        if(utils::contains(f, WormIndicators::bundle_file) || utils::contains(f, WormIndicators::worm_name)
            || utils::contains(f, "malware") || utils::contains(f, "backdoor")
            || (utils::contains(f, "postinstall") && utils::contains(f, ".js"))){
            hits.push_back(file);
        }
    }
    return dedupe(hits);
}

std::vector<std::string> GitScanner::match_remotes(const std::vector<std::string>& remotes){
    std::vector<std::string> hits;
    for(const auto& line : remotes){
        if(line.empty()) continue;
        if(utils::contains(line, WormIndicators::worm_name_capitalized) || utils::contains(line, WormIndicators::worm_name))
            hits.push_back(line);
    }
    return hits;
}

bool GitScanner::has_unsigned(const std::vector<std::string>& status_lines){
    for(const auto& line : status_lines){
        std::string s = utils::trim(line);
        if(s.empty()) continue;
        std::size_t sp = s.find_last_of(" \t");
        std::string marker = sp == std::string::npos ? s : s.substr(sp + 1);
        if(marker == "N" || marker == "U") return true;
    }
    return false;
}

void GitScanner::apply_signature_policy(std::vector<GitIssue>& issues, bool unsigned_seen){
    if(!unsigned_seen || issues.empty()) return;
    for(const auto& issue : issues){
        if(issue.kind == GitIssueKind::UnsignedCommits) return;
    }
    issues.push_back(GitIssue{GitIssueKind::UnsignedCommits, {}, "Unsigned commits detected alongside other suspicious indicators"});
}

GitScanner::Outcome GitScanner::inspect(GitQueries& git, const Config& cfg, Logger& log){
    Outcome out;
    std::string errors;
    auto note_error = [&](const QueryResult& qr){
        if(qr.ok) return;
        log.debug("git query failed: " + qr.error);
        if(!errors.empty()) errors += "; ";
        errors += qr.error;
    };
    try {
        QueryResult branches = git.branches();
        note_error(branches);
        auto hit_branches = match_branches(branches.lines);
        if(!hit_branches.empty())
            out.issues.push_back(GitIssue{GitIssueKind::SuspiciousBranch, std::move(hit_branches), "Branch names match Shai-Hulud patterns"});

        QueryResult subjects = git.recent_subjects(cfg.commit_depth);
        note_error(subjects);
        auto hit_commits = match_commits(subjects.lines);
        if(!hit_commits.empty())
            out.issues.push_back(GitIssue{GitIssueKind::SuspiciousCommits, std::move(hit_commits), "Commit messages contain suspicious patterns"});

        QueryResult files = git.files_since(cfg.files_since);
        note_error(files);
        auto hit_files = match_files(files.lines);
        if(!hit_files.empty())
            out.issues.push_back(GitIssue{GitIssueKind::SuspiciousFilesAdded, std::move(hit_files), "Suspicious files added in recent commits"});

        QueryResult remotes = git.remotes();
        note_error(remotes);
        auto hit_remotes = match_remotes(remotes.lines);
        if(!hit_remotes.empty())
            out.issues.push_back(GitIssue{GitIssueKind::SuspiciousRemote, std::move(hit_remotes), "Git remotes point to suspicious repositories"});

        QueryResult signatures = git.signature_status(cfg.signature_depth);
        note_error(signatures);
        apply_signature_policy(out.issues, has_unsigned(signatures.lines));
    } catch(const std::exception& ex) {
        if(!errors.empty()) errors += "; ";
        errors += ex.what();
    }
    if(!errors.empty()) out.error = errors;
    return out;
}

void GitScanner::scan(ScanContext& context){
    const std::string& root = context.config.target_dir;
    std::error_code ec;
    if(!fs::exists(fs::path(root) / ".git", ec)){
        context.log.debug("no .git under " + root);
        return;
    }
    std::unique_ptr<GitQueries> git = factory_(root);
    Outcome outcome = inspect(*git, context.config, context.log);
    for(auto& issue : outcome.issues){
        context.log.info(std::string("git: ") + issue.reason);
        context.report.add_finding(name(), std::move(issue));
    }
    if(outcome.error){
        context.log.warn("git scan degraded: " + *outcome.error);
        context.report.add_warning(name(), WarnCode::GitQueryFailed, *outcome.error);
        context.report.set_git_error(*outcome.error);
    }
}

}
