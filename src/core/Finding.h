#pragma once
#include <string>
#include <vector>
#include <variant>

namespace hulud_scan {

// Known-bad (name, version) pair surfaced from the manifest or a lockfile.
struct BadDependency {
    std::string name;
    std::string version;
};

inline bool operator==(const BadDependency& a, const BadDependency& b){ return a.name == b.name && a.version == b.version; }

enum class FileFindingKind { BundleHash, IOC, LeakedToken };

struct SuspiciousFile {
    FileFindingKind kind = FileFindingKind::IOC;
    std::string path;
    std::string detail; // digest for BundleHash, matched text for IOC
    std::string package_name; // declared name of the owning manifest, "unknown" if absent
};

struct SuspiciousScript {
    std::string path;
    std::string script; // postinstall command text
};

enum class GitIssueKind { SuspiciousBranch, SuspiciousCommits, SuspiciousFilesAdded, SuspiciousRemote, UnsignedCommits };

struct GitIssue {
    GitIssueKind kind = GitIssueKind::SuspiciousBranch;
    std::vector<std::string> payload; // branches, commit lines, file names or remote lines
    std::string reason;
};

using Finding = std::variant<BadDependency, SuspiciousFile, SuspiciousScript, GitIssue>;

const char* to_string(FileFindingKind kind);
const char* to_string(GitIssueKind kind);

}
