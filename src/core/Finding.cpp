#include "Finding.h"

namespace hulud_scan {

const char* to_string(FileFindingKind kind){
    switch(kind){
        case FileFindingKind::BundleHash: return "bundle.js";
        case FileFindingKind::IOC: return "IOC";
        case FileFindingKind::LeakedToken: return "GitHub-Token";
    }
    return "unknown";
}

const char* to_string(GitIssueKind kind){
    switch(kind){
        case GitIssueKind::SuspiciousBranch: return "suspicious-branch";
        case GitIssueKind::SuspiciousCommits: return "suspicious-commits";
        case GitIssueKind::SuspiciousFilesAdded: return "suspicious-files-added";
        case GitIssueKind::SuspiciousRemote: return "suspicious-remote";
        case GitIssueKind::UnsignedCommits: return "unsigned-commits";
    }
    return "unknown";
}

}
