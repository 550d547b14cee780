#pragma once
#include "Finding.h"
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hulud_scan {

// Non-security collection issues (unreadable or malformed inputs)
enum class WarnCode { Generic, ManifestParseError, LockfileParseError, PackageJsonParseError, FileUnreadable, GitQueryFailed };

const char* to_string(WarnCode code);

struct Warning {
    std::string scanner;
    WarnCode code = WarnCode::Generic;
    std::string detail;
};

struct ScannerTiming {
    std::string scanner_name;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
};

// Aggregated result of one scan invocation. Every finding kind is produced by a single
// scanner, so per-kind ordering is stable even when scanners run concurrently.
class Report {
public:
    void start_scanner(const std::string& name);
    void end_scanner(const std::string& name);

    void add_finding(const std::string& scanner, Finding finding);
    void set_total_scanned(std::size_t n);
    void set_git_error(std::string message);
    void add_warning(const std::string& scanner, WarnCode code, const std::string& detail);
    void add_error(const std::string& scanner, const std::string& message);

    const std::vector<BadDependency>& bad_dependencies() const { return bad_deps_; }
    const std::vector<SuspiciousFile>& suspicious_files() const { return files_; }
    const std::vector<SuspiciousScript>& suspicious_scripts() const { return scripts_; }
    const std::vector<GitIssue>& git_issues() const { return git_issues_; }
    std::size_t total_scanned() const { return total_scanned_; }
    const std::optional<std::string>& git_error() const { return git_error_; }
    const std::vector<ScannerTiming>& timings() const { return timings_; }
    const std::vector<Warning>& warnings() const { return warnings_; }
    const std::vector<std::pair<std::string,std::string>>& errors() const { return errors_; }

    std::size_t total_issues() const;
    std::chrono::milliseconds duration() const;
private:
    std::vector<BadDependency> bad_deps_;
    std::vector<SuspiciousFile> files_;
    std::vector<SuspiciousScript> scripts_;
    std::vector<GitIssue> git_issues_;
    std::size_t total_scanned_ = 0;
    std::optional<std::string> git_error_;
    std::vector<ScannerTiming> timings_;
    std::vector<Warning> warnings_;
    std::vector<std::pair<std::string,std::string>> errors_; // (scanner, message)
    mutable std::mutex mutex_;
};

}
