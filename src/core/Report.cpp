#include "Report.h"
#include <algorithm>
#include <type_traits>

namespace hulud_scan {

const char* to_string(WarnCode code){
    switch(code){
        case WarnCode::Generic: return "generic";
        case WarnCode::ManifestParseError: return "manifest_parse_error";
        case WarnCode::LockfileParseError: return "lockfile_parse_error";
        case WarnCode::PackageJsonParseError: return "package_json_parse_error";
        case WarnCode::FileUnreadable: return "file_unreadable";
        case WarnCode::GitQueryFailed: return "git_query_failed";
    }
    return "generic";
}

void Report::start_scanner(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ScannerTiming t;
    t.scanner_name = name;
    t.start_time = std::chrono::system_clock::now();
    timings_.push_back(std::move(t));
}

void Report::end_scanner(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(timings_.begin(), timings_.end(), [&](auto& t){ return t.scanner_name == name; });
    if(it != timings_.end()) {
        it->end_time = std::chrono::system_clock::now();
    }
}

void Report::add_finding(const std::string&, Finding finding) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::visit([this](auto&& f){
        using T = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<T, BadDependency>) {
            if(std::find(bad_deps_.begin(), bad_deps_.end(), f) == bad_deps_.end()) bad_deps_.push_back(std::move(f));
        } else if constexpr (std::is_same_v<T, SuspiciousFile>) {
            files_.push_back(std::move(f));
        } else if constexpr (std::is_same_v<T, SuspiciousScript>) {
            scripts_.push_back(std::move(f));
        } else {
            git_issues_.push_back(std::move(f));
        }
    }, std::move(finding));
}

void Report::set_total_scanned(std::size_t n){
    std::lock_guard<std::mutex> lock(mutex_);
    total_scanned_ = n;
}

void Report::set_git_error(std::string message){
    std::lock_guard<std::mutex> lock(mutex_);
    git_error_ = std::move(message);
}

void Report::add_warning(const std::string& scanner, WarnCode code, const std::string& detail){
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back(Warning{scanner, code, detail});
}

void Report::add_error(const std::string& scanner, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.emplace_back(scanner, message);
}

std::size_t Report::total_issues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bad_deps_.size() + files_.size() + scripts_.size() + git_issues_.size();
}

std::chrono::milliseconds Report::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if(timings_.empty()) return std::chrono::milliseconds(0);
    auto earliest = timings_.front().start_time;
    auto latest = timings_.front().end_time;
    for(const auto& t : timings_){
        if(t.start_time < earliest) earliest = t.start_time;
        if(t.end_time > latest) latest = t.end_time;
    }
    if(latest < earliest) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(latest - earliest);
}

}
