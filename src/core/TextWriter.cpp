#include "TextWriter.h"
#include "Config.h"
#include "Report.h"
#include <iomanip>
#include <sstream>

namespace hulud_scan {

namespace {

std::string join(const std::vector<std::string>& items, const char* sep){
    std::string out;
    for(size_t i=0;i<items.size();++i){ if(i) out += sep; out += items[i]; }
    return out;
}

std::string git_status(const Report& report, const Config& cfg){
    if(cfg.skip_git) return "skipped";
    if(report.git_error()) return "error";
    return report.git_issues().empty() ? "clean" : "threats found";
}

}

std::string TextWriter::write(const Report& report, const Config& cfg, const RunInfo& info) const {
    std::ostringstream os;
    const auto total = report.total_issues();
    double seconds = cfg.zero_time ? 0.0 : static_cast<double>(report.duration().count()) / 1000.0;

    os << "Target: " << info.scanned_dir << "\n";
    if(!report.bad_dependencies().empty())
        os << "[WRN] Found " << report.bad_dependencies().size() << " compromised packages\n";
    if(!report.suspicious_files().empty() || !report.suspicious_scripts().empty())
        os << "[WRN] Found " << report.suspicious_files().size() + report.suspicious_scripts().size() << " suspicious files\n";
    if(!report.git_issues().empty())
        os << "[WRN] Found " << report.git_issues().size() << " git-based threats\n";

    for(const auto& d : report.bad_dependencies())
        os << "[ERR] - " << d.name << "@" << d.version << "\n";
    if(!report.bad_dependencies().empty()){
        std::vector<std::string> names;
        for(const auto& d : report.bad_dependencies()) names.push_back(d.name);
        os << "[INF] Run: npm uninstall " << join(names, " ") << "\n";
    }
    for(const auto& f : report.suspicious_files())
        os << "[WRN] Suspicious file (" << to_string(f.kind) << "): " << f.path << "\n";
    for(const auto& s : report.suspicious_scripts())
        os << "[WRN] Suspicious postinstall: " << s.path << ": " << s.script << "\n";
    for(const auto& g : report.git_issues()){
        os << "[WRN] Git threat: " << to_string(g.kind) << "\n";
        if(!g.reason.empty()) os << "  " << g.reason << "\n";
    }
    if(report.git_error()) os << "[WRN] Git inspection incomplete: " << *report.git_error() << "\n";
    for(const auto& w : report.warnings())
        os << "[WRN] " << w.scanner << ": " << to_string(w.code) << ": " << w.detail << "\n";
    for(const auto& e : report.errors())
        os << "[ERR] " << e.first << ": " << e.second << "\n";

    os << "[INF] Scanned " << report.total_scanned() << " dependencies in "
       << std::fixed << std::setprecision(1) << seconds << "s\n";
    os << "[INF] Security status: " << (total == 0 ? "SECURE" : "THREATS DETECTED") << "\n";
    os << "[INF] Critical threats: " << report.bad_dependencies().size() << "\n";
    os << "[INF] File threats: " << report.suspicious_files().size() + report.suspicious_scripts().size() << "\n";
    os << "[INF] Git scan result: " << git_status(report, cfg) << "\n";
    if(total == 0) os << "[INF] No security threats detected\n";
    else os << "[ERR] " << total << " security issues require attention\n";
    return os.str();
}

}
