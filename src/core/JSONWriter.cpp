#include "JSONWriter.h"
#include "Config.h"
#include "JsonUtil.h"
#include "Report.h"
#include "BuildInfo.h"
#include <algorithm>
#include <chrono>
#include <map>
#include <sstream>
#include <vector>

namespace hulud_scan {
namespace {

struct CanonVal {
    enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
    std::map<std::string, CanonVal> obj;
    std::vector<CanonVal> arr;
    std::string str; // string contents or number token text
    CanonVal() = default;
    explicit CanonVal(Type t): type(t) {}
};

using jsonutil::escape;

CanonVal str_val(const std::string& s){ CanonVal v{CanonVal::T_STR}; v.str = s; return v; }
CanonVal num_val(long long n){ CanonVal v{CanonVal::T_NUM}; v.str = std::to_string(n); return v; }

CanonVal str_array(const std::vector<std::string>& items){
    CanonVal a{CanonVal::T_ARR};
    for(const auto& s : items) a.arr.push_back(str_val(s));
    return a;
}

void emit(const CanonVal& v, std::ostream& os, bool pretty, int depth){
    auto newline = [&](int d){ if(pretty){ os << '\n'; for(int i = 0; i < d; ++i) os << "  "; } };
    switch(v.type){
        case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; return;
        case CanonVal::T_NUM: os << v.str; return;
        case CanonVal::T_ARR: {
            os << '[';
            if(v.arr.empty()){ os << ']'; return; }
            for(std::size_t i = 0; i < v.arr.size(); ++i){
                if(i) os << ',';
                newline(depth + 1);
                emit(v.arr[i], os, pretty, depth + 1);
            }
            newline(depth);
            os << ']';
            return;
        }
        case CanonVal::T_OBJ: {
            os << '{';
            if(v.obj.empty()){ os << '}'; return; }
            bool first = true;
            for(const auto& kv : v.obj){
                if(!first) os << ',';
                first = false;
                newline(depth + 1);
                os << '"' << escape(kv.first) << "\":";
                if(pretty) os << ' ';
                emit(kv.second, os, pretty, depth + 1);
            }
            newline(depth);
            os << '}';
            return;
        }
    }
}

const char* git_payload_key(GitIssueKind kind){
    switch(kind){
        case GitIssueKind::SuspiciousBranch: return "branches";
        case GitIssueKind::SuspiciousCommits: return "commits";
        case GitIssueKind::SuspiciousFilesAdded: return "files";
        case GitIssueKind::SuspiciousRemote: return "remotes";
        case GitIssueKind::UnsignedCommits: return nullptr;
    }
    return nullptr;
}

CanonVal build_meta(const Config& cfg, const RunInfo& info, std::chrono::system_clock::time_point now){
    CanonVal meta{CanonVal::T_OBJ};
    meta.obj["tool"] = str_val("hulud-scan");
    meta.obj["toolVersion"] = str_val(buildinfo::APP_VERSION);
    meta.obj["scannedDir"] = str_val(info.scanned_dir);
    meta.obj["timestamp"] = str_val(cfg.zero_time ? std::string() : jsonutil::time_to_iso(now));
    meta.obj["threatListPackages"] = num_val(static_cast<long long>(info.threat_packages));
    return meta;
}

CanonVal build_bad_deps(const Report& report){
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& d : report.bad_dependencies()){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["name"] = str_val(d.name);
        o.obj["version"] = str_val(d.version);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_files(const Report& report){
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& f : report.suspicious_files()){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["type"] = str_val(to_string(f.kind));
        o.obj["path"] = str_val(f.path);
        if(f.kind == FileFindingKind::BundleHash){
            o.obj["hash"] = str_val(f.detail);
        } else {
            o.obj["details"] = str_val(f.detail);
            o.obj["packageName"] = str_val(f.package_name);
        }
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_scripts(const Report& report){
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& s : report.suspicious_scripts()){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["path"] = str_val(s.path);
        o.obj["script"] = str_val(s.script);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_git_issues(const Report& report){
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& g : report.git_issues()){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["type"] = str_val(to_string(g.kind));
        o.obj["reason"] = str_val(g.reason);
        if(const char* key = git_payload_key(g.kind)) o.obj[key] = str_array(g.payload);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_timings(const Report& report, bool zero_time){
    std::vector<ScannerTiming> timings = report.timings();
    std::sort(timings.begin(), timings.end(), [](const ScannerTiming& a, const ScannerTiming& b){ return a.scanner_name < b.scanner_name; });
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& t : timings){
        long long ms = 0;
        if(!zero_time && t.end_time >= t.start_time)
            ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.end_time - t.start_time).count();
        CanonVal o{CanonVal::T_OBJ};
        o.obj["scanner"] = str_val(t.scanner_name);
        o.obj["durationMs"] = num_val(ms);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_warnings(const Report& report){
    std::vector<Warning> warnings = report.warnings();
    // parallel runs interleave scanners; keep each scanner's own order
    std::stable_sort(warnings.begin(), warnings.end(), [](const Warning& a, const Warning& b){ return a.scanner < b.scanner; });
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& w : warnings){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["scanner"] = str_val(w.scanner);
        o.obj["code"] = str_val(to_string(w.code));
        o.obj["detail"] = str_val(w.detail);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_errors(const Report& report){
    auto errors = report.errors();
    std::stable_sort(errors.begin(), errors.end(), [](const auto& a, const auto& b){ return a.first < b.first; });
    CanonVal arr{CanonVal::T_ARR};
    for(const auto& e : errors){
        CanonVal o{CanonVal::T_OBJ};
        o.obj["scanner"] = str_val(e.first);
        o.obj["message"] = str_val(e.second);
        arr.arr.push_back(std::move(o));
    }
    return arr;
}

CanonVal build_summary(const Report& report){
    CanonVal o{CanonVal::T_OBJ};
    o.obj["badDeps"] = num_val(static_cast<long long>(report.bad_dependencies().size()));
    o.obj["suspiciousFiles"] = num_val(static_cast<long long>(report.suspicious_files().size()));
    o.obj["suspiciousScripts"] = num_val(static_cast<long long>(report.suspicious_scripts().size()));
    o.obj["gitIssues"] = num_val(static_cast<long long>(report.git_issues().size()));
    o.obj["warnings"] = num_val(static_cast<long long>(report.warnings().size()));
    o.obj["scannerErrors"] = num_val(static_cast<long long>(report.errors().size()));
    return o;
}

} // namespace

std::string JSONWriter::write(const Report& report, const Config& cfg, const RunInfo& info) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta(cfg, info, std::chrono::system_clock::now());
    root.obj["summary"] = build_summary(report);
    root.obj["scannedDir"] = str_val(info.scanned_dir);
    root.obj["badDeps"] = build_bad_deps(report);
    root.obj["suspiciousFiles"] = build_files(report);
    root.obj["suspiciousScripts"] = build_scripts(report);
    root.obj["gitIssues"] = build_git_issues(report);
    if(report.git_error()) root.obj["gitError"] = str_val(*report.git_error());
    root.obj["totalScanned"] = num_val(static_cast<long long>(report.total_scanned()));
    root.obj["totalIssues"] = num_val(static_cast<long long>(report.total_issues()));
    root.obj["scanDurationMs"] = num_val(cfg.zero_time ? 0 : static_cast<long long>(report.duration().count()));
    root.obj["timings"] = build_timings(report, cfg.zero_time);
    root.obj["collectionWarnings"] = build_warnings(report);
    root.obj["scannerErrors"] = build_errors(report);

    std::ostringstream os;
    emit(root, os, !cfg.compact, 0);
    os << '\n';
    return os.str();
}

}
