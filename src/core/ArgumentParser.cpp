#include "ArgumentParser.h"
#include "Config.h"
#include "BuildInfo.h"
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

namespace hulud_scan {

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur;
    for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    if(!cur.empty()) out.push_back(cur);
    return out;
}

namespace {

bool parse_int(const std::string& v, const char* flag, long long& out){
    if(v.empty()){ std::cerr << "Invalid integer for " << flag << "\n"; return false; }
    errno = 0; char* end = nullptr;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if(errno != 0 || end == v.c_str() || *end != '\0'){
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        return false;
    }
    out = n;
    return true;
}

struct HelpLine { const char* name; const char* help; };

const std::vector<HelpLine>& help_lines(){
    static const std::vector<HelpLine> lines = {
        {"--dir, -d DIR", "Project directory to scan (default .)"},
        {"--badlist FILE", "Threat list JSON file (package -> versions)"},
        {"--badlist-json JSON", "Threat list given inline"},
        {"--output FILE", "Write the report to FILE (default stdout)"},
        {"--pretty", "Pretty-print JSON (default)"},
        {"--compact", "Minified JSON output"},
        {"--json", "JSON report (default)"},
        {"--text", "Human-readable summary instead of JSON"},
        {"--skip-deps", "Do not check dependencies"},
        {"--skip-files", "Do not scan node_modules"},
        {"--skip-git", "Do not inspect repository history"},
        {"--enable name[,name...]", "Only run specified scanners"},
        {"--disable name[,name...]", "Disable specified scanners"},
        {"--parallel", "Run scanners in parallel"},
        {"--recursive", "Scan every project with a package-lock.json below --dir"},
        {"--max-depth N", "Directory depth searched by --recursive (default 2)"},
        {"--max-file-size N", "Largest bundle.js to hash, in bytes"},
        {"--commit-depth N", "Commits whose subjects are inspected"},
        {"--files-since PERIOD", "History window for added files"},
        {"--signature-depth N", "Commits whose signatures are inspected"},
        {"--zero-time", "Zero timestamps and durations"},
        {"--fail-on-count N", "Exit 1 if total issues >= N (0 disables)"},
        {"--verbose, -v", "Debug logging"},
        {"--quiet, -q", "Errors only"},
        {"--version", "Print version & exit"},
        {"--help, -h", "Show this help"}
    };
    return lines;
}

}

std::vector<ArgumentParser::FlagSpec> ArgumentParser::build_specs(Config& cfg){
    auto set_int = [](const char* flag, int& dst){
        return [flag, &dst](const std::string& v){
            long long n = 0;
            if(!parse_int(v, flag, n)) return false;
            if(n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()){
                std::cerr << flag << " out of range: " << v << "\n";
                return false;
            }
            dst = static_cast<int>(n);
            return true;
        };
    };
    return {
        {"--dir", "-d", ArgKind::String, [&](const std::string& v){ cfg.target_dir = v; return true; }},
        {"--badlist", nullptr, ArgKind::String, [&](const std::string& v){ cfg.badlist_file = v; return true; }},
        {"--badlist-json", nullptr, ArgKind::String, [&](const std::string& v){ cfg.badlist_json = v; return true; }},
        {"--output", "-o", ArgKind::String, [&](const std::string& v){ cfg.output_file = v; return true; }},
        {"--pretty", nullptr, ArgKind::None, [&](const std::string&){ cfg.pretty = true; return true; }},
        {"--compact", nullptr, ArgKind::None, [&](const std::string&){ cfg.compact = true; return true; }},
        {"--json", nullptr, ArgKind::None, [&](const std::string&){ cfg.text = false; return true; }},
        {"--text", nullptr, ArgKind::None, [&](const std::string&){ cfg.text = true; return true; }},
        {"--skip-deps", nullptr, ArgKind::None, [&](const std::string&){ cfg.skip_deps = true; return true; }},
        {"--skip-files", nullptr, ArgKind::None, [&](const std::string&){ cfg.skip_files = true; return true; }},
        {"--skip-git", nullptr, ArgKind::None, [&](const std::string&){ cfg.skip_git = true; return true; }},
        {"--enable", nullptr, ArgKind::CSV, [&](const std::string& v){ cfg.enable_scanners = split_csv(v); return true; }},
        {"--disable", nullptr, ArgKind::CSV, [&](const std::string& v){ cfg.disable_scanners = split_csv(v); return true; }},
        {"--parallel", nullptr, ArgKind::None, [&](const std::string&){ cfg.parallel = true; return true; }},
        {"--recursive", nullptr, ArgKind::None, [&](const std::string&){ cfg.recursive = true; return true; }},
        {"--max-depth", nullptr, ArgKind::Int, set_int("--max-depth", cfg.max_depth)},
        {"--max-file-size", nullptr, ArgKind::Int, [&](const std::string& v){
            long long n = 0;
            if(!parse_int(v, "--max-file-size", n)) return false;
            if(n < 0){ std::cerr << "--max-file-size must not be negative\n"; return false; }
            cfg.max_file_size = static_cast<std::uint64_t>(n);
            return true; }},
        {"--commit-depth", nullptr, ArgKind::Int, set_int("--commit-depth", cfg.commit_depth)},
        {"--files-since", nullptr, ArgKind::String, [&](const std::string& v){ cfg.files_since = v; return true; }},
        {"--signature-depth", nullptr, ArgKind::Int, set_int("--signature-depth", cfg.signature_depth)},
        {"--zero-time", nullptr, ArgKind::None, [&](const std::string&){ cfg.zero_time = true; return true; }},
        {"--fail-on-count", nullptr, ArgKind::Int, set_int("--fail-on-count", cfg.fail_on_count)},
        {"--verbose", "-v", ArgKind::None, [&](const std::string&){ cfg.verbose = true; return true; }},
        {"--quiet", "-q", ArgKind::None, [&](const std::string&){ cfg.quiet = true; return true; }}
    };
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    auto specs = build_specs(cfg);
    auto find_spec = [&](const std::string& flag)->const FlagSpec*{
        for(const auto& s: specs){ if(flag==s.name || (s.alias && flag==s.alias)) return &s; }
        return nullptr;
    };
    for(int i=1;i<argc;++i){
        std::string a = argv[i];
        if(a=="--help" || a=="-h"){ print_help(std::cout); return false; }
        if(a=="--version"){ print_version(std::cout); return false; }
        // --flag=value form
        std::string val; bool inline_val = false;
        auto eq = a.find('=');
        if(a.rfind("--", 0)==0 && eq!=std::string::npos){ val = a.substr(eq+1); a = a.substr(0, eq); inline_val = true; }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        if(spec->kind == ArgKind::None){
            if(inline_val){ std::cerr << a << " takes no value\n"; exit_code_ = 2; return false; }
        } else if(!inline_val){
            if(i+1>=argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val)){ exit_code_ = 2; return false; }
    }
    return true;
}

void ArgumentParser::print_help(std::ostream& os) const {
    os << "hulud-scan [options]\n"
       << "Detects Shai-Hulud npm supply-chain compromise indicators in a project.\n\n";
    for(const auto& l : help_lines()){
        std::string name = l.name;
        os << "  " << name;
        if(name.size() < 26) for(size_t i=name.size(); i<26; ++i) os << ' '; else os << ' ';
        os << l.help << "\n";
    }
}

void ArgumentParser::print_version(std::ostream& os) const {
    os << "hulud-scan " << buildinfo::APP_VERSION
       << " (compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
       << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

}
