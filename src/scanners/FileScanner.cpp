#include "FileScanner.h"
#include "Indicators.h"
#include "../core/ScanContext.h"
#include "../core/Utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;
namespace hulud_scan {

namespace {

const std::regex& postinstall_re(){
    static const std::regex re(WormIndicators::postinstall_pattern, std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& ioc_re(){
    static const std::regex re(WormIndicators::ioc_pattern, std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& token_re(){
    static const std::regex re(WormIndicators::token_pattern, std::regex::ECMAScript);
    return re;
}

struct Candidates {
    std::vector<fs::path> bundles;
    std::vector<fs::path> manifests;
};

Candidates collect_candidates(const fs::path& root, ScanContext& context, const std::string& scanner_name){
    Candidates c;
    std::error_code ec;
    auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
    if(ec){
        context.log.warn("cannot walk " + root.string() + ": " + ec.message());
        context.report.add_warning(scanner_name, WarnCode::FileUnreadable, root.string());
        return c;
    }
    for(; it != fs::recursive_directory_iterator(); it.increment(ec)){
        if(ec){
            context.log.debug("walk stopped at " + root.string() + ": " + ec.message());
            break;
        }
        std::error_code fec;
        if(!it->is_regular_file(fec)) continue;
        const auto filename = it->path().filename().string();
        if(filename == WormIndicators::bundle_file) c.bundles.push_back(it->path());
        else if(filename == "package.json") c.manifests.push_back(it->path());
    }
    // directory iteration order is unspecified
    std::sort(c.bundles.begin(), c.bundles.end());
    std::sort(c.manifests.begin(), c.manifests.end());
    return c;
}

std::string declared_name(const nlohmann::ordered_json& pkg){
    auto it = pkg.find("name");
    if(it != pkg.end() && it->is_string()) return it->get<std::string>();
    return "unknown";
}

std::string postinstall_of(const nlohmann::ordered_json& pkg){
    auto scripts = pkg.find("scripts");
    if(scripts == pkg.end() || !scripts->is_object()) return {};
    auto post = scripts->find("postinstall");
    if(post == scripts->end() || !post->is_string()) return {};
    return post->get<std::string>();
}

} // namespace

std::optional<SuspiciousScript> FileScanner::check_postinstall(const std::string& path, const std::string& postinstall){
    if(postinstall.empty() || !std::regex_search(postinstall, postinstall_re())) return std::nullopt;
    return SuspiciousScript{path, postinstall};
}

std::optional<SuspiciousFile> FileScanner::check_ioc(const std::string& path, const std::string& content, const std::string& package_name){
    std::smatch m;
    if(!std::regex_search(content, m, ioc_re())) return std::nullopt;
    return SuspiciousFile{FileFindingKind::IOC, path, m.str(0), package_name};
}

bool FileScanner::looks_like_documentation(const std::string& content){
    return (utils::contains(content, "description") && utils::contains(content, "example"))
        || utils::contains(content, "readme")
        || utils::contains(content, "documentation");
}

std::optional<SuspiciousFile> FileScanner::check_token(const std::string& path, const std::string& content, const std::string& package_name){
    if(!std::regex_search(content, token_re())) return std::nullopt;
    if(looks_like_documentation(content)) return std::nullopt;
    return SuspiciousFile{FileFindingKind::LeakedToken, path, "Potential GitHub token detected", package_name};
}

void FileScanner::scan(ScanContext& context){
    const auto& cfg = context.config;
    fs::path modules = fs::path(cfg.target_dir) / "node_modules";
    std::error_code ec;
    if(!fs::is_directory(modules, ec)){
        context.log.debug("no node_modules under " + cfg.target_dir);
        return;
    }

    Candidates candidates = collect_candidates(modules, context, name());
    context.log.debug("files: " + std::to_string(candidates.bundles.size()) + " bundle.js, " + std::to_string(candidates.manifests.size()) + " package.json");

    for(const auto& path : candidates.bundles){
        std::error_code sec;
        auto size = fs::file_size(path, sec);
        if(sec) continue;
        if(size > cfg.max_file_size){
            context.log.debug("skipping oversized " + path.string() + " (" + std::to_string(size) + " bytes)");
            continue;
        }
        auto digest = utils::sha256_file(path.string());
        if(!digest){
            context.log.debug("cannot hash " + path.string());
            continue;
        }
        if(*digest == bundle_digest_){
            context.report.add_finding(name(), SuspiciousFile{FileFindingKind::BundleHash, path.string(), *digest, ""});
        }
    }

    for(const auto& path : candidates.manifests){
        auto text = utils::read_file(path.string());
        if(!text) continue;
        nlohmann::ordered_json pkg;
        try {
            pkg = nlohmann::ordered_json::parse(*text);
        } catch(const nlohmann::json::parse_error& ex) {
            context.log.warn("skipping unparsable " + path.string() + ": " + ex.what());
            context.report.add_warning(name(), WarnCode::PackageJsonParseError, path.string());
            continue;
        }
        if(!pkg.is_object()) continue;

        const std::string p = path.string();
        if(auto script = check_postinstall(p, postinstall_of(pkg))) context.report.add_finding(name(), std::move(*script));

        const std::string content = pkg.dump();
        const std::string pkg_name = declared_name(pkg);
        if(auto ioc = check_ioc(p, content, pkg_name)) context.report.add_finding(name(), std::move(*ioc));
        if(auto token = check_token(p, content, pkg_name)) context.report.add_finding(name(), std::move(*token));
    }
}

}
