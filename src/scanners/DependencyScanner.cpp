#include "DependencyScanner.h"
#include "VersionNormalizer.h"
#include "../core/ScanContext.h"
#include "../core/Utils.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <unordered_set>

namespace fs = std::filesystem;
namespace hulud_scan {

std::vector<Dependency> parse_manifest(const std::string& text){
    nlohmann::ordered_json pkg = nlohmann::ordered_json::parse(text);
    if(!pkg.is_object()) throw std::runtime_error("package.json root is not an object");
    std::vector<Dependency> deps;
    for(const char* section : {"dependencies", "devDependencies"}){
        auto it = pkg.find(section);
        if(it == pkg.end() || !it->is_object()) continue;
        for(auto d = it->begin(); d != it->end(); ++d){
            if(!d.value().is_string()) continue;
            std::string version = d.value().get<std::string>();
            auto existing = std::find_if(deps.begin(), deps.end(), [&](const Dependency& x){ return x.name == d.key(); });
            if(existing != deps.end()) existing->version = version;
            else deps.push_back(Dependency{d.key(), version, DependencySource::Manifest});
        }
    }
    return deps;
}

MatchResult match_threats(const std::vector<Dependency>& manifest, const std::vector<Dependency>& lockfile, const ThreatList& threats){
    MatchResult result;
    auto emit = [&](const std::string& name, const std::string& version){
        BadDependency bad{name, version};
        if(std::find(result.bad_dependencies.begin(), result.bad_dependencies.end(), bad) == result.bad_dependencies.end())
            result.bad_dependencies.push_back(std::move(bad));
    };
    for(const auto& dep : manifest){
        std::string version = normalize_version(dep.version);
        if(threats.is_bad(dep.name, version)) emit(dep.name, version);
    }
    // Every lockfile entry, whether or not the manifest names it: transitive compromises
    std::unordered_set<std::string> lock_names;
    for(const auto& dep : lockfile){
        lock_names.insert(dep.name);
        if(threats.is_bad(dep.name, dep.version)) emit(dep.name, dep.version);
    }
    result.total_scanned = std::max(manifest.size(), lock_names.size());
    return result;
}

void DependencyScanner::scan(ScanContext& context){
    const std::string& root = context.config.target_dir;
    std::vector<Dependency> manifest;
    fs::path manifest_path = fs::path(root) / "package.json";
    std::error_code ec;
    if(!fs::is_regular_file(manifest_path, ec)){
        context.log.debug("No package.json found in " + root + "; checking lockfiles only");
    } else if(auto text = utils::read_file(manifest_path.string())) {
        try {
            manifest = parse_manifest(*text);
        } catch(const std::exception& ex) {
            context.log.warn("failed to parse " + manifest_path.string() + ": " + ex.what());
            context.report.add_warning(name(), WarnCode::ManifestParseError, manifest_path.string());
        }
    } else {
        context.log.warn("cannot read " + manifest_path.string());
        context.report.add_warning(name(), WarnCode::FileUnreadable, manifest_path.string());
    }

    LockfileResolver resolver(context.log, &context.report, name());
    std::vector<Dependency> lockfile = resolver.resolve(root);

    MatchResult result = match_threats(manifest, lockfile, context.threats);
    context.log.debug("dependencies: " + std::to_string(manifest.size()) + " direct, " + std::to_string(lockfile.size()) + " lockfile entries, " + std::to_string(result.bad_dependencies.size()) + " bad");
    for(auto& bad : result.bad_dependencies) context.report.add_finding(name(), std::move(bad));
    context.report.set_total_scanned(result.total_scanned);
}

}
