#include "ScannerRegistry.h"
#include "ScanContext.h"
#include "../scanners/DependencyScanner.h"
#include "../scanners/FileScanner.h"
#include "../scanners/GitScanner.h"
#include <algorithm>
#include <exception>
#include <thread>
#include <utility>

namespace hulud_scan {

void ScannerRegistry::register_scanner(ScannerPtr scanner) {
    scanners_.push_back(std::move(scanner));
}

void ScannerRegistry::register_all_default(const Config& cfg, GitQueriesFactory git_factory) {
    if(!cfg.skip_deps) register_scanner(std::make_unique<DependencyScanner>());
    if(!cfg.skip_files) register_scanner(std::make_unique<FileScanner>());
    if(!cfg.skip_git) {
        if(git_factory) register_scanner(std::make_unique<GitScanner>(std::move(git_factory)));
        else register_scanner(std::make_unique<GitScanner>());
    }
}

std::vector<std::string> ScannerRegistry::names() const {
    std::vector<std::string> out;
    for(const auto& s : scanners_) out.push_back(s->name());
    return out;
}

bool ScannerRegistry::is_enabled(const Config& cfg, const std::string& name) const {
    if(!cfg.enable_scanners.empty()) {
        bool found = std::find(cfg.enable_scanners.begin(), cfg.enable_scanners.end(), name) != cfg.enable_scanners.end();
        if(!found) return false;
    }
    if(!cfg.disable_scanners.empty()) {
        if(std::find(cfg.disable_scanners.begin(), cfg.disable_scanners.end(), name) != cfg.disable_scanners.end()) return false;
    }
    return true;
}

void ScannerRegistry::run_one(Scanner& s, ScanContext& context) {
    context.log.debug("Starting scanner: " + s.name());
    context.report.start_scanner(s.name());
    try {
        s.scan(context);
    } catch(const std::exception& ex) {
        context.log.error(s.name() + " scanner failed: " + ex.what());
        context.report.add_error(s.name(), ex.what());
    }
    context.report.end_scanner(s.name());
    context.log.debug("Finished scanner: " + s.name());
}

void ScannerRegistry::run_all(ScanContext& context) {
    const auto& cfg = context.config;
    std::vector<Scanner*> active;
    for(auto& s : scanners_) {
        if(is_enabled(cfg, s->name())) active.push_back(s.get());
    }
    if(!cfg.parallel || active.size() < 2) {
        for(auto* s : active) run_one(*s, context);
        return;
    }
    // Each scanner owns its finding kinds, so concurrent runs merge deterministically.
    std::vector<std::thread> threads;
    threads.reserve(active.size());
    for(auto* s : active) threads.emplace_back([this, s, &context]{ run_one(*s, context); });
    for(auto& t : threads) t.join();
}

}
