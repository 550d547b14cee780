#include "ConfigValidator.h"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace hulud_scan {

namespace {
const char* const known_scanners[] = {"dependencies", "files", "git"};

bool is_known_scanner(const std::string& name){
    return std::find(std::begin(known_scanners), std::end(known_scanners), name) != std::end(known_scanners);
}
}

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }
    if(cfg.verbose && cfg.quiet) {
        std::cerr << "--verbose and --quiet are mutually exclusive\n";
        return false;
    }

    if(cfg.target_dir.empty()) {
        std::cerr << "Target directory must not be empty\n";
        return false;
    }
    std::error_code ec;
    if(!std::filesystem::is_directory(cfg.target_dir, ec)) {
        std::cerr << "Target directory does not exist: " << cfg.target_dir << "\n";
        return false;
    }

    if(cfg.badlist_file.empty() && cfg.badlist_json.empty()) {
        std::cerr << "A threat list is required (--badlist FILE or --badlist-json JSON)\n";
        return false;
    }
    if(!cfg.badlist_file.empty() && !cfg.badlist_json.empty()) {
        std::cerr << "--badlist and --badlist-json are mutually exclusive\n";
        return false;
    }

    if(cfg.commit_depth < 0 || cfg.signature_depth < 0) {
        std::cerr << "History depths must not be negative\n";
        return false;
    }
    if(cfg.max_depth < 0) {
        std::cerr << "--max-depth must not be negative\n";
        return false;
    }
    if(cfg.fail_on_count < 0) {
        std::cerr << "--fail-on-count must not be negative\n";
        return false;
    }
    if(cfg.files_since.empty()) {
        std::cerr << "--files-since must not be empty\n";
        return false;
    }

    return validate_scanner_names(cfg);
}

bool ConfigValidator::validate_scanner_names(const Config& cfg) {
    for(const auto& scanner : cfg.enable_scanners) {
        if(std::find(cfg.disable_scanners.begin(), cfg.disable_scanners.end(), scanner) != cfg.disable_scanners.end()) {
            std::cerr << "Cannot enable and disable the same scanner: " << scanner << "\n";
            return false;
        }
        if(!is_known_scanner(scanner)) {
            std::cerr << "Unknown scanner: " << scanner << "\n";
            return false;
        }
    }
    for(const auto& scanner : cfg.disable_scanners) {
        if(!is_known_scanner(scanner)) {
            std::cerr << "Unknown scanner: " << scanner << "\n";
            return false;
        }
    }
    return true;
}

}
