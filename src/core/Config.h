#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace hulud_scan {

struct Config {
    std::string target_dir = "."; // project root to scan
    std::vector<std::string> enable_scanners; // if non-empty, only these
    std::vector<std::string> disable_scanners;
    std::string output_file; // empty = stdout
    // Threat list source: a JSON file, or inline JSON (tests, pipelines)
    std::string badlist_file;
    std::string badlist_json;
    bool pretty = false;
    bool compact = false; // wins over pretty when both are set
    bool text = false; // human-readable summary instead of JSON
    bool skip_git = false;
    bool skip_files = false;
    bool skip_deps = false;
    bool parallel = false; // run scanners on separate threads
    // Multi-project mode: every directory holding a package-lock.json, node_modules excluded
    bool recursive = false;
    int max_depth = 2;
    bool verbose = false;
    bool quiet = false;
    // File scanner limits
    std::uint64_t max_file_size = 10ull * 1024 * 1024; // bundle.js larger than this is not hashed
    // Git history depths
    int commit_depth = 20;
    std::string files_since = "30 days ago";
    int signature_depth = 10;
    bool zero_time = false; // zero timestamps/durations for reproducible output
    int fail_on_count = 1; // exit non-zero if total issues >= this (0 disables)
};

}
