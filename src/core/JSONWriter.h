#pragma once
#include <cstddef>
#include <string>

namespace hulud_scan {

class Report;
struct Config;

// Metadata that does not live on the Report itself.
struct RunInfo {
    std::string scanned_dir;
    std::size_t threat_packages = 0;
};

class JSONWriter {
public:
    // Canonical (sorted-key) JSON; pretty unless cfg.compact. Time fields zeroed with cfg.zero_time.
    std::string write(const Report& report, const Config& cfg, const RunInfo& info) const;
};

}
