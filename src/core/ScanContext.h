#pragma once
#include "Config.h"
#include "Logging.h"
#include "Report.h"
#include "ThreatList.h"

namespace hulud_scan {

// Everything a scanner may read or write during one invocation.
struct ScanContext {
    const Config& config;
    Report& report;
    Logger& log;
    const ThreatList& threats;

    ScanContext(const Config& cfg, Report& rep, Logger& logger, const ThreatList& threat_list)
        : config(cfg), report(rep), log(logger), threats(threat_list) {}
};

}
