#include "ScanSession.h"
#include "Config.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "ProjectDiscovery.h"
#include "Report.h"
#include "ScanContext.h"
#include "ScannerRegistry.h"
#include "TextWriter.h"
#include "ThreatList.h"
#include <filesystem>
#include <ostream>

namespace hulud_scan {

int ScanSession::scan_project(const std::string& dir, std::ostream& out){
    Config project_cfg = cfg_;
    project_cfg.target_dir = dir;

    RunInfo info;
    std::error_code ec;
    auto abs = std::filesystem::absolute(dir, ec);
    info.scanned_dir = ec ? dir : abs.lexically_normal().string();
    info.threat_packages = threats_.package_count();

    ScannerRegistry registry;
    registry.register_all_default(project_cfg, git_factory_);
    Report report;
    ScanContext context(project_cfg, report, log_, threats_);
    registry.run_all(context);

    if(project_cfg.text) out << TextWriter().write(report, project_cfg, info);
    else out << JSONWriter().write(report, project_cfg, info);

    if(project_cfg.fail_on_count > 0 && report.total_issues() >= static_cast<size_t>(project_cfg.fail_on_count)) return 1;
    return 0;
}

int ScanSession::run(std::ostream& out){
    if(!cfg_.recursive) return scan_project(cfg_.target_dir, out);

    auto roots = find_project_roots(cfg_.target_dir, cfg_.max_depth);
    if(roots.empty()){
        log_.warn("No directories with package-lock.json found under " + cfg_.target_dir);
        return 0;
    }
    for(size_t i = 0; i < roots.size(); ++i){
        log_.info("[" + std::to_string(i + 1) + "/" + std::to_string(roots.size()) + "] Scanning " + roots[i]);
        int rc = scan_project(roots[i], out);
        if(rc != 0){
            log_.error("Stopping: " + roots[i] + " exited with code " + std::to_string(rc));
            return rc;
        }
    }
    log_.info("All " + std::to_string(roots.size()) + " projects scanned");
    return 0;
}

}
