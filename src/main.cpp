#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/Logging.h"
#include "core/ScanSession.h"
#include "core/ThreatList.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace hulud_scan;

int main(int argc, char** argv) {
    Logger& log = Logger::instance();
    log.set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    ConfigValidator validator;
    if(!validator.validate(cfg)) return 2;
    if(cfg.verbose) log.set_level(LogLevel::Debug);
    if(cfg.quiet) log.set_level(LogLevel::Error);

    ThreatList threats;
    try {
        threats = cfg.badlist_json.empty() ? ThreatList::from_file(cfg.badlist_file) : ThreatList::from_json(cfg.badlist_json);
    } catch(const std::runtime_error& ex) {
        log.error(std::string("Failed to load threat list: ") + ex.what());
        return 2;
    }
    log.info("Loaded threat list (" + std::to_string(threats.package_count()) + " packages)");

    ScanSession session(cfg, threats, log);
    int rc = 0;
    if(cfg.output_file.empty()) {
        rc = session.run(std::cout);
    } else {
        std::ofstream ofs(cfg.output_file);
        if(!ofs) { log.error("Cannot open output file: " + cfg.output_file); return 2; }
        rc = session.run(ofs);
        ofs.flush();
        if(!ofs) { log.error("Failed writing output file: " + cfg.output_file); return 2; }
    }
    return rc;
}
