#pragma once
#include "Config.h"
#include <string>

namespace hulud_scan {

class ConfigValidator {
public:
    // Normalizes cfg in place and reports problems on stderr. False means a usage error.
    bool validate(Config& cfg);
private:
    bool validate_scanner_names(const Config& cfg);
};

}
