#pragma once
#include "JSONWriter.h"
#include <string>

namespace hulud_scan {

class Report;
struct Config;

// Plain-text summary for terminals, one "[TAG] message" line per fact.
class TextWriter {
public:
    std::string write(const Report& report, const Config& cfg, const RunInfo& info) const;
};

}
