#pragma once
#include <string>

namespace hulud_scan {

// Strips every leading non-digit character ("^1.2.3" -> "1.2.3", "~0.4" -> "0.4").
// This is a textual heuristic, not range resolution: a two-bound range such as
// ">=1.0.0 <2.0.0" keeps its tail ("1.0.0 <2.0.0") and a tag like "latest" becomes "".
std::string normalize_version(const std::string& range);

}
