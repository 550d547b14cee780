#pragma once
#include <string>
#include <vector>

namespace hulud_scan {

// Directories holding a package-lock.json, searched at most max_depth levels below root
// (root itself is depth 0). node_modules and symlinked directories are not entered.
// Pre-order with sibling names sorted; unreadable directories are skipped.
std::vector<std::string> find_project_roots(const std::string& root, int max_depth);

}
