#pragma once
#include "../core/Scanner.h"
#include "../core/Finding.h"
#include "LockfileResolver.h"
#include <cstddef>
#include <string>
#include <vector>

namespace hulud_scan {

class ThreatList;

struct MatchResult {
    std::vector<BadDependency> bad_dependencies;
    std::size_t total_scanned = 0;
};

// dependencies + devDependencies of a package.json, in document order; a devDependencies
// entry replaces the version of a same-named dependencies entry. Throws on malformed JSON.
std::vector<Dependency> parse_manifest(const std::string& text);

// Direct (normalized manifest versions) and transitive (exact lockfile versions) matching.
// total_scanned = max(manifest entries, distinct lockfile names).
MatchResult match_threats(const std::vector<Dependency>& manifest, const std::vector<Dependency>& lockfile, const ThreatList& threats);

class DependencyScanner : public Scanner {
public:
    std::string name() const override { return "dependencies"; }
    std::string description() const override { return "Matches manifest and lockfile dependencies against the threat list"; }
    void scan(ScanContext& context) override;
};

}
