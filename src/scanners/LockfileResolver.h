#pragma once
#include <string>
#include <vector>
#include <utility>

namespace hulud_scan {

class Logger;
class Report;

enum class DependencySource { Manifest, Lockfile };

struct Dependency {
    std::string name;
    std::string version;
    DependencySource source = DependencySource::Lockfile;
};

// Identity is (name, version); the source does not take part.
inline bool operator==(const Dependency& a, const Dependency& b){ return a.name == b.name && a.version == b.version; }

// Collects (name, version) pairs from package-lock.json, yarn.lock and pnpm-lock.yaml.
class LockfileResolver {
public:
    explicit LockfileResolver(Logger& log, Report* report = nullptr, std::string scanner_name = "dependencies")
        : log_(log), report_(report), scanner_name_(std::move(scanner_name)) {}

    // Concatenates every lockfile present under root (npm, yarn, pnpm order). A missing
    // lockfile contributes nothing; a malformed one is logged and contributes nothing.
    std::vector<Dependency> resolve(const std::string& root) const;

    // Format parsers. npm and pnpm throw on malformed documents; yarn skips bad blocks.
    static std::vector<Dependency> parse_npm_lock(const std::string& text);
    static std::vector<Dependency> parse_yarn_lock(const std::string& text);
    static std::vector<Dependency> parse_pnpm_lock(const std::string& text);

    // "/@scope/name/1.0.0_hash", "/name@1.0.0(peer@2)" -> name, version. False if unrecognised.
    static bool split_pnpm_key(const std::string& key, std::string& name, std::string& version);
private:
    Logger& log_;
    Report* report_;
    std::string scanner_name_;
};

}
