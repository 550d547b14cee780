#pragma once
#include "../core/Scanner.h"
#include "../core/Finding.h"
#include "Indicators.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hulud_scan {

class FileScanner : public Scanner {
public:
    explicit FileScanner(std::string bundle_digest = WormIndicators::bundle_sha256)
        : bundle_digest_(std::move(bundle_digest)) {}

    std::string name() const override { return "files"; }
    std::string description() const override { return "Hashes bundle.js artifacts and inspects installed package manifests under node_modules"; }
    void scan(ScanContext& context) override;

    // Manifest checks for one installed package.json (already serialized as JSON text).
    // Exposed for tests; path is only copied into the findings.
    static std::optional<SuspiciousScript> check_postinstall(const std::string& path, const std::string& postinstall);
    static std::optional<SuspiciousFile> check_ioc(const std::string& path, const std::string& content, const std::string& package_name);
    static std::optional<SuspiciousFile> check_token(const std::string& path, const std::string& content, const std::string& package_name);
    // Heuristic: example tokens in README-like fields are not leaks
    static bool looks_like_documentation(const std::string& content);
private:
    std::string bundle_digest_; // lowercase hex SHA-256 of the worm payload
};

}
