#pragma once
#include <cstddef>
#include <map>
#include <set>
#include <string>

namespace hulud_scan {

// Package name -> known-compromised exact versions. Keys starting with '_' are metadata.
class ThreatList {
public:
    ThreatList() = default;

    // Both throw std::runtime_error on unreadable input or a non-object document.
    static ThreatList from_json(const std::string& text);
    static ThreatList from_file(const std::string& path);

    void add(const std::string& name, const std::string& version);
    bool is_bad(const std::string& name, const std::string& version) const;
    bool contains(const std::string& name) const { return packages_.count(name) > 0; }

    std::size_t package_count() const { return packages_.size(); }
    std::size_t version_count() const;
    const std::map<std::string, std::string>& metadata() const { return metadata_; }
private:
    std::map<std::string, std::set<std::string>> packages_;
    std::map<std::string, std::string> metadata_;
};

}
