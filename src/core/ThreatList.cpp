#include "ThreatList.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hulud_scan {

ThreatList ThreatList::from_json(const std::string& text){
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch(const nlohmann::json::parse_error& ex) {
        throw std::runtime_error(std::string("threat list is not valid JSON: ") + ex.what());
    }
    if(!doc.is_object()) throw std::runtime_error("threat list must be a JSON object");
    ThreatList list;
    for(auto it = doc.begin(); it != doc.end(); ++it){
        const std::string& key = it.key();
        if(!key.empty() && key[0] == '_'){
            list.metadata_[key] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
            continue;
        }
        if(!it.value().is_array()) continue; // not a package entry
        auto& versions = list.packages_[key];
        for(const auto& v : it.value()){
            if(v.is_string()) versions.insert(v.get<std::string>());
        }
    }
    return list;
}

ThreatList ThreatList::from_file(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) throw std::runtime_error("cannot open threat list: " + path);
    std::ostringstream ss; ss << in.rdbuf();
    return from_json(ss.str());
}

void ThreatList::add(const std::string& name, const std::string& version){
    if(!name.empty() && name[0] == '_') return;
    packages_[name].insert(version);
}

bool ThreatList::is_bad(const std::string& name, const std::string& version) const {
    auto it = packages_.find(name);
    return it != packages_.end() && it->second.count(version) > 0;
}

std::size_t ThreatList::version_count() const {
    std::size_t n = 0;
    for(const auto& kv : packages_) n += kv.second.size();
    return n;
}

}
