#include "LockfileResolver.h"
#include "../core/Logging.h"
#include "../core/Report.h"
#include "../core/Utils.h"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;
namespace hulud_scan {

namespace {

const char* kModulesMarker = "node_modules/";

std::string version_or_default(const nlohmann::ordered_json& entry){
    if(entry.is_object()){
        auto it = entry.find("version");
        if(it != entry.end() && it->is_string()) return it->get<std::string>();
    }
    return "0.0.0";
}

// npm v6 "dependencies" tree, walked with an explicit stack (pre-order, document order).
void collect_legacy_tree(const nlohmann::ordered_json& root, std::vector<Dependency>& out){
    using Node = std::pair<std::string, const nlohmann::ordered_json*>;
    std::vector<Node> stack;
    auto push_children = [&](const nlohmann::ordered_json& deps){
        if(!deps.is_object()) return;
        std::vector<Node> children;
        for(auto it = deps.begin(); it != deps.end(); ++it) children.emplace_back(it.key(), &it.value());
        for(auto rit = children.rbegin(); rit != children.rend(); ++rit) stack.push_back(*rit);
    };
    push_children(root);
    while(!stack.empty()){
        Node node = stack.back();
        stack.pop_back();
        out.push_back(Dependency{node.first, version_or_default(*node.second), DependencySource::Lockfile});
        if(node.second->is_object()){
            auto nested = node.second->find("dependencies");
            if(nested != node.second->end()) push_children(*nested);
        }
    }
}

// Package name from a yarn block header such as `"@babel/core@^7.0.0", "@babel/core@^7.1.0":`
std::string yarn_header_name(const std::string& header){
    std::string h = utils::trim(header);
    if(!h.empty() && h.back() == ':') h.pop_back();
    std::size_t comma = h.find(',');
    if(comma != std::string::npos) h = h.substr(0, comma);
    h = utils::trim(h);
    if(h.size() >= 2 && h.front() == '"' && h.back() == '"') h = h.substr(1, h.size() - 2);
    else if(!h.empty() && h.front() == '"') h = h.substr(1);
    std::size_t at = h.find('@', 1);
    if(at == std::string::npos || at == 0) return {};
    std::string name = h.substr(0, at);
    for(char c : name){ if(c == ' ' || c == '\t' || c == '"') return {}; }
    return name;
}

// `version "1.2.3"` (v1) or `version: 1.2.3` (berry); empty if the line is not a version line.
std::string yarn_version_value(const std::string& trimmed){
    static const std::string key = "version";
    if(trimmed.compare(0, key.size(), key) != 0 || trimmed.size() == key.size()) return {};
    char sep = trimmed[key.size()];
    if(sep != ' ' && sep != ':' && sep != '\t') return {};
    std::string value = utils::trim(trimmed.substr(key.size() + (sep == ':' ? 1 : 0)));
    if(value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
        value = value.substr(1, value.size() - 2);
    return value;
}

std::size_t indent_of(const std::string& line){
    std::size_t n = 0;
    while(n < line.size() && (line[n] == ' ' || line[n] == '\t')) ++n;
    return n;
}

} // namespace

std::vector<Dependency> LockfileResolver::parse_npm_lock(const std::string& text){
    nlohmann::ordered_json doc = nlohmann::ordered_json::parse(text); // throws parse_error
    if(!doc.is_object()) throw std::runtime_error("package-lock.json root is not an object");
    std::vector<Dependency> out;
    auto packages = doc.find("packages");
    if(packages != doc.end() && packages->is_object()){
        for(auto it = packages->begin(); it != packages->end(); ++it){
            const std::string& path = it.key();
            if(path.empty()) continue; // root project
            std::size_t marker = path.rfind(kModulesMarker);
            std::string name = marker == std::string::npos ? path : path.substr(marker + std::char_traits<char>::length(kModulesMarker));
            if(name.empty()) continue;
            out.push_back(Dependency{name, version_or_default(it.value()), DependencySource::Lockfile});
        }
        return out;
    }
    auto legacy = doc.find("dependencies");
    if(legacy != doc.end()) collect_legacy_tree(*legacy, out);
    return out;
}

std::vector<Dependency> LockfileResolver::parse_yarn_lock(const std::string& text){
    std::vector<Dependency> out;
    std::string current;          // name of the open block, empty when none
    std::size_t child_indent = 0; // indentation of the block's direct keys
    bool have_version = false;
    for(const auto& line : utils::split_lines(text)){
        std::string trimmed = utils::trim(line);
        if(trimmed.empty() || trimmed[0] == '#') continue;
        std::size_t indent = indent_of(line);
        if(indent == 0){
            current = trimmed.back() == ':' ? yarn_header_name(trimmed) : std::string();
            child_indent = 0;
            have_version = false;
            continue;
        }
        if(current.empty() || have_version) continue;
        if(child_indent == 0) child_indent = indent;
        if(indent != child_indent) continue;
        std::string version = yarn_version_value(trimmed);
        if(version.empty()) continue;
        out.push_back(Dependency{current, version, DependencySource::Lockfile});
        have_version = true;
    }
    return out;
}

bool LockfileResolver::split_pnpm_key(const std::string& key, std::string& name, std::string& version){
    std::string k = key;
    if(!k.empty() && k[0] == '/') k = k.substr(1);
    std::size_t paren = k.find('(');
    if(paren != std::string::npos) k = k.substr(0, paren);
    std::size_t slash = k.rfind('/');
    std::string last = slash == std::string::npos ? k : k.substr(slash + 1);
    std::string prefix = slash == std::string::npos ? std::string() : k.substr(0, slash);
    std::size_t at = last.find('@', 1);
    std::size_t underscore = last.find('_');
    // v5 "name/1.0.0_peer@2.0.0": the '@' belongs to the peer suffix
    bool path_form = !prefix.empty() && (at == std::string::npos ||
        (underscore < at && std::isdigit(static_cast<unsigned char>(last[0]))));
    if(path_form){
        name = prefix;
        version = last;
    } else if(at != std::string::npos){
        name = prefix.empty() ? last.substr(0, at) : prefix + "/" + last.substr(0, at);
        version = last.substr(at + 1);
    } else {
        return false;
    }
    std::size_t cut = version.find('_');
    if(cut != std::string::npos) version = version.substr(0, cut);
    return !name.empty() && !version.empty();
}

std::vector<Dependency> LockfileResolver::parse_pnpm_lock(const std::string& text){
    YAML::Node doc = YAML::Load(text); // throws YAML::Exception
    std::vector<Dependency> out;
    if(!doc.IsMap()) return out;
    YAML::Node packages = doc["packages"];
    if(!packages || !packages.IsMap()) return out;
    for(auto it = packages.begin(); it != packages.end(); ++it){
        std::string name, version;
        if(!split_pnpm_key(it->first.as<std::string>(), name, version)) continue;
        out.push_back(Dependency{name, version, DependencySource::Lockfile});
    }
    return out;
}

std::vector<Dependency> LockfileResolver::resolve(const std::string& root) const {
    struct Format {
        const char* file;
        std::function<std::vector<Dependency>(const std::string&)> parse;
    };
    static const Format formats[] = {
        {"package-lock.json", &LockfileResolver::parse_npm_lock},
        {"yarn.lock", &LockfileResolver::parse_yarn_lock},
        {"pnpm-lock.yaml", &LockfileResolver::parse_pnpm_lock},
    };
    std::vector<Dependency> all;
    for(const auto& fmt : formats){
        fs::path path = fs::path(root) / fmt.file;
        std::error_code ec;
        if(!fs::is_regular_file(path, ec)){
            log_.trace(std::string("lockfile not present: ") + fmt.file);
            continue;
        }
        auto text = utils::read_file(path.string());
        if(!text){
            log_.warn("cannot read lockfile " + path.string());
            if(report_) report_->add_warning(scanner_name_, WarnCode::FileUnreadable, path.string());
            continue;
        }
        try {
            auto deps = fmt.parse(*text);
            log_.debug(std::string(fmt.file) + ": " + std::to_string(deps.size()) + " entries");
            all.insert(all.end(), std::make_move_iterator(deps.begin()), std::make_move_iterator(deps.end()));
        } catch(const nlohmann::json::exception& ex) {
            log_.warn("failed to parse " + path.string() + ": " + ex.what());
            if(report_) report_->add_warning(scanner_name_, WarnCode::LockfileParseError, path.string());
        } catch(const YAML::Exception& ex) {
            log_.warn("failed to parse " + path.string() + ": " + ex.what());
            if(report_) report_->add_warning(scanner_name_, WarnCode::LockfileParseError, path.string());
        } catch(const std::runtime_error& ex) {
            log_.warn("failed to parse " + path.string() + ": " + ex.what());
            if(report_) report_->add_warning(scanner_name_, WarnCode::LockfileParseError, path.string());
        }
    }
    return all;
}

}
