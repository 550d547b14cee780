#include "ProjectDiscovery.h"
#include <algorithm>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;
namespace hulud_scan {

std::vector<std::string> find_project_roots(const std::string& root, int max_depth){
    std::vector<std::string> out;
    std::vector<std::pair<fs::path, int>> stack{{fs::path(root), 0}};
    while(!stack.empty()){
        auto [dir, depth] = stack.back();
        stack.pop_back();
        std::error_code ec;
        if(fs::is_regular_file(dir / "package-lock.json", ec)) out.push_back(dir.string());
        if(depth >= max_depth) continue;
        std::vector<fs::path> children;
        fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if(ec) continue;
        for(; it != fs::directory_iterator(); it.increment(ec)){
            if(ec) break;
            const auto& entry = *it;
            std::error_code sec;
            if(entry.is_symlink(sec) || !entry.is_directory(sec)) continue;
            if(entry.path().filename() == "node_modules") continue;
            children.push_back(entry.path());
        }
        std::sort(children.begin(), children.end());
        for(auto c = children.rbegin(); c != children.rend(); ++c) stack.emplace_back(*c, depth + 1);
    }
    return out;
}

}
