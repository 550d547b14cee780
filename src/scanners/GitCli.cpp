#include "GitQueries.h"
#include "../core/Utils.h"

namespace hulud_scan {

QueryResult GitCli::run(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {git_, "-C", repo_dir_};
    argv.insert(argv.end(), args.begin(), args.end());
    QueryResult qr;
    auto res = utils::run_capture(argv);
    std::string what = "git";
    for(const auto& a : args) what += " " + a;
    if(!res.started){
        qr.error = what + ": could not execute " + git_;
        return qr;
    }
    if(res.exit_code != 0){
        qr.error = what + ": exited with status " + std::to_string(res.exit_code);
        return qr;
    }
    qr.ok = true;
    for(auto& line : utils::split_lines(res.out)){
        if(!utils::trim(line).empty()) qr.lines.push_back(std::move(line));
    }
    return qr;
}

QueryResult GitCli::branches(){
    QueryResult qr = run({"branch", "-a"});
    for(auto& b : qr.lines){
        // "* main", "  feature/x", "  remotes/origin/HEAD -> origin/main"
        std::string s = utils::trim(b);
        if(!s.empty() && s[0] == '*') s = utils::trim(s.substr(1));
        b = s;
    }
    return qr;
}

QueryResult GitCli::recent_subjects(int count){
    return run({"log", "--oneline", "-" + std::to_string(count)});
}

QueryResult GitCli::files_since(const std::string& period){
    return run({"log", "--name-only", "--pretty=format:", "--since=" + period});
}

QueryResult GitCli::remotes(){
    return run({"remote", "-v"});
}

QueryResult GitCli::signature_status(int count){
    return run({"log", "--pretty=format:%H %G?", "-" + std::to_string(count)});
}

}
