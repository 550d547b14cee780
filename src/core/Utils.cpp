#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <openssl/evp.h>

namespace hulud_scan {
namespace utils {

std::optional<std::string> read_file(const std::string& path, std::size_t max_bytes){
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::nullopt;
    std::string out;
    char buf[8192];
    while(in){
        std::size_t want = sizeof(buf);
        if(max_bytes && out.size() + want > max_bytes) want = max_bytes - out.size();
        if(want == 0) break;
        in.read(buf, static_cast<std::streamsize>(want));
        std::streamsize got = in.gcount();
        if(got <= 0) break;
        out.append(buf, static_cast<std::size_t>(got));
    }
    return out;
}

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while(std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::vector<std::string> split_lines(const std::string& text){
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while(pos < text.size()){
        std::size_t nl = text.find('\n', pos);
        if(nl == std::string::npos){ lines.push_back(text.substr(pos)); break; }
        std::string line = text.substr(pos, nl - pos);
        if(!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        pos = nl + 1;
    }
    return lines;
}

std::string trim(const std::string& s){
    std::size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains(const std::string& haystack, const std::string& needle){
    return haystack.find(needle) != std::string::npos;
}

std::optional<std::string> sha256_file(const std::string& path){
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if(fd == -1) return std::nullopt;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(!ctx){ close(fd); return std::nullopt; }
    if(EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1){
        EVP_MD_CTX_free(ctx);
        close(fd);
        return std::nullopt;
    }

    char buffer[8192];
    ssize_t bytes_read;
    bool ok = true;
    while((bytes_read = read(fd, buffer, sizeof(buffer))) > 0){
        if(EVP_DigestUpdate(ctx, buffer, static_cast<size_t>(bytes_read)) != 1){ ok = false; break; }
    }
    if(bytes_read < 0) ok = false;
    close(fd);

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdlen = 0;
    if(!ok || EVP_DigestFinal_ex(ctx, md, &mdlen) != 1 || mdlen != 32){
        EVP_MD_CTX_free(ctx);
        return std::nullopt;
    }
    EVP_MD_CTX_free(ctx);

    static const char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(64);
    for(unsigned i = 0; i < mdlen; ++i){
        hex.push_back(hex_chars[md[i] >> 4]);
        hex.push_back(hex_chars[md[i] & 0xF]);
    }
    return hex;
}

CommandResult run_capture(const std::vector<std::string>& argv, std::size_t max_output){
    CommandResult result;
    if(argv.empty()) return result;
    // Child argv and descriptors are set up before fork; the child may not allocate.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for(const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
    int fds[2];
    if(pipe2(fds, O_CLOEXEC) != 0){
        if(devnull >= 0) close(devnull);
        return result;
    }

    pid_t pid = fork();
    if(pid < 0){
        close(fds[0]); close(fds[1]);
        if(devnull >= 0) close(devnull);
        return result;
    }
    if(pid == 0){
        // Child: stdout -> pipe, stderr -> /dev/null
        dup2(fds[1], STDOUT_FILENO);
        if(devnull >= 0) dup2(devnull, STDERR_FILENO);
        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    if(devnull >= 0) close(devnull);
    close(fds[1]);
    result.started = true;
    char buf[4096];
    ssize_t n;
    while((n = read(fds[0], buf, sizeof(buf))) > 0){
        if(result.out.size() < max_output) result.out.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    if(waitpid(pid, &status, 0) < 0) return result;
    if(WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    if(result.exit_code == 127) result.started = false;
    return result;
}

} // namespace utils
} // namespace hulud_scan
