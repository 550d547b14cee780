#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace hulud_scan {
namespace utils {

// Read up to max_bytes (0 = whole file). nullopt if the file cannot be opened.
std::optional<std::string> read_file(const std::string& path, std::size_t max_bytes = 0);
std::vector<std::string> read_lines(const std::string& path);
std::vector<std::string> split_lines(const std::string& text);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
bool contains(const std::string& haystack, const std::string& needle);

// Hex SHA-256 of the file contents; nullopt when unreadable or hashing fails.
std::optional<std::string> sha256_file(const std::string& path);

struct CommandResult {
    bool started = false; // fork/exec succeeded
    int exit_code = -1;
    std::string out; // captured stdout
};

// fork/exec argv[0] with argv (no shell), stdout captured, stderr discarded.
CommandResult run_capture(const std::vector<std::string>& argv, std::size_t max_output = 8 * 1024 * 1024);

} // namespace utils
} // namespace hulud_scan
