#include "scanners/LockfileResolver.h"
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    using hulud_scan::LockfileResolver;

    // yarn.lock parsing never throws
    LockfileResolver::parse_yarn_lock(input);
    try {
        LockfileResolver::parse_npm_lock(input);
    } catch(const nlohmann::json::exception&) {
        return 0; // rejected input
    } catch(const std::runtime_error&) {
        return 0;
    }
    try {
        LockfileResolver::parse_pnpm_lock(input);
    } catch(const YAML::Exception&) {
        return 0;
    } catch(const std::runtime_error&) {
        return 0;
    }
    return 0;
}
