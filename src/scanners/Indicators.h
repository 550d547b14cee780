#pragma once
#include <cstddef>

namespace hulud_scan {

// Shai-Hulud campaign indicators shared by the file and git scanners.
struct WormIndicators {
    static constexpr const char* bundle_file = "bundle.js";
    static constexpr const char* bundle_sha256 = "46faab8ab153fae6e80e7cca38eab363075bb524edd79e42269217a083628f09";
    static constexpr const char* worm_name = "shai-hulud";
    static constexpr const char* worm_name_capitalized = "Shai-Hulud";
    static constexpr const char* harvest_tool = "trufflehog";
    static constexpr const char* exfil_domain = "webhook.site";
    static constexpr const char* campaign_id = "bb8ca5f6-4175-45d2-b042-fc9ebb8170b7";

    // ECMAScript, matched case-insensitively
    static constexpr const char* postinstall_pattern = R"((node\s+bundle\.js|trufflehog|webhook\.site|exfiltrat))";
    static constexpr const char* ioc_pattern = R"((webhook\.site|bb8ca5f6-4175-45d2-b042-fc9ebb8170b7|shai-hulud|trufflehog))";
    static constexpr const char* token_pattern = R"(ghp_[a-zA-Z0-9]{36}|gho_[a-zA-Z0-9]{36})";

    static constexpr const char* commit_patterns[] = {
        "shai-hulud", R"(add.*bundle\.js)", "postinstall.*malicious", "trufflehog",
        R"(webhook\.site)", "exfiltrat", "malicious.*package", "backdoor"
    };
    static constexpr std::size_t commit_pattern_count = sizeof(commit_patterns) / sizeof(commit_patterns[0]);
};

}
